#pragma once

#include <onlyswap/schema/primitives.hpp>
#include <onlyswap/schema/transaction_event.hpp>
#include <onlyswap/schema/transaction_result.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace onlyswap::testing {

inline onlyswap::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = onlyswap::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Request id carried in the data of a successful router call.
inline onlyswap::schema::hash32_t result_id(
    const onlyswap::schema::transaction_result_t& result) {
  auto id = onlyswap::schema::hash32_t{};
  if (result.data.size() == id.size()) {
    std::copy(std::begin(result.data), std::end(result.data), std::begin(id));
  }
  return id;
}

inline bool has_event(const onlyswap::schema::transaction_result_t& result,
                      const std::string_view type) {
  return std::ranges::any_of(result.events, [&](const auto& event) {
    return event.type == type;
  });
}

inline std::optional<std::string> event_attribute(
    const onlyswap::schema::transaction_result_t& result,
    const std::string_view type,
    const std::string_view key) {
  for (const auto& event : result.events) {
    if (event.type != type) {
      continue;
    }
    for (const auto& attribute : event.attributes) {
      if (attribute.key == key) {
        return attribute.value;
      }
    }
  }
  return std::nullopt;
}

}  // namespace onlyswap::testing
