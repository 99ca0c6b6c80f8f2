#pragma once

#include <onlyswap/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: swap request status.
// Source-ledger membership of a request id; exactly one value holds at a
// time and fulfilled/cancelled are terminal.
namespace onlyswap::schema {

enum class swap_request_status_t : uint8_t {
  unknown = 0,
  unfulfilled = 1,
  fulfilled = 2,
  cancelled = 3
};

inline constexpr auto kSwapRequestStatusMappings =
    std::array{enum_mapping_t<swap_request_status_t>{
                   "unknown", swap_request_status_t::unknown},
               enum_mapping_t<swap_request_status_t>{
                   "unfulfilled", swap_request_status_t::unfulfilled},
               enum_mapping_t<swap_request_status_t>{
                   "fulfilled", swap_request_status_t::fulfilled},
               enum_mapping_t<swap_request_status_t>{
                   "cancelled", swap_request_status_t::cancelled}};

template <>
inline std::optional<swap_request_status_t>
try_from_string<swap_request_status_t>(const std::string_view value) {
  return from_string(value, kSwapRequestStatusMappings);
}

inline constexpr std::string_view to_string(const swap_request_status_t value) {
  return to_string(value, kSwapRequestStatusMappings).value_or("unknown");
}

}  // namespace onlyswap::schema
