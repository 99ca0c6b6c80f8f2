#pragma once

#include <onlyswap/schema/primitives.hpp>
#include <onlyswap/schema/transaction_error_code.hpp>
#include <onlyswap/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace onlyswap::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  uint64_t gas_used{};
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

inline bool succeeded(const transaction_result_t& result) {
  return result.code == 0;
}

inline transaction_result_t make_error_result(
    const transaction_error_code code,
    std::string log) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::string{to_string(code)};
  result.codespace = std::string{error_codespace(code)};
  return result;
}

inline bool has_error(const transaction_result_t& result,
                      const transaction_error_code code) {
  return result.code == static_cast<uint32_t>(code);
}

}  // namespace onlyswap::schema
