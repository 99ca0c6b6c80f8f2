#pragma once

#include <onlyswap/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction event.
// Append-only log entry; the sole channel through which solvers and the
// signing committee learn about new work.
namespace onlyswap::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint64_t sequence{};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

}  // namespace onlyswap::schema
