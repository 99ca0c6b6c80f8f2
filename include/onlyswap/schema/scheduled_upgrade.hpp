#pragma once
#include <onlyswap/schema/primitives.hpp>

// Schema type: scheduled upgrade.
// The single pending code swap of a router, executable at or after
// `upgrade_time`.
namespace onlyswap::schema {

template <uint16_t Version>
struct scheduled_upgrade;

template <>
struct scheduled_upgrade<1> final {
  implementation_id_t implementation;
  bytes_t init_payload;
  timestamp_seconds_t upgrade_time{};
};

using scheduled_upgrade_t = scheduled_upgrade<1>;

}  // namespace onlyswap::schema
