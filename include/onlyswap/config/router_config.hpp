#pragma once

#include <onlyswap/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace onlyswap::config {

/// Deployment parameters of a router.
struct router_config final {
  std::string version{"1.0.0"};
  uint32_t verification_fee_bps{500};
  uint32_t max_fee_bps{5000};
  onlyswap::schema::duration_seconds_t minimum_contract_upgrade_delay{
      2 * onlyswap::schema::kSecondsPerDay};
  onlyswap::schema::duration_seconds_t cancellation_window{
      onlyswap::schema::kSecondsPerDay};
};

/// Reason `config` cannot initialize a router, if any.
std::optional<std::string> validate(const router_config& config);

}  // namespace onlyswap::config
