#pragma once
#include <onlyswap/schema/primitives.hpp>
#include <onlyswap/schema/scheduled_upgrade.hpp>
#include <optional>

// Schema type: router state.
// Configuration and counters of one router identity. The active
// implementation id selects the code that handles every call.
namespace onlyswap::schema {

template <uint16_t Version>
struct router_state;

template <>
struct router_state<1> final {
  implementation_id_t implementation;
  account_id_t swap_request_verifier;
  account_id_t contract_upgrade_verifier;
  account_id_t hook_executor;
  account_id_t permit2_relayer;
  uint32_t verification_fee_bps{};
  duration_seconds_t cancellation_window{};
  uint64_t current_swap_request_nonce{};
  duration_seconds_t minimum_contract_upgrade_delay{};
  uint64_t current_nonce{};
  std::optional<scheduled_upgrade_t> scheduled_upgrade;
};

using router_state_t = router_state<1>;

}  // namespace onlyswap::schema
