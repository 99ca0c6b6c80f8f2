#pragma once

#include <onlyswap/execution/ledger.hpp>
#include <onlyswap/execution/messages.hpp>
#include <onlyswap/execution/swap_request_registry.hpp>
#include <onlyswap/schema/primitives.hpp>
#include <onlyswap/schema/router_state.hpp>
#include <onlyswap/schema/transaction_result.hpp>
#include <string_view>

namespace onlyswap::execution {

inline constexpr onlyswap::schema::duration_seconds_t
    kMinimumContractUpgradeDelayFloor = 2 * onlyswap::schema::kSecondsPerDay;
inline constexpr onlyswap::schema::duration_seconds_t
    kCancellationWindowFloor = onlyswap::schema::kSecondsPerDay;

/// Governance of a router through the contract upgrade verifier.
///
/// Idle -> Scheduled via `schedule_upgrade`, back to Idle via
/// `cancel_upgrade` (before the scheduled time) or `execute_upgrade` (at or
/// after it). Every signed action consumes `current_nonce + 1`, so no
/// signature is accepted twice. Callers run each operation inside one
/// ledger call; a failure leaves the nonce untouched.
class upgrade_controller final {
 public:
  upgrade_controller(ledger& chain, swap_request_registry& registry);

  onlyswap::schema::transaction_result_t schedule_upgrade(
      const call_context& context,
      const onlyswap::schema::implementation_id_t& new_implementation,
      const onlyswap::schema::bytes_t& init_payload,
      onlyswap::schema::timestamp_seconds_t upgrade_time,
      const onlyswap::schema::bytes_t& signature);

  onlyswap::schema::transaction_result_t cancel_upgrade(
      const call_context& context,
      const onlyswap::schema::bytes_t& signature);

  /// Swap the active implementation and run its `on_upgrade`. The pending
  /// upgrade is cleared before the new code runs.
  onlyswap::schema::transaction_result_t execute_upgrade(
      const call_context& context);

  onlyswap::schema::transaction_result_t set_swap_request_verifier(
      const call_context& context,
      const onlyswap::schema::account_id_t& verifier,
      const onlyswap::schema::bytes_t& signature);

  onlyswap::schema::transaction_result_t set_contract_upgrade_verifier(
      const call_context& context,
      const onlyswap::schema::account_id_t& verifier,
      const onlyswap::schema::bytes_t& signature);

  onlyswap::schema::transaction_result_t set_minimum_contract_upgrade_delay(
      const call_context& context,
      onlyswap::schema::duration_seconds_t delay,
      const onlyswap::schema::bytes_t& signature);

  onlyswap::schema::transaction_result_t set_cancellation_window(
      const call_context& context,
      onlyswap::schema::duration_seconds_t window,
      const onlyswap::schema::bytes_t& signature);

  /// Message for scheduling `new_implementation` at the current nonce.
  onlyswap::schema::bytes_t schedule_upgrade_message(
      const onlyswap::schema::implementation_id_t& new_implementation,
      const onlyswap::schema::bytes_t& init_payload,
      onlyswap::schema::timestamp_seconds_t upgrade_time) const;

  /// Message for cancelling the pending upgrade; empty when none is pending.
  onlyswap::schema::bytes_t cancel_upgrade_message() const;

  onlyswap::schema::bytes_t verifier_update_message(
      std::string_view action,
      const onlyswap::schema::account_id_t& verifier) const;

  onlyswap::schema::bytes_t duration_update_message(
      std::string_view action,
      onlyswap::schema::duration_seconds_t duration) const;

 private:
  /// Check `message` against the upgrade verifier and consume the nonce in
  /// `router_state`.
  onlyswap::schema::transaction_result_t authorize(
      onlyswap::schema::router_state_t& router_state,
      const onlyswap::schema::bytes_t& message,
      const onlyswap::schema::bytes_t& signature) const;

  governance_scope scope() const;

  onlyswap::schema::transaction_result_t update_verifier(
      const call_context& context,
      std::string_view action,
      const onlyswap::schema::account_id_t& verifier,
      const onlyswap::schema::bytes_t& signature);

  ledger& chain_;
  swap_request_registry& registry_;
};

}  // namespace onlyswap::execution
