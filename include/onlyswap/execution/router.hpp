#pragma once

#include <onlyswap/config/router_config.hpp>
#include <onlyswap/execution/fees.hpp>
#include <onlyswap/execution/ledger.hpp>
#include <onlyswap/execution/router_logic.hpp>
#include <onlyswap/execution/swap_request_registry.hpp>
#include <onlyswap/execution/upgrade_controller.hpp>
#include <onlyswap/schema/primitives.hpp>
#include <onlyswap/schema/relay_tokens.hpp>
#include <onlyswap/schema/request_cross_chain_swap.hpp>
#include <onlyswap/schema/router_state.hpp>
#include <onlyswap/schema/scheduled_upgrade.hpp>
#include <onlyswap/schema/swap_request.hpp>
#include <onlyswap/schema/swap_request_receipt.hpp>
#include <onlyswap/schema/swap_request_status.hpp>
#include <onlyswap/schema/transaction_result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace onlyswap::execution {

/// A message for the signing committee and the digest it signs.
struct authorization_message final {
  onlyswap::schema::bytes_t message;
  onlyswap::schema::hash32_t digest;
};

/// Stable identity of a settlement router on one ledger.
///
/// State lives in the ledger under the router's address; the code handling
/// swap operations is the `router_logic` whose implementation id is recorded
/// in that state, resolved on every call. Each mutating operation is one
/// atomic ledger call: a non-zero result code leaves no state change and no
/// event behind.
class router final {
 public:
  router(ledger& chain,
         onlyswap::schema::account_id_t address,
         onlyswap::config::router_config config = {});

  router(const router&) = delete;
  router& operator=(const router&) = delete;

  const onlyswap::schema::account_id_t& address() const { return address_; }
  ledger& chain() { return chain_; }
  const onlyswap::config::router_config& config() const { return config_; }

  /// One-time setup. `owner` receives the admin role; fee rate, upgrade
  /// delay and cancellation window come from the router config.
  onlyswap::schema::transaction_result_t initialize(
      const call_context& context,
      const onlyswap::schema::account_id_t& owner,
      const onlyswap::schema::account_id_t& swap_request_verifier,
      const onlyswap::schema::account_id_t& contract_upgrade_verifier,
      const onlyswap::schema::implementation_id_t& implementation);

  // Swap settlement.

  onlyswap::schema::transaction_result_t request_cross_chain_swap(
      const call_context& context,
      const onlyswap::schema::request_cross_chain_swap_t& swap);

  onlyswap::schema::transaction_result_t request_cross_chain_swap_permit2(
      const call_context& context,
      const onlyswap::schema::request_cross_chain_swap_permit2_t& swap);

  onlyswap::schema::transaction_result_t update_solver_fees_if_unfulfilled(
      const call_context& context,
      const onlyswap::schema::hash32_t& request_id,
      const onlyswap::schema::amount_t& new_fee);

  onlyswap::schema::transaction_result_t relay_tokens(
      const call_context& context,
      const onlyswap::schema::relay_tokens_t& relay);

  onlyswap::schema::transaction_result_t relay_tokens_permit2(
      const call_context& context,
      const onlyswap::schema::relay_tokens_permit2_t& relay);

  onlyswap::schema::transaction_result_t rebalance_solver(
      const call_context& context,
      const onlyswap::schema::account_id_t& solver,
      const onlyswap::schema::hash32_t& request_id,
      const onlyswap::schema::bytes_t& signature);

  onlyswap::schema::transaction_result_t stage_swap_request_cancellation(
      const call_context& context,
      const onlyswap::schema::hash32_t& request_id);

  onlyswap::schema::transaction_result_t cancel_swap_request_and_refund(
      const call_context& context,
      const onlyswap::schema::hash32_t& request_id,
      const onlyswap::schema::account_id_t& refund_recipient);

  // Scheduled upgrades and signature-gated governance.

  onlyswap::schema::transaction_result_t schedule_upgrade(
      const call_context& context,
      const onlyswap::schema::implementation_id_t& new_implementation,
      const onlyswap::schema::bytes_t& init_payload,
      onlyswap::schema::timestamp_seconds_t upgrade_time,
      const onlyswap::schema::bytes_t& signature);

  onlyswap::schema::transaction_result_t cancel_upgrade(
      const call_context& context,
      const onlyswap::schema::bytes_t& signature);

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

  // Admin operations; `access_denied` unless the caller holds the admin role.

  onlyswap::schema::transaction_result_t set_verification_fee_bps(
      const call_context& context,
      uint32_t fee_bps);

  onlyswap::schema::transaction_result_t permit_destination_chain_id(
      const call_context& context,
      onlyswap::schema::chain_id_t chain_id);

  onlyswap::schema::transaction_result_t block_destination_chain_id(
      const call_context& context,
      onlyswap::schema::chain_id_t chain_id);

  onlyswap::schema::transaction_result_t set_token_mapping(
      const call_context& context,
      onlyswap::schema::chain_id_t dst_chain_id,
      const onlyswap::schema::token_id_t& dst_token,
      const onlyswap::schema::token_id_t& src_token);

  onlyswap::schema::transaction_result_t remove_token_mapping(
      const call_context& context,
      onlyswap::schema::chain_id_t dst_chain_id,
      const onlyswap::schema::token_id_t& dst_token,
      const onlyswap::schema::token_id_t& src_token);

  onlyswap::schema::transaction_result_t withdraw_verification_fee(
      const call_context& context,
      const onlyswap::schema::token_id_t& token,
      const onlyswap::schema::account_id_t& to);

  /// The zero address disables hooks.
  onlyswap::schema::transaction_result_t set_hook_executor(
      const call_context& context,
      const onlyswap::schema::account_id_t& hook_executor);

  onlyswap::schema::transaction_result_t set_permit2_relayer(
      const call_context& context,
      const onlyswap::schema::account_id_t& permit2_relayer);

  onlyswap::schema::transaction_result_t grant_admin_role(
      const call_context& context,
      const onlyswap::schema::account_id_t& account);

  onlyswap::schema::transaction_result_t revoke_admin_role(
      const call_context& context,
      const onlyswap::schema::account_id_t& account);

  // Queries.

  /// Version of the active implementation, or the configured version before
  /// initialization.
  std::string version() const;
  bool initialized() const;

  std::optional<onlyswap::schema::swap_request_t> swap_request_parameters(
      const onlyswap::schema::hash32_t& request_id) const;
  std::optional<onlyswap::schema::swap_request_receipt_t> swap_request_receipt(
      const onlyswap::schema::hash32_t& request_id) const;
  onlyswap::schema::swap_request_status_t swap_request_status(
      const onlyswap::schema::hash32_t& request_id) const;

  onlyswap::schema::amount_t total_verification_fee_balance(
      const onlyswap::schema::token_id_t& token) const;
  fee_split verification_fee_amount(
      const onlyswap::schema::amount_t& amount) const;
  uint32_t verification_fee_bps() const;
  onlyswap::schema::amount_t solver_refund_amount(
      const onlyswap::schema::hash32_t& request_id) const;

  std::vector<onlyswap::schema::hash32_t> fulfilled_transfers() const;
  std::vector<onlyswap::schema::hash32_t> fulfilled_solver_refunds() const;
  std::vector<onlyswap::schema::hash32_t> unfulfilled_solver_refunds() const;
  std::vector<onlyswap::schema::hash32_t> cancelled_swap_requests() const;

  /// 0 when no cancellation was staged.
  onlyswap::schema::timestamp_seconds_t swap_request_cancellation_initiated_at(
      const onlyswap::schema::hash32_t& request_id) const;

  bool is_destination_chain_id_permitted(
      onlyswap::schema::chain_id_t chain_id) const;
  bool is_dst_token_mapped(const onlyswap::schema::token_id_t& src_token,
                           onlyswap::schema::chain_id_t dst_chain_id,
                           const onlyswap::schema::token_id_t& dst_token) const;
  std::vector<onlyswap::schema::token_id_t> token_mapping(
      const onlyswap::schema::token_id_t& src_token,
      onlyswap::schema::chain_id_t dst_chain_id) const;

  uint64_t current_swap_request_nonce() const;
  uint64_t current_nonce() const;
  onlyswap::schema::account_id_t swap_request_verifier() const;
  onlyswap::schema::account_id_t contract_upgrade_verifier() const;
  onlyswap::schema::account_id_t hook_executor() const;
  onlyswap::schema::account_id_t permit2_relayer() const;
  onlyswap::schema::implementation_id_t implementation() const;
  std::optional<onlyswap::schema::scheduled_upgrade_t> scheduled_upgrade()
      const;
  onlyswap::schema::duration_seconds_t minimum_contract_upgrade_delay() const;
  onlyswap::schema::duration_seconds_t cancellation_window() const;
  bool has_admin_role(const onlyswap::schema::account_id_t& account) const;

  // Messages the signing committee signs.

  /// Rebalance authorization for `solver`; std::nullopt for unknown ids and
  /// the zero solver.
  std::optional<authorization_message> swap_request_parameters_to_bytes(
      const onlyswap::schema::hash32_t& request_id,
      const onlyswap::schema::account_id_t& solver) const;

  authorization_message contract_upgrade_params_to_bytes(
      const onlyswap::schema::implementation_id_t& new_implementation,
      const onlyswap::schema::bytes_t& init_payload,
      onlyswap::schema::timestamp_seconds_t upgrade_time) const;

  /// Cancellation of the pending upgrade; std::nullopt when none is pending.
  std::optional<authorization_message> cancel_upgrade_params_to_bytes() const;

  /// `action` is kChangeSwapRequestVerifierAction or
  /// kChangeContractUpgradeVerifierAction.
  authorization_message verifier_update_params_to_bytes(
      std::string_view action,
      const onlyswap::schema::account_id_t& verifier) const;

  authorization_message minimum_contract_upgrade_delay_params_to_bytes(
      onlyswap::schema::duration_seconds_t delay) const;

  authorization_message cancellation_window_params_to_bytes(
      onlyswap::schema::duration_seconds_t window) const;

 private:
  template <typename Fn>
  onlyswap::schema::transaction_result_t dispatch(std::string_view operation,
                                                  const call_context& context,
                                                  Fn&& fn);

  template <typename Fn>
  onlyswap::schema::transaction_result_t administer(
      std::string_view operation,
      const call_context& context,
      Fn&& fn);

  template <typename Fn>
  onlyswap::schema::transaction_result_t govern(std::string_view operation,
                                                Fn&& fn);

  onlyswap::schema::transaction_result_t finish(
      std::string_view operation,
      onlyswap::schema::transaction_result_t result) const;

  onlyswap::schema::router_state_t current_state() const;

  ledger& chain_;
  onlyswap::schema::account_id_t address_;
  onlyswap::config::router_config config_;
  swap_request_registry registry_;
  upgrade_controller upgrades_;
};

}  // namespace onlyswap::execution
