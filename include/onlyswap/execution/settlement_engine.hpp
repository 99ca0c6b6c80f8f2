#pragma once

#include <onlyswap/execution/router_logic.hpp>
#include <string>

namespace onlyswap::execution {

/// First release of the swap settlement code.
///
/// Bookkeeping is always written before any token movement or hook call.
/// Subclasses may override single operations to ship a later release.
class settlement_engine : public router_logic {
 public:
  explicit settlement_engine(std::string version);

  std::string version() const override;

  onlyswap::schema::transaction_result_t on_upgrade(
      settlement_context& context,
      const onlyswap::schema::bytes_t& init_payload) override;

  /// Create a request and take `amount_in + solver_fee` of `token_in` into
  /// custody from the caller's allowance. The result data carries the id.
  onlyswap::schema::transaction_result_t request_cross_chain_swap(
      settlement_context& context,
      const onlyswap::schema::request_cross_chain_swap_t& swap) override;

  /// Same as `request_cross_chain_swap` for `swap.requester`, with custody
  /// taken through the permit relayer.
  onlyswap::schema::transaction_result_t request_cross_chain_swap_permit2(
      settlement_context& context,
      const onlyswap::schema::request_cross_chain_swap_permit2_t& swap)
      override;

  onlyswap::schema::transaction_result_t update_solver_fees_if_unfulfilled(
      settlement_context& context,
      const onlyswap::schema::hash32_t& request_id,
      const onlyswap::schema::amount_t& new_fee) override;

  /// Deliver `amount_out` from the calling solver to the recipient and
  /// record the receipt. Succeeds at most once per request id.
  onlyswap::schema::transaction_result_t relay_tokens(
      settlement_context& context,
      const onlyswap::schema::relay_tokens_t& relay) override;

  onlyswap::schema::transaction_result_t relay_tokens_permit2(
      settlement_context& context,
      const onlyswap::schema::relay_tokens_permit2_t& relay) override;

  /// Repay `solver` once the swap request verifier accepts the rebalance
  /// message for the request.
  onlyswap::schema::transaction_result_t rebalance_solver(
      settlement_context& context,
      const onlyswap::schema::account_id_t& solver,
      const onlyswap::schema::hash32_t& request_id,
      const onlyswap::schema::bytes_t& signature) override;

  onlyswap::schema::transaction_result_t stage_swap_request_cancellation(
      settlement_context& context,
      const onlyswap::schema::hash32_t& request_id) override;

  onlyswap::schema::transaction_result_t cancel_swap_request_and_refund(
      settlement_context& context,
      const onlyswap::schema::hash32_t& request_id,
      const onlyswap::schema::account_id_t& refund_recipient) override;

  onlyswap::schema::transaction_result_t withdraw_verification_fee(
      settlement_context& context,
      const onlyswap::schema::token_id_t& token,
      const onlyswap::schema::account_id_t& to) override;

 private:
  std::string version_;
};

}  // namespace onlyswap::execution
