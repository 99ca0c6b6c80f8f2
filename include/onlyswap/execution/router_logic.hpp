#pragma once

#include <onlyswap/execution/ledger.hpp>
#include <onlyswap/execution/swap_request_registry.hpp>
#include <onlyswap/schema/primitives.hpp>
#include <onlyswap/schema/relay_tokens.hpp>
#include <onlyswap/schema/request_cross_chain_swap.hpp>
#include <onlyswap/schema/transaction_result.hpp>
#include <string>

namespace onlyswap::execution {

/// Everything one router call may touch: the hosting ledger, the router's
/// registry and the account invoking the router.
struct settlement_context final {
  ledger& chain;
  swap_request_registry& registry;
  call_context call;
};

/// Replaceable code of a router.
///
/// Implementations are deployed on the ledger under an implementation id;
/// the router resolves the active one from its state on every call, so they
/// must keep no per-router state of their own. Every operation runs inside
/// the router's atomic call and may return early on the first failed check.
class router_logic {
 public:
  virtual ~router_logic() = default;

  virtual std::string version() const = 0;

  /// Initialization run once when this code becomes active through an
  /// executed upgrade.
  virtual onlyswap::schema::transaction_result_t on_upgrade(
      settlement_context& context,
      const onlyswap::schema::bytes_t& init_payload) = 0;

  virtual onlyswap::schema::transaction_result_t request_cross_chain_swap(
      settlement_context& context,
      const onlyswap::schema::request_cross_chain_swap_t& swap) = 0;

  virtual onlyswap::schema::transaction_result_t
  request_cross_chain_swap_permit2(
      settlement_context& context,
      const onlyswap::schema::request_cross_chain_swap_permit2_t& swap) = 0;

  virtual onlyswap::schema::transaction_result_t
  update_solver_fees_if_unfulfilled(
      settlement_context& context,
      const onlyswap::schema::hash32_t& request_id,
      const onlyswap::schema::amount_t& new_fee) = 0;

  virtual onlyswap::schema::transaction_result_t relay_tokens(
      settlement_context& context,
      const onlyswap::schema::relay_tokens_t& relay) = 0;

  virtual onlyswap::schema::transaction_result_t relay_tokens_permit2(
      settlement_context& context,
      const onlyswap::schema::relay_tokens_permit2_t& relay) = 0;

  virtual onlyswap::schema::transaction_result_t rebalance_solver(
      settlement_context& context,
      const onlyswap::schema::account_id_t& solver,
      const onlyswap::schema::hash32_t& request_id,
      const onlyswap::schema::bytes_t& signature) = 0;

  virtual onlyswap::schema::transaction_result_t
  stage_swap_request_cancellation(
      settlement_context& context,
      const onlyswap::schema::hash32_t& request_id) = 0;

  virtual onlyswap::schema::transaction_result_t
  cancel_swap_request_and_refund(
      settlement_context& context,
      const onlyswap::schema::hash32_t& request_id,
      const onlyswap::schema::account_id_t& refund_recipient) = 0;

  virtual onlyswap::schema::transaction_result_t withdraw_verification_fee(
      settlement_context& context,
      const onlyswap::schema::token_id_t& token,
      const onlyswap::schema::account_id_t& to) = 0;
};

}  // namespace onlyswap::execution
