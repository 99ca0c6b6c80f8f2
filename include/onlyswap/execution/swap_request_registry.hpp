#pragma once

#include <onlyswap/execution/enumerable_set.hpp>
#include <onlyswap/execution/world_state.hpp>
#include <onlyswap/schema/primitives.hpp>
#include <onlyswap/schema/router_state.hpp>
#include <onlyswap/schema/swap_request.hpp>
#include <onlyswap/schema/swap_request_receipt.hpp>
#include <onlyswap/schema/swap_request_status.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace onlyswap::execution {

inline constexpr std::string_view kUnfulfilledSolverRefundsSet{
    "unfulfilled_solver_refunds"};
inline constexpr std::string_view kFulfilledSolverRefundsSet{
    "fulfilled_solver_refunds"};
inline constexpr std::string_view kCancelledSwapRequestsSet{
    "cancelled_swap_requests"};
inline constexpr std::string_view kFulfilledTransfersSet{
    "fulfilled_transfers"};
inline constexpr std::string_view kTokenMappingSet{"token_mapping"};

/// Persistent bookkeeping of one router identity, keyed by request id.
///
/// Holds requests, receipts, the solver refund ledger, per-token fee
/// balances, staged cancellations, the membership sets, token mappings,
/// permitted destination chains, admin roles and the router state record.
/// The registry performs no validation; callers enforce transitions.
class swap_request_registry final {
 public:
  swap_request_registry(world_state& state,
                        onlyswap::schema::account_id_t router);

  const onlyswap::schema::account_id_t& router() const { return router_; }

  std::optional<onlyswap::schema::router_state_t> router_state() const;
  void put_router_state(const onlyswap::schema::router_state_t& router_state);

  std::optional<onlyswap::schema::swap_request_t> request(
      const onlyswap::schema::hash32_t& request_id) const;
  void put_request(const onlyswap::schema::hash32_t& request_id,
                   const onlyswap::schema::swap_request_t& request);

  std::optional<onlyswap::schema::swap_request_receipt_t> receipt(
      const onlyswap::schema::hash32_t& request_id) const;
  void put_receipt(const onlyswap::schema::swap_request_receipt_t& receipt);

  onlyswap::schema::amount_t solver_refund(
      const onlyswap::schema::hash32_t& request_id) const;
  void set_solver_refund(const onlyswap::schema::hash32_t& request_id,
                         const onlyswap::schema::amount_t& amount);
  void erase_solver_refund(const onlyswap::schema::hash32_t& request_id);

  onlyswap::schema::amount_t fee_balance(
      const onlyswap::schema::token_id_t& token) const;
  void set_fee_balance(const onlyswap::schema::token_id_t& token,
                       const onlyswap::schema::amount_t& amount);

  /// Time at which cancellation was staged, if it was.
  std::optional<onlyswap::schema::timestamp_seconds_t> cancellation_initiated_at(
      const onlyswap::schema::hash32_t& request_id) const;
  void set_cancellation_initiated_at(
      const onlyswap::schema::hash32_t& request_id,
      onlyswap::schema::timestamp_seconds_t time);

  enumerable_set unfulfilled_solver_refunds() const;
  enumerable_set fulfilled_solver_refunds() const;
  enumerable_set cancelled_swap_requests() const;
  enumerable_set fulfilled_transfers() const;

  /// Source ledger view of a request id.
  onlyswap::schema::swap_request_status_t status(
      const onlyswap::schema::hash32_t& request_id) const;

  bool is_destination_chain_permitted(
      onlyswap::schema::chain_id_t chain_id) const;
  void set_destination_chain_permitted(onlyswap::schema::chain_id_t chain_id,
                                       bool permitted);

  /// Destination tokens `token_in` may be swapped into on `dst_chain_id`.
  enumerable_set token_mapping(const onlyswap::schema::token_id_t& token_in,
                               onlyswap::schema::chain_id_t dst_chain_id) const;

  bool is_admin(const onlyswap::schema::account_id_t& account) const;
  void set_admin(const onlyswap::schema::account_id_t& account, bool admin);

 private:
  enumerable_set named_set(std::string_view name,
                           const onlyswap::schema::bytes_t& qualifier = {}) const;

  world_state& state_;
  onlyswap::schema::account_id_t router_;
};

}  // namespace onlyswap::execution
