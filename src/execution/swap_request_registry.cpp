#include <onlyswap/execution/swap_request_registry.hpp>
#include <onlyswap/schema/key/engine_keys.hpp>
#include <tuple>

namespace onlyswap::execution {

swap_request_registry::swap_request_registry(
    world_state& state,
    onlyswap::schema::account_id_t router)
    : state_{state}, router_{router} {}

std::optional<onlyswap::schema::router_state_t>
swap_request_registry::router_state() const {
  return state_.get<onlyswap::schema::router_state_t>(
      onlyswap::schema::key::make_router_state_key(state_.encoder(), router_));
}

void swap_request_registry::put_router_state(
    const onlyswap::schema::router_state_t& router_state) {
  state_.put(
      onlyswap::schema::key::make_router_state_key(state_.encoder(), router_),
      router_state);
}

std::optional<onlyswap::schema::swap_request_t> swap_request_registry::request(
    const onlyswap::schema::hash32_t& request_id) const {
  return state_.get<onlyswap::schema::swap_request_t>(
      onlyswap::schema::key::make_swap_request_key(state_.encoder(), router_,
                                                   request_id));
}

void swap_request_registry::put_request(
    const onlyswap::schema::hash32_t& request_id,
    const onlyswap::schema::swap_request_t& request) {
  state_.put(onlyswap::schema::key::make_swap_request_key(state_.encoder(),
                                                          router_, request_id),
             request);
}

std::optional<onlyswap::schema::swap_request_receipt_t>
swap_request_registry::receipt(
    const onlyswap::schema::hash32_t& request_id) const {
  return state_.get<onlyswap::schema::swap_request_receipt_t>(
      onlyswap::schema::key::make_receipt_key(state_.encoder(), router_,
                                              request_id));
}

void swap_request_registry::put_receipt(
    const onlyswap::schema::swap_request_receipt_t& receipt) {
  state_.put(onlyswap::schema::key::make_receipt_key(state_.encoder(), router_,
                                                     receipt.request_id),
             receipt);
}

onlyswap::schema::amount_t swap_request_registry::solver_refund(
    const onlyswap::schema::hash32_t& request_id) const {
  return state_.get_or<onlyswap::schema::amount_t>(
      onlyswap::schema::key::make_solver_refund_key(state_.encoder(), router_,
                                                    request_id),
      0);
}

void swap_request_registry::set_solver_refund(
    const onlyswap::schema::hash32_t& request_id,
    const onlyswap::schema::amount_t& amount) {
  state_.put(onlyswap::schema::key::make_solver_refund_key(
                 state_.encoder(), router_, request_id),
             amount);
}

void swap_request_registry::erase_solver_refund(
    const onlyswap::schema::hash32_t& request_id) {
  state_.erase(onlyswap::schema::key::make_solver_refund_key(
      state_.encoder(), router_, request_id));
}

onlyswap::schema::amount_t swap_request_registry::fee_balance(
    const onlyswap::schema::token_id_t& token) const {
  return state_.get_or<onlyswap::schema::amount_t>(
      onlyswap::schema::key::make_fee_balance_key(state_.encoder(), router_,
                                                  token),
      0);
}

void swap_request_registry::set_fee_balance(
    const onlyswap::schema::token_id_t& token,
    const onlyswap::schema::amount_t& amount) {
  state_.put(onlyswap::schema::key::make_fee_balance_key(state_.encoder(),
                                                         router_, token),
             amount);
}

std::optional<onlyswap::schema::timestamp_seconds_t>
swap_request_registry::cancellation_initiated_at(
    const onlyswap::schema::hash32_t& request_id) const {
  return state_.get<onlyswap::schema::timestamp_seconds_t>(
      onlyswap::schema::key::make_cancellation_key(state_.encoder(), router_,
                                                   request_id));
}

void swap_request_registry::set_cancellation_initiated_at(
    const onlyswap::schema::hash32_t& request_id,
    const onlyswap::schema::timestamp_seconds_t time) {
  state_.put(onlyswap::schema::key::make_cancellation_key(state_.encoder(),
                                                          router_, request_id),
             time);
}

enumerable_set swap_request_registry::unfulfilled_solver_refunds() const {
  return named_set(kUnfulfilledSolverRefundsSet);
}

enumerable_set swap_request_registry::fulfilled_solver_refunds() const {
  return named_set(kFulfilledSolverRefundsSet);
}

enumerable_set swap_request_registry::cancelled_swap_requests() const {
  return named_set(kCancelledSwapRequestsSet);
}

enumerable_set swap_request_registry::fulfilled_transfers() const {
  return named_set(kFulfilledTransfersSet);
}

onlyswap::schema::swap_request_status_t swap_request_registry::status(
    const onlyswap::schema::hash32_t& request_id) const {
  if (unfulfilled_solver_refunds().contains(request_id)) {
    return onlyswap::schema::swap_request_status_t::unfulfilled;
  }
  if (fulfilled_solver_refunds().contains(request_id)) {
    return onlyswap::schema::swap_request_status_t::fulfilled;
  }
  if (cancelled_swap_requests().contains(request_id)) {
    return onlyswap::schema::swap_request_status_t::cancelled;
  }
  return onlyswap::schema::swap_request_status_t::unknown;
}

bool swap_request_registry::is_destination_chain_permitted(
    const onlyswap::schema::chain_id_t chain_id) const {
  return state_.get_or<bool>(onlyswap::schema::key::make_destination_chain_key(
                                 state_.encoder(), router_, chain_id),
                             false);
}

void swap_request_registry::set_destination_chain_permitted(
    const onlyswap::schema::chain_id_t chain_id,
    const bool permitted) {
  auto key = onlyswap::schema::key::make_destination_chain_key(
      state_.encoder(), router_, chain_id);
  if (permitted) {
    state_.put(key, true);
  } else {
    state_.erase(key);
  }
}

enumerable_set swap_request_registry::token_mapping(
    const onlyswap::schema::token_id_t& token_in,
    const onlyswap::schema::chain_id_t dst_chain_id) const {
  return named_set(kTokenMappingSet,
                   state_.encoder().encode(std::tuple{token_in, dst_chain_id}));
}

bool swap_request_registry::is_admin(
    const onlyswap::schema::account_id_t& account) const {
  return state_.get_or<bool>(
      onlyswap::schema::key::make_admin_key(state_.encoder(), router_, account),
      false);
}

void swap_request_registry::set_admin(
    const onlyswap::schema::account_id_t& account,
    const bool admin) {
  auto key =
      onlyswap::schema::key::make_admin_key(state_.encoder(), router_, account);
  if (admin) {
    state_.put(key, true);
  } else {
    state_.erase(key);
  }
}

enumerable_set swap_request_registry::named_set(
    const std::string_view name,
    const onlyswap::schema::bytes_t& qualifier) const {
  return enumerable_set{
      state_, enumerable_set::make_set_id(state_, router_, name, qualifier)};
}

}  // namespace onlyswap::execution
