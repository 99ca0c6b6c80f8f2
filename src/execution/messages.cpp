#include <onlyswap/blake3/hash.hpp>
#include <onlyswap/execution/messages.hpp>
#include <onlyswap/execution/world_state.hpp>
#include <string>
#include <tuple>

namespace onlyswap::execution {

namespace {

template <typename T>
onlyswap::schema::hash32_t hash_encoded(const T& value) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(value);
  return onlyswap::blake3::hash(onlyswap::schema::make_bytes_view(encoded));
}

}  // namespace

onlyswap::schema::hash32_t hooks_hash(const onlyswap::schema::hooks_t& hooks) {
  return hash_encoded(hooks);
}

onlyswap::schema::hash32_t make_request_id(
    const onlyswap::schema::account_id_t& sender,
    const onlyswap::schema::account_id_t& recipient,
    const onlyswap::schema::token_id_t& token_in,
    const onlyswap::schema::token_id_t& token_out,
    const onlyswap::schema::amount_t& amount_out,
    const onlyswap::schema::chain_id_t src_chain_id,
    const onlyswap::schema::chain_id_t dst_chain_id,
    const uint64_t nonce,
    const onlyswap::schema::hooks_t& pre_hooks,
    const onlyswap::schema::hooks_t& post_hooks) {
  return hash_encoded(std::tuple{sender, recipient, token_in, token_out,
                                 amount_out, src_chain_id, dst_chain_id, nonce,
                                 hooks_hash(pre_hooks),
                                 hooks_hash(post_hooks)});
}

onlyswap::schema::hash32_t make_request_id(
    const onlyswap::schema::swap_request_t& request) {
  return make_request_id(request.sender, request.recipient, request.token_in,
                         request.token_out, request.amount_out,
                         request.src_chain_id, request.dst_chain_id,
                         request.nonce, request.pre_hooks, request.post_hooks);
}

onlyswap::schema::bytes_t make_rebalance_message(
    const onlyswap::schema::account_id_t& solver,
    const onlyswap::schema::swap_request_t& request) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{
      solver, request.sender, request.recipient, request.token_in,
      request.token_out, request.amount_in, request.amount_out,
      request.src_chain_id, request.dst_chain_id, request.nonce,
      hooks_hash(request.pre_hooks), hooks_hash(request.post_hooks)});
}

onlyswap::schema::bytes_t make_contract_upgrade_message(
    const governance_scope& scope,
    const std::string_view action,
    const onlyswap::schema::implementation_id_t& pending_implementation,
    const onlyswap::schema::implementation_id_t& new_implementation,
    const onlyswap::schema::bytes_t& init_payload,
    const onlyswap::schema::timestamp_seconds_t upgrade_time,
    const uint64_t nonce) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{std::string{action}, scope.chain_id,
                                   scope.router, pending_implementation,
                                   new_implementation, init_payload,
                                   upgrade_time, nonce});
}

onlyswap::schema::bytes_t make_verifier_update_message(
    const governance_scope& scope,
    const std::string_view action,
    const onlyswap::schema::account_id_t& verifier,
    const uint64_t nonce) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{std::string{action}, scope.chain_id,
                                   scope.router, verifier, nonce});
}

onlyswap::schema::bytes_t make_duration_update_message(
    const governance_scope& scope,
    const std::string_view action,
    const onlyswap::schema::duration_seconds_t duration,
    const uint64_t nonce) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{std::string{action}, scope.chain_id,
                                   scope.router, duration, nonce});
}

onlyswap::schema::hash32_t make_swap_request_witness(
    const onlyswap::schema::account_id_t& router,
    const onlyswap::schema::request_cross_chain_swap_t& swap,
    const onlyswap::schema::bytes_t& additional_data) {
  return hash_encoded(std::tuple{
      std::string{kSwapRequestWitnessTag}, router, swap.token_in,
      swap.token_out, swap.amount_in, swap.amount_out, swap.solver_fee,
      swap.dst_chain_id, swap.recipient, additional_data});
}

onlyswap::schema::hash32_t make_relay_witness(
    const onlyswap::schema::hash32_t& request_id,
    const onlyswap::schema::account_id_t& recipient,
    const onlyswap::schema::bytes_t& additional_data) {
  return hash_encoded(std::tuple{std::string{kRelayWitnessTag}, request_id,
                                 recipient, additional_data});
}

onlyswap::schema::bytes_t make_solver_refund_payload(
    const onlyswap::schema::account_id_t& solver_refund_address) {
  auto encoder = encoder_t{};
  return encoder.encode(solver_refund_address);
}

}  // namespace onlyswap::execution
