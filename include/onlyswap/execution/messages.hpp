#pragma once

#include <onlyswap/schema/hook.hpp>
#include <onlyswap/schema/primitives.hpp>
#include <onlyswap/schema/request_cross_chain_swap.hpp>
#include <onlyswap/schema/swap_request.hpp>
#include <cstdint>
#include <string_view>

// Request ids and the byte messages the signing committee and permit
// owners attest to. Field order is part of the protocol.
namespace onlyswap::execution {

inline constexpr std::string_view kScheduleUpgradeAction{"schedule"};
inline constexpr std::string_view kCancelUpgradeAction{"cancel"};
inline constexpr std::string_view kChangeSwapRequestVerifierAction{
    "change-swap-request-verifier"};
inline constexpr std::string_view kChangeContractUpgradeVerifierAction{
    "change-contract-upgrade-verifier"};
inline constexpr std::string_view kChangeUpgradeDelayAction{
    "change-upgrade-delay"};
inline constexpr std::string_view kChangeCancellationWindowAction{
    "change-cancellation-window"};

inline constexpr std::string_view kSwapRequestWitnessTag{
    "swap-request-witness-v1"};
inline constexpr std::string_view kRelayWitnessTag{"relay-witness-v1"};

/// Router instance a governance message is valid for. Binding it keeps a
/// signature for one router from verifying on another that shares the
/// committee key.
struct governance_scope final {
  onlyswap::schema::chain_id_t chain_id{};
  onlyswap::schema::account_id_t router{};
};

onlyswap::schema::hash32_t hooks_hash(const onlyswap::schema::hooks_t& hooks);

/// Request id as derived independently by the source and destination ledger.
onlyswap::schema::hash32_t make_request_id(
    const onlyswap::schema::account_id_t& sender,
    const onlyswap::schema::account_id_t& recipient,
    const onlyswap::schema::token_id_t& token_in,
    const onlyswap::schema::token_id_t& token_out,
    const onlyswap::schema::amount_t& amount_out,
    onlyswap::schema::chain_id_t src_chain_id,
    onlyswap::schema::chain_id_t dst_chain_id,
    uint64_t nonce,
    const onlyswap::schema::hooks_t& pre_hooks,
    const onlyswap::schema::hooks_t& post_hooks);

onlyswap::schema::hash32_t make_request_id(
    const onlyswap::schema::swap_request_t& request);

/// Message authorizing repayment of `solver` for `request`.
onlyswap::schema::bytes_t make_rebalance_message(
    const onlyswap::schema::account_id_t& solver,
    const onlyswap::schema::swap_request_t& request);

onlyswap::schema::bytes_t make_contract_upgrade_message(
    const governance_scope& scope,
    std::string_view action,
    const onlyswap::schema::implementation_id_t& pending_implementation,
    const onlyswap::schema::implementation_id_t& new_implementation,
    const onlyswap::schema::bytes_t& init_payload,
    onlyswap::schema::timestamp_seconds_t upgrade_time,
    uint64_t nonce);

onlyswap::schema::bytes_t make_verifier_update_message(
    const governance_scope& scope,
    std::string_view action,
    const onlyswap::schema::account_id_t& verifier,
    uint64_t nonce);

onlyswap::schema::bytes_t make_duration_update_message(
    const governance_scope& scope,
    std::string_view action,
    onlyswap::schema::duration_seconds_t duration,
    uint64_t nonce);

/// Witness a requester's permit binds to the request parameters.
onlyswap::schema::hash32_t make_swap_request_witness(
    const onlyswap::schema::account_id_t& router,
    const onlyswap::schema::request_cross_chain_swap_t& swap,
    const onlyswap::schema::bytes_t& additional_data);

/// Witness a solver's permit binds to one fulfillment.
onlyswap::schema::hash32_t make_relay_witness(
    const onlyswap::schema::hash32_t& request_id,
    const onlyswap::schema::account_id_t& recipient,
    const onlyswap::schema::bytes_t& additional_data);

/// Opaque relay witness payload carrying the solver refund address.
onlyswap::schema::bytes_t make_solver_refund_payload(
    const onlyswap::schema::account_id_t& solver_refund_address);

}  // namespace onlyswap::execution
