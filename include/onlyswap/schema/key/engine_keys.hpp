#pragma once

#include <onlyswap/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for router, registry, token and
// event state. Every key is SCALE(prefix) ++ SCALE(id).
namespace onlyswap::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kRouterKeyPrefix{"SYS|STATE|ROUTER|"};
inline constexpr std::string_view kAdminKeyPrefix{"SYS|STATE|ADMIN|"};
inline constexpr std::string_view kSwapRequestKeyPrefix{
    "SYS|STATE|SWAP_REQUEST|"};
inline constexpr std::string_view kReceiptKeyPrefix{"SYS|STATE|RECEIPT|"};
inline constexpr std::string_view kSolverRefundKeyPrefix{
    "SYS|STATE|SOLVER_REFUND|"};
inline constexpr std::string_view kFeeBalanceKeyPrefix{
    "SYS|STATE|FEE_BALANCE|"};
inline constexpr std::string_view kCancellationKeyPrefix{
    "SYS|STATE|CANCELLATION|"};
inline constexpr std::string_view kDestinationChainKeyPrefix{
    "SYS|STATE|DESTINATION_CHAIN|"};
inline constexpr std::string_view kSetLengthKeyPrefix{"SYS|STATE|SET_LEN|"};
inline constexpr std::string_view kSetItemKeyPrefix{"SYS|STATE|SET_ITEM|"};
inline constexpr std::string_view kSetPositionKeyPrefix{"SYS|STATE|SET_POS|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kAllowanceKeyPrefix{"SYS|STATE|ALLOWANCE|"};
inline constexpr std::string_view kPermitNonceKeyPrefix{
    "SYS|STATE|PERMIT_NONCE|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline const std::array<std::string_view, 17> kEngineKeyspaces{
    kStatePrefix,
    kRouterKeyPrefix,
    kAdminKeyPrefix,
    kSwapRequestKeyPrefix,
    kReceiptKeyPrefix,
    kSolverRefundKeyPrefix,
    kFeeBalanceKeyPrefix,
    kCancellationKeyPrefix,
    kDestinationChainKeyPrefix,
    kSetLengthKeyPrefix,
    kSetItemKeyPrefix,
    kSetPositionKeyPrefix,
    kBalanceKeyPrefix,
    kAllowanceKeyPrefix,
    kPermitNonceKeyPrefix,
    kEventSeqKeyPrefix,
    kEventPrefix};

template <typename Encoder, typename T>
onlyswap::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                            std::string_view prefix,
                                            const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
onlyswap::schema::bytes_t make_prefix_key(Encoder& encoder,
                                          std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
onlyswap::schema::bytes_t make_router_state_key(
    Encoder& encoder,
    const onlyswap::schema::account_id_t& router) {
  return make_prefixed_key(encoder, kRouterKeyPrefix, router);
}

template <typename Encoder>
onlyswap::schema::bytes_t make_admin_key(
    Encoder& encoder,
    const onlyswap::schema::account_id_t& router,
    const onlyswap::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kAdminKeyPrefix,
                           std::tuple{router, account});
}

template <typename Encoder>
onlyswap::schema::bytes_t make_swap_request_key(
    Encoder& encoder,
    const onlyswap::schema::account_id_t& router,
    const onlyswap::schema::hash32_t& request_id) {
  return make_prefixed_key(encoder, kSwapRequestKeyPrefix,
                           std::tuple{router, request_id});
}

template <typename Encoder>
onlyswap::schema::bytes_t make_receipt_key(
    Encoder& encoder,
    const onlyswap::schema::account_id_t& router,
    const onlyswap::schema::hash32_t& request_id) {
  return make_prefixed_key(encoder, kReceiptKeyPrefix,
                           std::tuple{router, request_id});
}

template <typename Encoder>
onlyswap::schema::bytes_t make_solver_refund_key(
    Encoder& encoder,
    const onlyswap::schema::account_id_t& router,
    const onlyswap::schema::hash32_t& request_id) {
  return make_prefixed_key(encoder, kSolverRefundKeyPrefix,
                           std::tuple{router, request_id});
}

template <typename Encoder>
onlyswap::schema::bytes_t make_fee_balance_key(
    Encoder& encoder,
    const onlyswap::schema::account_id_t& router,
    const onlyswap::schema::token_id_t& token) {
  return make_prefixed_key(encoder, kFeeBalanceKeyPrefix,
                           std::tuple{router, token});
}

template <typename Encoder>
onlyswap::schema::bytes_t make_cancellation_key(
    Encoder& encoder,
    const onlyswap::schema::account_id_t& router,
    const onlyswap::schema::hash32_t& request_id) {
  return make_prefixed_key(encoder, kCancellationKeyPrefix,
                           std::tuple{router, request_id});
}

template <typename Encoder>
onlyswap::schema::bytes_t make_destination_chain_key(
    Encoder& encoder,
    const onlyswap::schema::account_id_t& router,
    const onlyswap::schema::chain_id_t chain_id) {
  return make_prefixed_key(encoder, kDestinationChainKeyPrefix,
                           std::tuple{router, chain_id});
}

template <typename Encoder>
onlyswap::schema::bytes_t make_set_length_key(
    Encoder& encoder,
    const onlyswap::schema::hash32_t& set_id) {
  return make_prefixed_key(encoder, kSetLengthKeyPrefix, set_id);
}

template <typename Encoder>
onlyswap::schema::bytes_t make_set_item_key(
    Encoder& encoder,
    const onlyswap::schema::hash32_t& set_id,
    const uint64_t index) {
  return make_prefixed_key(encoder, kSetItemKeyPrefix,
                           std::tuple{set_id, index});
}

template <typename Encoder>
onlyswap::schema::bytes_t make_set_position_key(
    Encoder& encoder,
    const onlyswap::schema::hash32_t& set_id,
    const onlyswap::schema::hash32_t& value) {
  return make_prefixed_key(encoder, kSetPositionKeyPrefix,
                           std::tuple{set_id, value});
}

template <typename Encoder>
onlyswap::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const onlyswap::schema::token_id_t& token,
    const onlyswap::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix,
                           std::tuple{token, account});
}

template <typename Encoder>
onlyswap::schema::bytes_t make_allowance_key(
    Encoder& encoder,
    const onlyswap::schema::token_id_t& token,
    const onlyswap::schema::account_id_t& owner,
    const onlyswap::schema::account_id_t& spender) {
  return make_prefixed_key(encoder, kAllowanceKeyPrefix,
                           std::tuple{token, owner, spender});
}

template <typename Encoder>
onlyswap::schema::bytes_t make_permit_nonce_key(
    Encoder& encoder,
    const onlyswap::schema::account_id_t& relayer,
    const onlyswap::schema::account_id_t& owner,
    const uint64_t nonce) {
  return make_prefixed_key(encoder, kPermitNonceKeyPrefix,
                           std::tuple{relayer, owner, nonce});
}

template <typename Encoder>
onlyswap::schema::bytes_t make_event_seq_key(Encoder& encoder) {
  return make_prefix_key(encoder, kEventSeqKeyPrefix);
}

template <typename Encoder>
onlyswap::schema::bytes_t make_event_key(Encoder& encoder,
                                         const uint64_t sequence) {
  return make_prefixed_key(encoder, kEventPrefix, sequence);
}

}  // namespace onlyswap::schema::key
