#pragma once

#include <onlyswap/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace onlyswap::schema {

enum class transaction_error_code : uint32_t {
  // validation
  zero_amount = 1,
  zero_address = 2,
  fee_too_low = 3,
  new_fee_too_low = 4,
  invalid_token_or_recipient = 5,
  destination_chain_id_not_supported = 6,
  token_not_supported = 7,
  invalid_fee_bps = 8,
  fee_bps_exceeds_threshold = 9,
  swap_request_cancellation_window_not_passed = 10,
  swap_request_cancellation_window_too_short = 11,
  upgrade_time_must_respect_delay = 12,
  upgrade_delay_too_short = 13,
  upgrade_too_early = 14,
  too_late_to_cancel_upgrade = 15,
  insufficient_verification_fee_balance = 16,
  amount_overflow = 17,
  // authorization
  signature_verification_failed = 20,
  unauthorised_caller = 21,
  access_denied = 22,
  source_chain_id_mismatch = 23,
  source_chain_id_should_be_different_from_destination = 24,
  swap_request_parameters_mismatch = 25,
  permit_invalid = 26,
  permit_expired = 27,
  permit_nonce_used = 28,
  // state conflicts
  already_fulfilled = 40,
  swap_request_cancellation_already_staged = 41,
  swap_request_cancellation_not_staged = 42,
  no_upgrade_pending = 43,
  same_version_upgrade_not_allowed = 44,
  token_mapping_already_exists = 45,
  already_initialized = 46,
  not_initialized = 47,
  // external dependencies
  hook_executor_not_set = 60,
  hook_execution_failed = 61,
  insufficient_balance = 62,
  insufficient_allowance = 63,
  unknown_implementation = 64,
  upgrade_failed = 65,
  permit2_relayer_not_set = 66,
  verifier_not_found = 67,
};

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    enum_mapping_t<transaction_error_code>{"zero_amount",
                                           transaction_error_code::zero_amount},
    enum_mapping_t<transaction_error_code>{
        "zero_address", transaction_error_code::zero_address},
    enum_mapping_t<transaction_error_code>{"fee_too_low",
                                           transaction_error_code::fee_too_low},
    enum_mapping_t<transaction_error_code>{
        "new_fee_too_low", transaction_error_code::new_fee_too_low},
    enum_mapping_t<transaction_error_code>{
        "invalid_token_or_recipient",
        transaction_error_code::invalid_token_or_recipient},
    enum_mapping_t<transaction_error_code>{
        "destination_chain_id_not_supported",
        transaction_error_code::destination_chain_id_not_supported},
    enum_mapping_t<transaction_error_code>{
        "token_not_supported", transaction_error_code::token_not_supported},
    enum_mapping_t<transaction_error_code>{
        "invalid_fee_bps", transaction_error_code::invalid_fee_bps},
    enum_mapping_t<transaction_error_code>{
        "fee_bps_exceeds_threshold",
        transaction_error_code::fee_bps_exceeds_threshold},
    enum_mapping_t<transaction_error_code>{
        "swap_request_cancellation_window_not_passed",
        transaction_error_code::swap_request_cancellation_window_not_passed},
    enum_mapping_t<transaction_error_code>{
        "swap_request_cancellation_window_too_short",
        transaction_error_code::swap_request_cancellation_window_too_short},
    enum_mapping_t<transaction_error_code>{
        "upgrade_time_must_respect_delay",
        transaction_error_code::upgrade_time_must_respect_delay},
    enum_mapping_t<transaction_error_code>{
        "upgrade_delay_too_short",
        transaction_error_code::upgrade_delay_too_short},
    enum_mapping_t<transaction_error_code>{
        "upgrade_too_early", transaction_error_code::upgrade_too_early},
    enum_mapping_t<transaction_error_code>{
        "too_late_to_cancel_upgrade",
        transaction_error_code::too_late_to_cancel_upgrade},
    enum_mapping_t<transaction_error_code>{
        "insufficient_verification_fee_balance",
        transaction_error_code::insufficient_verification_fee_balance},
    enum_mapping_t<transaction_error_code>{
        "amount_overflow", transaction_error_code::amount_overflow},
    enum_mapping_t<transaction_error_code>{
        "signature_verification_failed",
        transaction_error_code::signature_verification_failed},
    enum_mapping_t<transaction_error_code>{
        "unauthorised_caller", transaction_error_code::unauthorised_caller},
    enum_mapping_t<transaction_error_code>{
        "access_denied", transaction_error_code::access_denied},
    enum_mapping_t<transaction_error_code>{
        "source_chain_id_mismatch",
        transaction_error_code::source_chain_id_mismatch},
    enum_mapping_t<transaction_error_code>{
        "source_chain_id_should_be_different_from_destination",
        transaction_error_code::
            source_chain_id_should_be_different_from_destination},
    enum_mapping_t<transaction_error_code>{
        "swap_request_parameters_mismatch",
        transaction_error_code::swap_request_parameters_mismatch},
    enum_mapping_t<transaction_error_code>{
        "permit_invalid", transaction_error_code::permit_invalid},
    enum_mapping_t<transaction_error_code>{
        "permit_expired", transaction_error_code::permit_expired},
    enum_mapping_t<transaction_error_code>{
        "permit_nonce_used", transaction_error_code::permit_nonce_used},
    enum_mapping_t<transaction_error_code>{
        "already_fulfilled", transaction_error_code::already_fulfilled},
    enum_mapping_t<transaction_error_code>{
        "swap_request_cancellation_already_staged",
        transaction_error_code::swap_request_cancellation_already_staged},
    enum_mapping_t<transaction_error_code>{
        "swap_request_cancellation_not_staged",
        transaction_error_code::swap_request_cancellation_not_staged},
    enum_mapping_t<transaction_error_code>{
        "no_upgrade_pending", transaction_error_code::no_upgrade_pending},
    enum_mapping_t<transaction_error_code>{
        "same_version_upgrade_not_allowed",
        transaction_error_code::same_version_upgrade_not_allowed},
    enum_mapping_t<transaction_error_code>{
        "token_mapping_already_exists",
        transaction_error_code::token_mapping_already_exists},
    enum_mapping_t<transaction_error_code>{
        "already_initialized", transaction_error_code::already_initialized},
    enum_mapping_t<transaction_error_code>{
        "not_initialized", transaction_error_code::not_initialized},
    enum_mapping_t<transaction_error_code>{
        "hook_executor_not_set", transaction_error_code::hook_executor_not_set},
    enum_mapping_t<transaction_error_code>{
        "hook_execution_failed", transaction_error_code::hook_execution_failed},
    enum_mapping_t<transaction_error_code>{
        "insufficient_balance", transaction_error_code::insufficient_balance},
    enum_mapping_t<transaction_error_code>{
        "insufficient_allowance",
        transaction_error_code::insufficient_allowance},
    enum_mapping_t<transaction_error_code>{
        "unknown_implementation",
        transaction_error_code::unknown_implementation},
    enum_mapping_t<transaction_error_code>{
        "upgrade_failed", transaction_error_code::upgrade_failed},
    enum_mapping_t<transaction_error_code>{
        "permit2_relayer_not_set",
        transaction_error_code::permit2_relayer_not_set},
    enum_mapping_t<transaction_error_code>{
        "verifier_not_found", transaction_error_code::verifier_not_found}};

inline constexpr std::string_view to_string(const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeMappings).value_or("unknown");
}

inline constexpr std::string_view kValidationCodespace{"onlyswap.validation"};
inline constexpr std::string_view kAuthorizationCodespace{
    "onlyswap.authorization"};
inline constexpr std::string_view kStateCodespace{"onlyswap.state"};
inline constexpr std::string_view kExternalCodespace{"onlyswap.external"};

/// Error category of a code, derived from its numeric range.
inline constexpr std::string_view error_codespace(
    const transaction_error_code value) {
  auto raw = static_cast<uint32_t>(value);
  if (raw < 20) {
    return kValidationCodespace;
  }
  if (raw < 40) {
    return kAuthorizationCodespace;
  }
  if (raw < 60) {
    return kStateCodespace;
  }
  return kExternalCodespace;
}

}  // namespace onlyswap::schema
