#include <onlyswap/crypto/verify.hpp>
#include <onlyswap/execution/permit_relayer.hpp>
#include <onlyswap/execution/signature_verifier.hpp>
#include <onlyswap/execution/token_ledger.hpp>
#include <onlyswap/schema/key/engine_keys.hpp>
#include <tuple>

namespace onlyswap::execution {

namespace {

using onlyswap::schema::transaction_error_code;

}  // namespace

signature_permit_relayer::signature_permit_relayer(
    onlyswap::schema::account_id_t address)
    : address_{address} {}

const onlyswap::schema::account_id_t& signature_permit_relayer::address()
    const {
  return address_;
}

onlyswap::schema::bytes_t signature_permit_relayer::permit_message(
    const onlyswap::schema::chain_id_t chain_id,
    const onlyswap::schema::account_id_t& spender,
    const onlyswap::schema::permit_transfer_t& permit,
    const onlyswap::schema::hash32_t& witness) const {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{std::string{"permit-witness-transfer-from"},
                                   chain_id, address_, spender, permit.token,
                                   permit.amount, permit.nonce,
                                   permit.deadline, witness});
}

onlyswap::schema::hash32_t signature_permit_relayer::permit_digest(
    const onlyswap::schema::chain_id_t chain_id,
    const onlyswap::schema::account_id_t& spender,
    const onlyswap::schema::permit_transfer_t& permit,
    const onlyswap::schema::hash32_t& witness) const {
  auto message = permit_message(chain_id, spender, permit, witness);
  return make_domain_digest(kPermitDomainTag,
                            onlyswap::schema::make_bytes_view(message));
}

bool signature_permit_relayer::is_nonce_used(
    const ledger& ledger,
    const onlyswap::schema::account_id_t& owner,
    const uint64_t nonce) const {
  const auto& state = ledger.state();
  return state.contains(onlyswap::schema::key::make_permit_nonce_key(
      state.encoder(), address_, owner, nonce));
}

onlyswap::schema::transaction_result_t
signature_permit_relayer::permit_witness_transfer_from(
    ledger& ledger,
    const call_context& context,
    const onlyswap::schema::account_id_t& owner,
    const onlyswap::schema::permit_transfer_t& permit,
    const onlyswap::schema::account_id_t& to,
    const onlyswap::schema::amount_t& amount,
    const onlyswap::schema::hash32_t& witness,
    const onlyswap::schema::permit_signature_t& signature) {
  return ledger.execute([&]() {
    if (ledger.now() > permit.deadline) {
      return onlyswap::schema::make_error_result(
          transaction_error_code::permit_expired,
          "permit deadline " + std::to_string(permit.deadline) + " passed");
    }
    if (amount > permit.amount) {
      return onlyswap::schema::make_error_result(
          transaction_error_code::permit_invalid,
          "requested amount exceeds permitted amount");
    }
    if (is_nonce_used(ledger, owner, permit.nonce)) {
      return onlyswap::schema::make_error_result(
          transaction_error_code::permit_nonce_used,
          "permit nonce " + std::to_string(permit.nonce) + " already used");
    }
    if (onlyswap::schema::make_account_id(signature.signer) != owner) {
      return onlyswap::schema::make_error_result(
          transaction_error_code::permit_invalid,
          "permit signer does not control owner account");
    }
    auto digest = permit_digest(ledger.chain_id(), context.caller, permit,
                                witness);
    if (!onlyswap::crypto::verify_signature(
            onlyswap::schema::bytes_view_t{digest.data(), digest.size()},
            signature.signer, signature.signature)) {
      return onlyswap::schema::make_error_result(
          transaction_error_code::permit_invalid,
          "permit signature verification failed");
    }

    auto& state = ledger.state();
    state.put(onlyswap::schema::key::make_permit_nonce_key(
                  state.encoder(), address_, owner, permit.nonce),
              true);
    return ledger.tokens().transfer_from(permit.token, address_, owner, to,
                                         amount);
  });
}

}  // namespace onlyswap::execution
