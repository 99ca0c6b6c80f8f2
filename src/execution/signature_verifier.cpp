#include <onlyswap/blake3/hash.hpp>
#include <onlyswap/crypto/verify.hpp>
#include <onlyswap/execution/signature_verifier.hpp>
#include <onlyswap/schema/encoding/scale/encoder.hpp>
#include <algorithm>
#include <tuple>

namespace onlyswap::execution {

onlyswap::schema::hash32_t make_domain_digest(
    const std::string_view domain_tag,
    const onlyswap::schema::bytes_view_t& message) {
  auto encoder = onlyswap::schema::encoding::scale_encoder_t{};
  auto encoded = encoder.encode(std::tuple{
      std::string{domain_tag}, onlyswap::schema::make_bytes(message)});
  return onlyswap::blake3::hash(
      onlyswap::schema::bytes_view_t{encoded.data(), encoded.size()});
}

onlyswap::schema::hash32_t signature_verifier::message_digest(
    const onlyswap::schema::bytes_view_t& message) const {
  return make_domain_digest(domain_tag(), message);
}

ed25519_group_verifier::ed25519_group_verifier(
    std::string domain_tag,
    onlyswap::schema::ed25519_signer_id group_key)
    : domain_tag_{std::move(domain_tag)}, group_key_{group_key} {}

std::string_view ed25519_group_verifier::domain_tag() const {
  return domain_tag_;
}

bool ed25519_group_verifier::verify(
    const onlyswap::schema::bytes_view_t& message,
    const onlyswap::schema::bytes_view_t& signature) const {
  auto ed25519_signature = onlyswap::schema::ed25519_signature_t{};
  if (signature.size() != ed25519_signature.size()) {
    return false;
  }
  std::copy(std::begin(signature), std::end(signature),
            std::begin(ed25519_signature));

  auto digest = message_digest(message);
  return onlyswap::crypto::verify_signature(
      onlyswap::schema::bytes_view_t{digest.data(), digest.size()},
      onlyswap::schema::signer_id_t{group_key_},
      onlyswap::schema::signature_t{ed25519_signature});
}

const onlyswap::schema::ed25519_signer_id& ed25519_group_verifier::group_key()
    const {
  return group_key_;
}

}  // namespace onlyswap::execution
