#pragma once

#include <onlyswap/schema/primitives.hpp>

#include <array>
#include <optional>

namespace onlyswap::crypto {

bool available();

bool verify_signature(const onlyswap::schema::bytes_view_t& message,
                      const onlyswap::schema::signer_id_t& signer,
                      const onlyswap::schema::signature_t& signature);

struct ed25519_keypair final {
  std::array<uint8_t, 32> private_key;
  onlyswap::schema::ed25519_signer_id signer;
};

/// Generate a fresh ed25519 key pair, or std::nullopt if the OpenSSL
/// provider does not support ed25519.
std::optional<ed25519_keypair> generate_ed25519_keypair();

std::optional<onlyswap::schema::ed25519_signature_t> sign_ed25519(
    const std::array<uint8_t, 32>& private_key,
    const onlyswap::schema::bytes_view_t& message);

}  // namespace onlyswap::crypto
