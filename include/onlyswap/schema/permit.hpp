#pragma once
#include <onlyswap/schema/primitives.hpp>

// Schema type: permit.
// A signed, single-use authorization for the permit relayer to move
// `amount` of `token` out of the signer's account towards a witness-bound
// destination.
namespace onlyswap::schema {

template <uint16_t Version>
struct permit_transfer;

template <>
struct permit_transfer<1> final {
  token_id_t token;
  amount_t amount;
  uint64_t nonce{};
  timestamp_seconds_t deadline{};
};

using permit_transfer_t = permit_transfer<1>;

template <uint16_t Version>
struct permit_signature;

template <>
struct permit_signature<1> final {
  signer_id_t signer;
  signature_t signature;
};

using permit_signature_t = permit_signature<1>;

}  // namespace onlyswap::schema
