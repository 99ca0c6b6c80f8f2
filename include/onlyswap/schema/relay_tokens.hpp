#pragma once
#include <onlyswap/schema/hook.hpp>
#include <onlyswap/schema/permit.hpp>
#include <onlyswap/schema/primitives.hpp>

namespace onlyswap::schema {

template <uint16_t Version>
struct relay_tokens;

template <>
struct relay_tokens<1> final {
  account_id_t solver_refund_address;
  hash32_t request_id;
  account_id_t sender;
  account_id_t recipient;
  token_id_t token_in;
  token_id_t token_out;
  amount_t amount_out;
  chain_id_t src_chain_id{};
  uint64_t nonce{};
  hooks_t pre_hooks;
  hooks_t post_hooks;
};

using relay_tokens_t = relay_tokens<1>;

template <uint16_t Version>
struct relay_tokens_permit2;

template <>
struct relay_tokens_permit2<1> final {
  relay_tokens_t relay;
  account_id_t solver;
  permit_transfer_t permit;
  permit_signature_t signature;
};

using relay_tokens_permit2_t = relay_tokens_permit2<1>;

}  // namespace onlyswap::schema
