#pragma once
#include <onlyswap/schema/hook.hpp>
#include <onlyswap/schema/permit.hpp>
#include <onlyswap/schema/primitives.hpp>

namespace onlyswap::schema {

template <uint16_t Version>
struct request_cross_chain_swap;

template <>
struct request_cross_chain_swap<1> final {
  token_id_t token_in;
  token_id_t token_out;
  amount_t amount_in;
  amount_t amount_out;
  amount_t solver_fee;
  chain_id_t dst_chain_id{};
  account_id_t recipient;
  hooks_t pre_hooks;
  hooks_t post_hooks;
};

using request_cross_chain_swap_t = request_cross_chain_swap<1>;

template <uint16_t Version>
struct request_cross_chain_swap_permit2;

/// Request whose custody transfer is authorized by the requester's permit
/// rather than an allowance. Anyone may submit it on the requester's behalf.
template <>
struct request_cross_chain_swap_permit2<1> final {
  request_cross_chain_swap_t swap;
  account_id_t requester;
  permit_transfer_t permit;
  bytes_t additional_data;
  permit_signature_t signature;
};

using request_cross_chain_swap_permit2_t = request_cross_chain_swap_permit2<1>;

}  // namespace onlyswap::schema
