#pragma once
#include <onlyswap/schema/hook.hpp>
#include <onlyswap/schema/primitives.hpp>

// Schema type: swap request.
// Source-ledger record of a requested cross-chain transfer. Only the solver
// fee and the terminal `executed` flag change after creation.
namespace onlyswap::schema {

template <uint16_t Version>
struct swap_request;

template <>
struct swap_request<1> final {
  account_id_t sender;
  account_id_t recipient;
  token_id_t token_in;
  token_id_t token_out;
  amount_t amount_in;
  amount_t amount_out;
  chain_id_t src_chain_id{};
  chain_id_t dst_chain_id{};
  amount_t verification_fee;
  amount_t solver_fee;
  uint64_t nonce{};
  bool executed{};
  timestamp_seconds_t requested_at{};
  hooks_t pre_hooks;
  hooks_t post_hooks;
};

using swap_request_t = swap_request<1>;

}  // namespace onlyswap::schema
