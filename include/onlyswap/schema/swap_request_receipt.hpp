#pragma once
#include <onlyswap/schema/primitives.hpp>

// Schema type: swap request receipt.
// Destination-ledger proof that a solver delivered `amount_out` to the
// recipient. Written once by fulfillment, never modified.
namespace onlyswap::schema {

template <uint16_t Version>
struct swap_request_receipt;

template <>
struct swap_request_receipt<1> final {
  hash32_t request_id;
  chain_id_t src_chain_id{};
  chain_id_t dst_chain_id{};
  token_id_t token_in;
  token_id_t token_out;
  bool fulfilled{};
  account_id_t solver;
  account_id_t recipient;
  amount_t amount_out;
  timestamp_seconds_t fulfilled_at{};
};

using swap_request_receipt_t = swap_request_receipt<1>;

}  // namespace onlyswap::schema
