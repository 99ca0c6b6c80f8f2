#pragma once

#include <onlyswap/schema/primitives.hpp>
#include <onlyswap/schema/transaction_result.hpp>

namespace onlyswap::execution {

class ledger;

/// Fungible token balances and allowances of every token on a ledger.
///
/// Every mutating operation runs as its own atomic call, so it can be used
/// directly or nested inside a router call.
class token_ledger final {
 public:
  explicit token_ledger(ledger& ledger);

  onlyswap::schema::amount_t balance_of(
      const onlyswap::schema::token_id_t& token,
      const onlyswap::schema::account_id_t& account) const;

  onlyswap::schema::amount_t allowance(
      const onlyswap::schema::token_id_t& token,
      const onlyswap::schema::account_id_t& owner,
      const onlyswap::schema::account_id_t& spender) const;

  onlyswap::schema::transaction_result_t mint(
      const onlyswap::schema::token_id_t& token,
      const onlyswap::schema::account_id_t& to,
      const onlyswap::schema::amount_t& amount);

  /// Move `amount` from `from`; the caller must be `from`.
  onlyswap::schema::transaction_result_t transfer(
      const onlyswap::schema::token_id_t& token,
      const onlyswap::schema::account_id_t& from,
      const onlyswap::schema::account_id_t& to,
      const onlyswap::schema::amount_t& amount);

  onlyswap::schema::transaction_result_t approve(
      const onlyswap::schema::token_id_t& token,
      const onlyswap::schema::account_id_t& owner,
      const onlyswap::schema::account_id_t& spender,
      const onlyswap::schema::amount_t& amount);

  /// Move `amount` from `from` on behalf of `spender`, consuming allowance.
  onlyswap::schema::transaction_result_t transfer_from(
      const onlyswap::schema::token_id_t& token,
      const onlyswap::schema::account_id_t& spender,
      const onlyswap::schema::account_id_t& from,
      const onlyswap::schema::account_id_t& to,
      const onlyswap::schema::amount_t& amount);

 private:
  onlyswap::schema::transaction_result_t move_balance(
      const onlyswap::schema::token_id_t& token,
      const onlyswap::schema::account_id_t& from,
      const onlyswap::schema::account_id_t& to,
      const onlyswap::schema::amount_t& amount);

  ledger& ledger_;
};

}  // namespace onlyswap::execution
