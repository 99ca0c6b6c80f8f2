#include <onlyswap/execution/ledger.hpp>
#include <onlyswap/execution/token_ledger.hpp>
#include <onlyswap/schema/key/engine_keys.hpp>

namespace onlyswap::execution {

namespace {

using onlyswap::schema::transaction_error_code;

}  // namespace

token_ledger::token_ledger(ledger& ledger) : ledger_{ledger} {}

onlyswap::schema::amount_t token_ledger::balance_of(
    const onlyswap::schema::token_id_t& token,
    const onlyswap::schema::account_id_t& account) const {
  const auto& state = ledger_.state();
  return state.get_or<onlyswap::schema::amount_t>(
      onlyswap::schema::key::make_balance_key(state.encoder(), token, account),
      0);
}

onlyswap::schema::amount_t token_ledger::allowance(
    const onlyswap::schema::token_id_t& token,
    const onlyswap::schema::account_id_t& owner,
    const onlyswap::schema::account_id_t& spender) const {
  const auto& state = ledger_.state();
  return state.get_or<onlyswap::schema::amount_t>(
      onlyswap::schema::key::make_allowance_key(state.encoder(), token, owner,
                                                spender),
      0);
}

onlyswap::schema::transaction_result_t token_ledger::mint(
    const onlyswap::schema::token_id_t& token,
    const onlyswap::schema::account_id_t& to,
    const onlyswap::schema::amount_t& amount) {
  return ledger_.execute([&]() {
    if (onlyswap::schema::is_zero(to)) {
      return onlyswap::schema::make_error_result(
          transaction_error_code::zero_address, "cannot mint to zero address");
    }
    auto credited = onlyswap::schema::try_add(balance_of(token, to), amount);
    if (!credited) {
      return onlyswap::schema::make_error_result(
          transaction_error_code::amount_overflow,
          "balance would exceed 256 bits");
    }
    auto& state = ledger_.state();
    state.put(onlyswap::schema::key::make_balance_key(state.encoder(), token, to),
              *credited);
    ledger_.emit("transfer",
                 {make_attribute("token", token, true),
                  make_attribute("from", onlyswap::schema::make_zero_hash()),
                  make_attribute("to", to, true),
                  make_attribute("amount", amount)});
    return onlyswap::schema::transaction_result_t{};
  });
}

onlyswap::schema::transaction_result_t token_ledger::transfer(
    const onlyswap::schema::token_id_t& token,
    const onlyswap::schema::account_id_t& from,
    const onlyswap::schema::account_id_t& to,
    const onlyswap::schema::amount_t& amount) {
  return ledger_.execute(
      [&]() { return move_balance(token, from, to, amount); });
}

onlyswap::schema::transaction_result_t token_ledger::approve(
    const onlyswap::schema::token_id_t& token,
    const onlyswap::schema::account_id_t& owner,
    const onlyswap::schema::account_id_t& spender,
    const onlyswap::schema::amount_t& amount) {
  return ledger_.execute([&]() {
    if (onlyswap::schema::is_zero(spender)) {
      return onlyswap::schema::make_error_result(
          transaction_error_code::zero_address,
          "cannot approve zero address");
    }
    auto& state = ledger_.state();
    state.put(onlyswap::schema::key::make_allowance_key(state.encoder(), token,
                                                        owner, spender),
              amount);
    ledger_.emit("approval", {make_attribute("token", token, true),
                              make_attribute("owner", owner, true),
                              make_attribute("spender", spender, true),
                              make_attribute("amount", amount)});
    return onlyswap::schema::transaction_result_t{};
  });
}

onlyswap::schema::transaction_result_t token_ledger::transfer_from(
    const onlyswap::schema::token_id_t& token,
    const onlyswap::schema::account_id_t& spender,
    const onlyswap::schema::account_id_t& from,
    const onlyswap::schema::account_id_t& to,
    const onlyswap::schema::amount_t& amount) {
  return ledger_.execute([&]() {
    auto current = allowance(token, from, spender);
    if (current < amount) {
      return onlyswap::schema::make_error_result(
          transaction_error_code::insufficient_allowance,
          "allowance " + onlyswap::schema::to_string(current) +
              " below transfer amount " + onlyswap::schema::to_string(amount));
    }
    auto& state = ledger_.state();
    state.put(onlyswap::schema::key::make_allowance_key(state.encoder(), token,
                                                        from, spender),
              onlyswap::schema::amount_t{current - amount});
    return move_balance(token, from, to, amount);
  });
}

onlyswap::schema::transaction_result_t token_ledger::move_balance(
    const onlyswap::schema::token_id_t& token,
    const onlyswap::schema::account_id_t& from,
    const onlyswap::schema::account_id_t& to,
    const onlyswap::schema::amount_t& amount) {
  if (onlyswap::schema::is_zero(to)) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::zero_address,
        "cannot transfer to zero address");
  }
  auto from_balance = balance_of(token, from);
  if (from_balance < amount) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::insufficient_balance,
        "balance " + onlyswap::schema::to_string(from_balance) +
            " below transfer amount " + onlyswap::schema::to_string(amount));
  }

  auto& state = ledger_.state();
  auto& encoder = state.encoder();
  state.put(onlyswap::schema::key::make_balance_key(encoder, token, from),
            onlyswap::schema::amount_t{from_balance - amount});
  auto credited = onlyswap::schema::try_add(balance_of(token, to), amount);
  if (!credited) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::amount_overflow,
        "balance would exceed 256 bits");
  }
  state.put(onlyswap::schema::key::make_balance_key(encoder, token, to),
            *credited);
  ledger_.emit("transfer", {make_attribute("token", token, true),
                            make_attribute("from", from, true),
                            make_attribute("to", to, true),
                            make_attribute("amount", amount)});
  return onlyswap::schema::transaction_result_t{};
}

}  // namespace onlyswap::execution
