#pragma once

#include <onlyswap/execution/hook_gateway.hpp>
#include <onlyswap/execution/ledger.hpp>
#include <onlyswap/schema/primitives.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace onlyswap::testing {

struct hook_invocation final {
  onlyswap::schema::account_id_t caller;
  onlyswap::schema::bytes_t payload;
  uint64_t gas_limit{};
};

/// Hook target that records every call and reports a fixed gas use.
class recording_hook_target final : public onlyswap::execution::hook_target {
 public:
  explicit recording_hook_target(uint64_t gas_used = 1000)
      : gas_used_{gas_used} {}

  onlyswap::execution::hook_call_result invoke(
      onlyswap::execution::ledger&,
      const onlyswap::execution::call_context& context,
      const onlyswap::schema::bytes_t& payload,
      const uint64_t gas_limit) override {
    invocations_.push_back(hook_invocation{
        .caller = context.caller, .payload = payload, .gas_limit = gas_limit});
    return onlyswap::execution::hook_call_result{
        .success = true, .gas_used = gas_used_, .log = {}};
  }

  const std::vector<hook_invocation>& invocations() const {
    return invocations_;
  }

 private:
  uint64_t gas_used_{};
  std::vector<hook_invocation> invocations_;
};

/// Hook target running an arbitrary callback against the ledger.
class callback_hook_target final : public onlyswap::execution::hook_target {
 public:
  using callback_t = std::function<onlyswap::execution::hook_call_result(
      onlyswap::execution::ledger&,
      const onlyswap::execution::call_context&,
      const onlyswap::schema::bytes_t&,
      uint64_t)>;

  explicit callback_hook_target(callback_t callback)
      : callback_{std::move(callback)} {}

  onlyswap::execution::hook_call_result invoke(
      onlyswap::execution::ledger& ledger,
      const onlyswap::execution::call_context& context,
      const onlyswap::schema::bytes_t& payload,
      const uint64_t gas_limit) override {
    return callback_(ledger, context, payload, gas_limit);
  }

 private:
  callback_t callback_;
};

inline onlyswap::schema::hook_t make_hook(
    const onlyswap::schema::account_id_t& target,
    std::string payload,
    const uint64_t gas_limit = 100000) {
  return onlyswap::schema::hook_t{
      .target = target,
      .payload = onlyswap::schema::make_bytes(payload),
      .gas_limit = gas_limit};
}

}  // namespace onlyswap::testing
