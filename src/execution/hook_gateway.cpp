#include <onlyswap/execution/hook_gateway.hpp>
#include <spdlog/spdlog.h>

namespace onlyswap::execution {

namespace {

using onlyswap::schema::transaction_error_code;

onlyswap::schema::transaction_result_t make_hook_failure(const size_t index,
                                                         std::string reason) {
  return onlyswap::schema::make_error_result(
      transaction_error_code::hook_execution_failed,
      "hook " + std::to_string(index) + " failed: " + reason);
}

}  // namespace

hook_executor::hook_executor(onlyswap::schema::account_id_t address)
    : address_{address} {}

const onlyswap::schema::account_id_t& hook_executor::address() const {
  return address_;
}

onlyswap::schema::transaction_result_t hook_executor::execute(
    ledger& ledger,
    const call_context& context,
    const onlyswap::schema::hooks_t& hooks) {
  return ledger.execute([&]() {
    auto result = onlyswap::schema::transaction_result_t{};
    auto executor_context = call_context{.caller = address_};
    for (size_t i = 0; i < hooks.size(); ++i) {
      const auto& hook = hooks[i];
      auto target = ledger.hook_targets().find(hook.target);
      if (!target) {
        return make_hook_failure(
            i, "unknown target " + onlyswap::schema::to_hex(hook.target));
      }
      spdlog::debug("Executing hook {} for {} on target {} with gas limit {}",
                    i, onlyswap::schema::to_hex(context.caller),
                    onlyswap::schema::to_hex(hook.target), hook.gas_limit);
      auto call = target->invoke(ledger, executor_context, hook.payload,
                                 hook.gas_limit);
      if (!call.success) {
        return make_hook_failure(i, call.log);
      }
      if (call.gas_used > hook.gas_limit) {
        return make_hook_failure(
            i, "out of gas: used " + std::to_string(call.gas_used) +
                   " of " + std::to_string(hook.gas_limit));
      }
      result.gas_used += call.gas_used;
    }
    return result;
  });
}

}  // namespace onlyswap::execution
