#pragma once

#include <onlyswap/execution/ledger.hpp>
#include <onlyswap/schema/hook.hpp>
#include <onlyswap/schema/primitives.hpp>
#include <onlyswap/schema/transaction_result.hpp>
#include <cstdint>
#include <string>

namespace onlyswap::execution {

struct hook_call_result final {
  bool success{};
  uint64_t gas_used{};
  std::string log;
};

/// Contract that can be the target of a hook.
class hook_target {
 public:
  virtual ~hook_target() = default;

  /// Run `payload` on behalf of `context.caller` within `gas_limit`.
  virtual hook_call_result invoke(ledger& ledger,
                                  const call_context& context,
                                  const onlyswap::schema::bytes_t& payload,
                                  uint64_t gas_limit) = 0;
};

/// Sandbox that runs an ordered hook list; the first failure fails the batch.
class hook_gateway {
 public:
  virtual ~hook_gateway() = default;

  virtual onlyswap::schema::transaction_result_t execute(
      ledger& ledger,
      const call_context& context,
      const onlyswap::schema::hooks_t& hooks) = 0;
};

/// Gateway dispatching hooks to the targets deployed on the ledger.
///
/// Targets observe the executor as their caller, never the router. A target
/// reporting more gas than its hook allows counts as a failure.
class hook_executor final : public hook_gateway {
 public:
  explicit hook_executor(onlyswap::schema::account_id_t address);

  const onlyswap::schema::account_id_t& address() const;

  onlyswap::schema::transaction_result_t execute(
      ledger& ledger,
      const call_context& context,
      const onlyswap::schema::hooks_t& hooks) override;

 private:
  onlyswap::schema::account_id_t address_;
};

}  // namespace onlyswap::execution
