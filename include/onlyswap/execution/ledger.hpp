#pragma once

#include <onlyswap/execution/world_state.hpp>
#include <onlyswap/schema/primitives.hpp>
#include <onlyswap/schema/transaction_event.hpp>
#include <onlyswap/schema/transaction_result.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace onlyswap::execution {

class hook_gateway;
class hook_target;
class permit_relayer;
class router_logic;
class signature_verifier;
class token_ledger;

/// Identity of the account invoking an operation.
struct call_context final {
  onlyswap::schema::account_id_t caller;
};

/// Addressable collaborators of one capability deployed on a ledger.
template <typename T>
class contract_registry final {
 public:
  void deploy(const onlyswap::schema::account_id_t& address,
              std::shared_ptr<T> contract) {
    contracts_[address] = std::move(contract);
  }

  std::shared_ptr<T> find(const onlyswap::schema::account_id_t& address) const {
    auto it = contracts_.find(address);
    if (it == std::end(contracts_)) {
      return nullptr;
    }
    return it->second;
  }

  bool contains(const onlyswap::schema::account_id_t& address) const {
    return contracts_.contains(address);
  }

 private:
  std::map<onlyswap::schema::account_id_t, std::shared_ptr<T>> contracts_;
};

/// One chain: a clock, a journaled world state, the token book, the event
/// log and the registries of deployed collaborators.
///
/// Calls are strictly serialized. `execute` makes a call all-or-nothing: a
/// non-zero result code reverts every state write and drops every event
/// produced during the call, including those of nested calls.
class ledger final {
 public:
  ledger(onlyswap::schema::chain_id_t chain_id,
         storage_t& storage,
         onlyswap::schema::timestamp_seconds_t genesis_time);
  ~ledger();

  ledger(const ledger&) = delete;
  ledger& operator=(const ledger&) = delete;

  onlyswap::schema::chain_id_t chain_id() const { return chain_id_; }

  onlyswap::schema::timestamp_seconds_t now() const;
  void set_time(onlyswap::schema::timestamp_seconds_t time);
  void advance_time(onlyswap::schema::duration_seconds_t duration);

  world_state& state() { return state_; }
  const world_state& state() const { return state_; }

  token_ledger& tokens() { return *tokens_; }
  const token_ledger& tokens() const { return *tokens_; }

  contract_registry<signature_verifier>& verifiers() { return verifiers_; }
  contract_registry<hook_gateway>& hook_gateways() { return hook_gateways_; }
  contract_registry<hook_target>& hook_targets() { return hook_targets_; }
  contract_registry<permit_relayer>& permit_relayers() {
    return permit_relayers_;
  }
  contract_registry<router_logic>& implementations() {
    return implementations_;
  }

  /// Run `fn` atomically and attach the events it emitted to its result.
  template <typename Fn>
  onlyswap::schema::transaction_result_t execute(Fn&& fn);

  /// Append an event to the log of the running call.
  void emit(std::string type,
            std::vector<onlyswap::schema::transaction_event_attribute_t>
                attributes);

  uint64_t event_count() const;
  std::optional<onlyswap::schema::transaction_event_t> event(
      uint64_t sequence) const;
  std::vector<onlyswap::schema::transaction_event_t> events_since(
      uint64_t sequence) const;

  /// Persist all state written by completed calls.
  onlyswap::storage::committed_state commit();

 private:
  void revert(size_t checkpoint, size_t event_mark);

  mutable std::recursive_mutex mutex_;
  onlyswap::schema::chain_id_t chain_id_{};
  onlyswap::schema::timestamp_seconds_t now_{};
  world_state state_;
  std::unique_ptr<token_ledger> tokens_;
  contract_registry<signature_verifier> verifiers_;
  contract_registry<hook_gateway> hook_gateways_;
  contract_registry<hook_target> hook_targets_;
  contract_registry<permit_relayer> permit_relayers_;
  contract_registry<router_logic> implementations_;
  std::vector<onlyswap::schema::transaction_event_t> call_events_;
  uint32_t depth_{};
};

onlyswap::schema::transaction_event_attribute_t make_attribute(
    std::string key,
    std::string value,
    bool index = false);
onlyswap::schema::transaction_event_attribute_t make_attribute(
    std::string key,
    const onlyswap::schema::hash32_t& value,
    bool index = false);
onlyswap::schema::transaction_event_attribute_t make_attribute(
    std::string key,
    const onlyswap::schema::amount_t& value,
    bool index = false);
onlyswap::schema::transaction_event_attribute_t make_attribute(
    std::string key,
    uint64_t value,
    bool index = false);

template <typename Fn>
onlyswap::schema::transaction_result_t ledger::execute(Fn&& fn) {
  auto lock = std::scoped_lock{mutex_};
  auto checkpoint = state_.checkpoint();
  auto event_mark = call_events_.size();
  ++depth_;
  auto result = onlyswap::schema::transaction_result_t{};
  try {
    result = std::forward<Fn>(fn)();
  } catch (...) {
    revert(checkpoint, event_mark);
    --depth_;
    throw;
  }
  --depth_;

  if (!onlyswap::schema::succeeded(result)) {
    revert(checkpoint, event_mark);
  } else {
    result.events.assign(
        std::next(std::begin(call_events_),
                  static_cast<std::ptrdiff_t>(event_mark)),
        std::end(call_events_));
  }
  if (depth_ == 0) {
    call_events_.clear();
  }
  return result;
}

}  // namespace onlyswap::execution
