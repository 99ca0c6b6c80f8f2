#include <onlyswap/execution/hook_gateway.hpp>
#include <onlyswap/execution/ledger.hpp>
#include <onlyswap/execution/permit_relayer.hpp>
#include <onlyswap/execution/router_logic.hpp>
#include <onlyswap/execution/signature_verifier.hpp>
#include <onlyswap/execution/token_ledger.hpp>
#include <onlyswap/schema/key/engine_keys.hpp>
#include <spdlog/spdlog.h>

namespace onlyswap::execution {

ledger::ledger(const onlyswap::schema::chain_id_t chain_id,
               storage_t& storage,
               const onlyswap::schema::timestamp_seconds_t genesis_time)
    : chain_id_{chain_id},
      now_{genesis_time},
      state_{storage},
      tokens_{std::make_unique<token_ledger>(*this)} {
  spdlog::info("Ledger for chain {} ready at time {} with {} event(s)",
               chain_id_, now_, event_count());
}

ledger::~ledger() = default;

onlyswap::schema::timestamp_seconds_t ledger::now() const {
  auto lock = std::scoped_lock{mutex_};
  return now_;
}

void ledger::set_time(const onlyswap::schema::timestamp_seconds_t time) {
  auto lock = std::scoped_lock{mutex_};
  if (time < now_) {
    spdlog::warn("Ignoring clock rewind on chain {} from {} to {}", chain_id_,
                 now_, time);
    return;
  }
  now_ = time;
}

void ledger::advance_time(const onlyswap::schema::duration_seconds_t duration) {
  auto lock = std::scoped_lock{mutex_};
  now_ += duration;
}

void ledger::emit(
    std::string type,
    std::vector<onlyswap::schema::transaction_event_attribute_t> attributes) {
  auto lock = std::scoped_lock{mutex_};
  auto& encoder = state_.encoder();
  auto seq_key = onlyswap::schema::key::make_event_seq_key(encoder);
  auto sequence = state_.get_or<uint64_t>(seq_key, 0);

  auto event = onlyswap::schema::transaction_event_t{
      .sequence = sequence,
      .type = std::move(type),
      .attributes = std::move(attributes)};
  state_.put(onlyswap::schema::key::make_event_key(encoder, sequence), event);
  state_.put(seq_key, sequence + 1);
  call_events_.push_back(std::move(event));
}

uint64_t ledger::event_count() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.get_or<uint64_t>(
      onlyswap::schema::key::make_event_seq_key(state_.encoder()), 0);
}

std::optional<onlyswap::schema::transaction_event_t> ledger::event(
    const uint64_t sequence) const {
  auto lock = std::scoped_lock{mutex_};
  return state_.get<onlyswap::schema::transaction_event_t>(
      onlyswap::schema::key::make_event_key(state_.encoder(), sequence));
}

std::vector<onlyswap::schema::transaction_event_t> ledger::events_since(
    const uint64_t sequence) const {
  auto lock = std::scoped_lock{mutex_};
  auto events = std::vector<onlyswap::schema::transaction_event_t>{};
  auto count = event_count();
  for (auto current = sequence; current < count; ++current) {
    auto stored = event(current);
    if (stored.has_value()) {
      events.push_back(std::move(*stored));
    }
  }
  return events;
}

onlyswap::storage::committed_state ledger::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (depth_ != 0) {
    onlyswap::common::critical("commit requested while a call is running");
  }
  return state_.commit();
}

void ledger::revert(const size_t checkpoint, const size_t event_mark) {
  state_.revert(checkpoint);
  call_events_.resize(event_mark);
}

onlyswap::schema::transaction_event_attribute_t make_attribute(
    std::string key,
    std::string value,
    const bool index) {
  return onlyswap::schema::transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

onlyswap::schema::transaction_event_attribute_t make_attribute(
    std::string key,
    const onlyswap::schema::hash32_t& value,
    const bool index) {
  return make_attribute(std::move(key), onlyswap::schema::to_hex(value), index);
}

onlyswap::schema::transaction_event_attribute_t make_attribute(
    std::string key,
    const onlyswap::schema::amount_t& value,
    const bool index) {
  return make_attribute(std::move(key), onlyswap::schema::to_string(value),
                        index);
}

onlyswap::schema::transaction_event_attribute_t make_attribute(
    std::string key,
    const uint64_t value,
    const bool index) {
  return make_attribute(std::move(key), std::to_string(value), index);
}

}  // namespace onlyswap::execution
