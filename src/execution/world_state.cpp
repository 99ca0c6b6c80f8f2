#include <onlyswap/blake3/hash.hpp>
#include <onlyswap/execution/world_state.hpp>
#include <spdlog/spdlog.h>

namespace onlyswap::execution {

world_state::world_state(storage_t& storage)
    : storage_{storage}, encoder_{}, pending_{}, journal_{}, committed_{} {
  auto committed = storage_.load_committed_state();
  if (committed.has_value()) {
    committed_ = *committed;
    spdlog::info("Loaded committed state at sequence {} root {}",
                 committed_.sequence,
                 onlyswap::schema::to_hex(committed_.state_root));
  }
}

std::optional<onlyswap::schema::bytes_t> world_state::read(
    const onlyswap::schema::bytes_t& key) const {
  auto pending = pending_.find(key);
  if (pending != std::end(pending_)) {
    return pending->second;
  }
  return storage_.get(onlyswap::schema::bytes_view_t{key.data(), key.size()});
}

void world_state::write(const onlyswap::schema::bytes_t& key,
                        std::optional<onlyswap::schema::bytes_t> value) {
  auto entry = journal_entry{.key = key, .previous = std::nullopt};
  auto pending = pending_.find(key);
  if (pending != std::end(pending_)) {
    entry.previous = pending->second;
    pending->second = std::move(value);
  } else {
    pending_.emplace(key, std::move(value));
  }
  journal_.push_back(std::move(entry));
}

void world_state::erase(const onlyswap::schema::bytes_t& key) {
  write(key, std::nullopt);
}

bool world_state::contains(const onlyswap::schema::bytes_t& key) const {
  return read(key).has_value();
}

size_t world_state::checkpoint() const {
  return journal_.size();
}

void world_state::revert(const size_t checkpoint) {
  while (journal_.size() > checkpoint) {
    auto& entry = journal_.back();
    if (entry.previous.has_value()) {
      pending_[entry.key] = std::move(*entry.previous);
    } else {
      pending_.erase(entry.key);
    }
    journal_.pop_back();
  }
}

size_t world_state::pending_writes() const {
  return pending_.size();
}

onlyswap::storage::committed_state world_state::commit() {
  if (pending_.empty()) {
    return committed_;
  }

  auto writes = std::vector<onlyswap::storage::write_entry_t>{};
  writes.reserve(pending_.size());
  for (const auto& [key, value] : pending_) {
    writes.emplace_back(key, value);
  }

  auto hasher = onlyswap::blake3::hasher{};
  hasher.update(onlyswap::schema::bytes_view_t{committed_.state_root.data(),
                                               committed_.state_root.size()});
  auto encoded_writes = encoder_.encode(writes);
  hasher.update(onlyswap::schema::bytes_view_t{encoded_writes.data(),
                                               encoded_writes.size()});

  auto next = onlyswap::storage::committed_state{
      .sequence = committed_.sequence + 1, .state_root = hasher.finalize()};
  storage_.apply(writes, next);

  spdlog::debug("Committed {} write(s) at sequence {}", writes.size(),
                next.sequence);
  committed_ = next;
  pending_.clear();
  journal_.clear();
  return committed_;
}

const onlyswap::storage::committed_state& world_state::last_committed() const {
  return committed_;
}

}  // namespace onlyswap::execution
