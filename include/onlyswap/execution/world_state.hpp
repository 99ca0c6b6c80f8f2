#pragma once

#include <onlyswap/schema/encoding/scale/encoder.hpp>
#include <onlyswap/schema/primitives.hpp>
#include <onlyswap/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace onlyswap::execution {

using encoder_t = onlyswap::schema::encoding::scale_encoder_t;
using storage_t = onlyswap::storage::rocksdb_storage_t;

/// Journaled key-value overlay over committed storage.
///
/// Every write is recorded in an undo journal so a call can be rolled back to
/// any earlier checkpoint. `commit` flushes the overlay to storage in a
/// single write batch and advances the state root.
class world_state final {
 public:
  explicit world_state(storage_t& storage);

  world_state(const world_state&) = delete;
  world_state& operator=(const world_state&) = delete;

  template <typename T>
  std::optional<T> get(const onlyswap::schema::bytes_t& key) const;

  template <typename T>
  T get_or(const onlyswap::schema::bytes_t& key, T fallback) const;

  template <typename T>
  void put(const onlyswap::schema::bytes_t& key, const T& value);

  void erase(const onlyswap::schema::bytes_t& key);
  bool contains(const onlyswap::schema::bytes_t& key) const;

  encoder_t& encoder() const { return encoder_; }

  /// Current journal position; pass to `revert` to undo later writes.
  size_t checkpoint() const;
  void revert(size_t checkpoint);

  size_t pending_writes() const;
  onlyswap::storage::committed_state commit();
  const onlyswap::storage::committed_state& last_committed() const;

 private:
  struct journal_entry final {
    onlyswap::schema::bytes_t key;
    // Outer nullopt: key had no pending write before this entry.
    std::optional<std::optional<onlyswap::schema::bytes_t>> previous;
  };

  std::optional<onlyswap::schema::bytes_t> read(
      const onlyswap::schema::bytes_t& key) const;
  void write(const onlyswap::schema::bytes_t& key,
             std::optional<onlyswap::schema::bytes_t> value);

  storage_t& storage_;
  mutable encoder_t encoder_;
  std::map<onlyswap::schema::bytes_t, std::optional<onlyswap::schema::bytes_t>>
      pending_;
  std::vector<journal_entry> journal_;
  onlyswap::storage::committed_state committed_;
};

template <typename T>
std::optional<T> world_state::get(const onlyswap::schema::bytes_t& key) const {
  auto raw = read(key);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  return encoder_.template decode<T>(
      onlyswap::schema::bytes_view_t{raw->data(), raw->size()});
}

template <typename T>
T world_state::get_or(const onlyswap::schema::bytes_t& key, T fallback) const {
  auto value = get<T>(key);
  if (!value.has_value()) {
    return fallback;
  }
  return std::move(*value);
}

template <typename T>
void world_state::put(const onlyswap::schema::bytes_t& key, const T& value) {
  write(key, encoder_.encode(value));
}

}  // namespace onlyswap::execution
