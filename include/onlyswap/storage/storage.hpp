#pragma once
#include <onlyswap/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace onlyswap::storage {

using key_value_entry_t =
    std::pair<onlyswap::schema::bytes_t, onlyswap::schema::bytes_t>;

/// A pending write; std::nullopt value deletes the key.
using write_entry_t = std::pair<onlyswap::schema::bytes_t,
                                std::optional<onlyswap::schema::bytes_t>>;

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  uint64_t sequence{};
  onlyswap::schema::hash32_t state_root;
};

template <typename Library>
struct storage {
  /// Return raw bytes at key, or std::nullopt when missing.
  std::optional<onlyswap::schema::bytes_t> get(
      const onlyswap::schema::bytes_view_t& key) const;

  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const onlyswap::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const onlyswap::schema::bytes_view_t& key,
           const T& value) const;

  /// Atomically apply puts and deletes together with the new checkpoint.
  void apply(const std::vector<write_entry_t>& writes,
             const committed_state& state) const;

  /// Load the most recent committed checkpoint (sequence + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const onlyswap::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace onlyswap::storage
