#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <onlyswap/common/critical.hpp>
#include <onlyswap/schema/encoding/scale/encoder.hpp>
#include <onlyswap/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>
#include <tuple>

namespace onlyswap::storage {

namespace detail {

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

inline onlyswap::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const onlyswap::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<onlyswap::schema::bytes_t> get(
      const onlyswap::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const onlyswap::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const onlyswap::schema::bytes_view_t& key,
           const T& value) const;

  void apply(const std::vector<write_entry_t>& writes,
             const committed_state& state) const;
  std::optional<committed_state> load_committed_state() const;
  std::vector<key_value_entry_t> list_by_prefix(
      const onlyswap::schema::bytes_view_t& prefix) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const onlyswap::schema::bytes_view_t& key) const {
  auto value = get(key);
  if (!value.has_value()) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(onlyswap::schema::bytes_view_t{
      value->data(), value->size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const onlyswap::schema::bytes_view_t& key,
    const T& value) const {
  if (!database) {
    onlyswap::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status =
      database->Put(ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
                    detail::to_slice(encoded_value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    onlyswap::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace onlyswap::storage
