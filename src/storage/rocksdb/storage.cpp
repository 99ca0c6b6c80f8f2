#include <onlyswap/common/critical.hpp>
#include <onlyswap/storage/rocksdb/storage.hpp>

namespace onlyswap::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    onlyswap::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<onlyswap::schema::bytes_t> storage<rocksdb_storage_tag>::get(
    const onlyswap::schema::bytes_view_t& key) const {
  if (!database) {
    onlyswap::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    onlyswap::common::critical("Failed to get value from RocksDB");
  }
  return onlyswap::schema::bytes_t{std::begin(value), std::end(value)};
}

void storage<rocksdb_storage_tag>::apply(
    const std::vector<write_entry_t>& writes,
    const committed_state& state) const {
  if (!database) {
    onlyswap::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto status = value.has_value()
                      ? batch.Put(detail::to_slice(key),
                                  detail::to_slice(*value))
                      : batch.Delete(detail::to_slice(key));
    if (!status.ok()) {
      onlyswap::common::critical("failed staging write batch entry");
    }
  }

  auto encoder = onlyswap::schema::encoding::scale_encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.sequence, state.state_root});
  auto state_status =
      batch.Put(ROCKSDB_NAMESPACE::Slice{detail::kCommittedStateKey.data(),
                                         detail::kCommittedStateKey.size()},
                detail::to_slice(encoded));
  if (!state_status.ok()) {
    onlyswap::common::critical("failed staging committed state");
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    onlyswap::common::critical("failed to commit write batch");
  }
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto committed_raw = get(onlyswap::schema::make_bytes_view(
      std::string_view{detail::kCommittedStateKey}));
  if (!committed_raw.has_value()) {
    return std::nullopt;
  }

  auto encoder = onlyswap::schema::encoding::scale_encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, onlyswap::schema::hash32_t>>(
          onlyswap::schema::bytes_view_t{committed_raw->data(),
                                         committed_raw->size()});
  if (!decoded.has_value()) {
    onlyswap::common::critical("failed to decode committed state");
  }
  return committed_state{.sequence = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const onlyswap::schema::bytes_view_t& prefix) const {
  if (!database) {
    onlyswap::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_slice);
  while (iterator->Valid()) {
    if (!iterator->key().starts_with(prefix_slice)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    onlyswap::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace onlyswap::storage
