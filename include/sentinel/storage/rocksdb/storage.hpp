#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <sentinel/common/critical.hpp>
#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/storage/storage.hpp>

#include <iterator>
#include <memory>
#include <string_view>

namespace sentinel::storage {

namespace detail {

inline sentinel::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const sentinel::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const sentinel::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const sentinel::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<sentinel::schema::bytes_t> get_raw(
      const sentinel::schema::bytes_view_t& key) const;
  void put_raw(const sentinel::schema::bytes_view_t& key,
               const sentinel::schema::bytes_view_t& value) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const sentinel::schema::bytes_view_t& prefix) const;
  bool write_batch(const std::vector<key_value_entry_t>& entries) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const sentinel::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      sentinel::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const sentinel::schema::bytes_view_t& key,
    const T& value) const {
  auto encoded_value = encoder.encode(value);
  put_raw(key, sentinel::schema::bytes_view_t{encoded_value.data(),
                                              encoded_value.size()});
}

inline std::optional<sentinel::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const sentinel::schema::bytes_view_t& key) const {
  if (!database) {
    sentinel::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    sentinel::common::critical("Failed to get value from RocksDB");
  }
  return sentinel::schema::bytes_t(std::begin(value), std::end(value));
}

inline void storage<rocksdb_storage_tag>::put_raw(
    const sentinel::schema::bytes_view_t& key,
    const sentinel::schema::bytes_view_t& value) const {
  if (!database) {
    sentinel::common::critical("RocksDB database is not initialized");
  }
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key), detail::to_slice(value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    sentinel::common::critical("Failed to put value into RocksDB");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const sentinel::schema::bytes_view_t& prefix) const {
  if (!database) {
    sentinel::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB prefix scan failed: {}",
                  iterator->status().ToString());
    sentinel::common::critical("RocksDB prefix scan failed");
  }
  return entries;
}

inline bool storage<rocksdb_storage_tag>::write_batch(
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    sentinel::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(
        ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(key.data()),
                                 key.size()},
        ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(value.data()),
                                 value.size()});
    if (!put_status.ok()) {
      spdlog::error("Failed staging batch entry: {}", put_status.ToString());
      return false;
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}",
                  write_status.ToString());
    return false;
  }
  return true;
}

}  // namespace sentinel::storage
