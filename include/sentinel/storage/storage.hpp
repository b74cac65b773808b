#pragma once
#include <sentinel/schema/primitives.hpp>

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace sentinel::storage {

using key_value_entry_t =
    std::pair<sentinel::schema::bytes_t, sentinel::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const sentinel::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const sentinel::schema::bytes_view_t& key,
           const T& value) const;

  /// Raw bytes at key, or std::nullopt when missing.
  std::optional<sentinel::schema::bytes_t> get_raw(
      const sentinel::schema::bytes_view_t& key) const;

  /// Persist raw bytes at key.
  void put_raw(const sentinel::schema::bytes_view_t& key,
               const sentinel::schema::bytes_view_t& value) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const sentinel::schema::bytes_view_t& prefix) const;

  /// Atomically persist every entry or none. Returns false when the backend
  /// rejected the batch.
  bool write_batch(const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace sentinel::storage
