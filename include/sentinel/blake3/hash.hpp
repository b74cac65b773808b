#pragma once
#include <sentinel/schema/primitives.hpp>

#include <blake3.h>

#include <cstdint>
#include <span>
#include <string_view>

namespace sentinel::blake3 {

/// Incremental BLAKE3 hasher producing 32-byte digests.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const std::span<const uint8_t>& bytes);
  hasher& update(const sentinel::schema::hash32_t& hash);

  sentinel::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

sentinel::schema::hash32_t hash(const std::string_view& str);
sentinel::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace sentinel::blake3
