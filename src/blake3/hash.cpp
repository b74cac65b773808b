#include <sentinel/blake3/hash.hpp>

namespace sentinel::blake3 {

hasher::hasher() : state_{} {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const std::span<const uint8_t>& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const sentinel::schema::hash32_t& hash) {
  blake3_hasher_update(&state_, hash.data(), hash.size());
  return *this;
}

sentinel::schema::hash32_t hasher::finalize() const {
  // blake3_hasher_finalize does not consume the state, so finalize is const.
  auto output = sentinel::schema::hash32_t{};
  static_assert(sizeof(output) == BLAKE3_OUT_LEN);
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

sentinel::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

sentinel::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace sentinel::blake3
