#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sentinel::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);

std::optional<hash32_t> try_make_hash32(const std::string_view& hex);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(const std::string_view hex);

/// Identifier derived from a stable human-readable key, e.g. a gate key.
hash32_t make_id(const std::string_view key);

}  // namespace sentinel::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
