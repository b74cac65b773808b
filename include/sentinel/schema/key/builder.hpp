#pragma once
#include <sentinel/schema/primitives.hpp>

#include <boost/endian/conversion.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace sentinel::schema::key {

struct builder final {
  sentinel::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const hash32_t& hash);

  /// Big-endian so lexicographic key order matches numeric order.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    auto* raw = reinterpret_cast<const uint8_t*>(&big);
    data.insert(data.end(), raw, raw + sizeof(T));
    return *this;
  }
};

}  // namespace sentinel::schema::key
