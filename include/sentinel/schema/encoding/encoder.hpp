#pragma once
#include <sentinel/schema/primitives.hpp>

#include <optional>
#include <span>

namespace sentinel::schema::encoding {

/// Build-time selected wire codec; storage and the ledger are templated on
/// it rather than on a concrete library.
template <typename Library>
struct encoder {
  template <typename T>
  sentinel::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, sentinel::schema::bytes_t& out);

  template <typename T>
  T decode(const sentinel::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const sentinel::schema::bytes_view_t& bytes);
};

}  // namespace sentinel::schema::encoding
