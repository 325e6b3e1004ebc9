#pragma once
#include <onft/schema/primitives.hpp>
#include <optional>
#include <span>

namespace onft::schema::encoding {

// The encoding library is a build time choice made through the tag type.
// Digest computation depends on the encoder being byte-for-byte stable, so
// swapping the library changes every digest a chain produces.
template <typename Library>
struct encoder {
  template <typename T>
  onft::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, onft::schema::bytes_t& out);

  template <typename T>
  T decode(const onft::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const onft::schema::bytes_view_t& bytes);
};

}  // namespace onft::schema::encoding
