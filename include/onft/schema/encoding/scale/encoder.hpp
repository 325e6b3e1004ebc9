#pragma once
#include <onft/common/critical.hpp>
#include <onft/schema/encoding/encoder.hpp>
#include <onft/schema/chain_snapshot.hpp>
#include <onft/schema/record.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace onft::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  onft::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, onft::schema::bytes_t& out);

  template <typename T>
  T decode(const onft::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const onft::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
onft::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    onft::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        onft::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const onft::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    onft::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const onft::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace onft::schema::encoding
