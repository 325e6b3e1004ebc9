#include <onft/blake3/hash.hpp>
#include <onft/common/critical.hpp>
#include <onft/digest/digest.hpp>
#include <onft/schema/encoding/scale/encoder.hpp>

#include <openssl/evp.h>

namespace onft::digest {

namespace {

using encoder_t = onft::schema::encoding::scale_encoder_t;

onft::schema::digest_t sha256(const onft::schema::bytes_view_t& bytes) {
  auto output = onft::schema::digest_t{};
  auto size = static_cast<unsigned int>(output.size());
  if (EVP_Digest(bytes.data(), bytes.size(), output.data(), &size,
                 EVP_sha256(), nullptr) != 1 ||
      size != output.size()) {
    onft::common::critical("OpenSSL failed to compute SHA-256 digest");
  }
  return output;
}

}  // namespace

onft::schema::digest_t genesis_sentinel() {
  return onft::schema::make_zero_hash();
}

onft::schema::digest_t compute(const onft::schema::digest_algorithm algorithm,
                               const onft::schema::bytes_view_t& bytes) {
  switch (algorithm) {
    case onft::schema::digest_algorithm::blake3:
      return onft::blake3::hash(bytes);
    case onft::schema::digest_algorithm::sha256:
      return sha256(bytes);
  }
  onft::common::critical("unknown digest algorithm");
}

onft::schema::bytes_t canonical_encoding(
    const uint64_t index,
    const onft::schema::timestamp_milliseconds_t timestamp,
    const onft::schema::bytes_t& payload,
    const onft::schema::digest_t& prev_digest) {
  auto encoder = encoder_t{};
  auto out = onft::schema::bytes_t{};
  out.reserve(payload.size() + prev_digest.size() + 32);
  encoder.encode(index, out);
  encoder.encode(timestamp, out);
  encoder.encode(payload, out);
  encoder.encode(prev_digest, out);
  return out;
}

onft::schema::digest_t record_digest(
    const onft::schema::digest_algorithm algorithm,
    const uint64_t index,
    const onft::schema::timestamp_milliseconds_t timestamp,
    const onft::schema::bytes_t& payload,
    const onft::schema::digest_t& prev_digest) {
  auto material = canonical_encoding(index, timestamp, payload, prev_digest);
  return compute(algorithm,
                 onft::schema::bytes_view_t{material.data(), material.size()});
}

onft::schema::digest_t record_digest(
    const onft::schema::digest_algorithm algorithm,
    const onft::schema::record_t& record) {
  return record_digest(algorithm, record.index, record.timestamp,
                       record.payload, record.prev_digest);
}

}  // namespace onft::digest
