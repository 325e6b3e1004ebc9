#include <onft/chain/codec.hpp>
#include <onft/schema/chain_snapshot.hpp>
#include <onft/schema/encoding/scale/encoder.hpp>
#include <spdlog/spdlog.h>

#include <utility>

using namespace onft::schema;

namespace {

using encoder_t = onft::schema::encoding::scale_encoder_t;

// SCALE decoding stops once the value is complete, so leftover input is
// detected by re-encoding and comparing lengths.
template <typename T>
std::optional<T> try_decode_exact(const bytes_view_t& bytes) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<T>(bytes);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  if (encoder.encode(*decoded).size() != bytes.size()) {
    return std::nullopt;
  }
  return decoded;
}

}  // namespace

namespace onft::chain {

bytes_t encode_record(const record_t& record) {
  auto encoder = encoder_t{};
  return encoder.encode(record);
}

std::optional<record_t> try_decode_record(const bytes_view_t& bytes) {
  auto record = try_decode_exact<record_t>(bytes);
  if (!record.has_value() || record->version != 1) {
    spdlog::warn("Rejected undecodable record ({} bytes)", bytes.size());
    return std::nullopt;
  }
  return record;
}

bytes_t encode_chain(const chain& value) {
  auto snapshot = chain_snapshot_t{};
  snapshot.algorithm = static_cast<uint8_t>(value.algorithm());
  snapshot.max_length = value.options().max_length;
  snapshot.records = value.records();

  auto encoder = encoder_t{};
  return encoder.encode(snapshot);
}

std::optional<chain> try_decode_chain(const bytes_view_t& bytes) {
  auto snapshot = try_decode_exact<chain_snapshot_t>(bytes);
  if (!snapshot.has_value() || snapshot->version != 1) {
    spdlog::warn("Rejected undecodable chain ({} bytes)", bytes.size());
    return std::nullopt;
  }

  auto algorithm = try_make_digest_algorithm(snapshot->algorithm);
  if (!algorithm.has_value()) {
    spdlog::warn("Rejected chain with unknown digest algorithm {}",
                 snapshot->algorithm);
    return std::nullopt;
  }

  spdlog::debug("Decoded {} chain with {} record(s)", to_string(*algorithm),
                snapshot->records.size());
  return chain::from_records(
      std::move(snapshot->records),
      chain_options{.max_length = snapshot->max_length,
                    .algorithm = *algorithm});
}

}  // namespace onft::chain
