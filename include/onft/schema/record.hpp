#pragma once

#include <onft/schema/primitives.hpp>

#include <cstdint>
#include <optional>

// Schema type: record.
// One entry of a chain: ordered payload bytes bound to their predecessor by
// digest. `version` and `ownership` are not covered by `self_digest`.
namespace onft::schema {

/// Owner attestation: `signature` is the owner's ed25519 signature over the
/// record's `self_digest`.
struct ownership_t final {
  ed25519_public_key_t owner{};
  ed25519_signature_t signature{};
};

template <uint16_t Version>
struct record;

template <>
struct record<1> final {
  uint16_t version{1};
  uint64_t index{};
  timestamp_milliseconds_t timestamp{};
  bytes_t payload;
  digest_t prev_digest{};
  digest_t self_digest{};
  std::optional<ownership_t> ownership;
};

using record_t = record<1>;

}  // namespace onft::schema
