#pragma once

#include <onft/schema/digest_algorithm.hpp>
#include <onft/schema/primitives.hpp>
#include <onft/schema/record.hpp>

#include <cstdint>

namespace onft::digest {

/// `prev_digest` of every genesis record.
onft::schema::digest_t genesis_sentinel();

/// Hash `bytes` with `algorithm`. Both supported algorithms yield 32 bytes.
onft::schema::digest_t compute(onft::schema::digest_algorithm algorithm,
                               const onft::schema::bytes_view_t& bytes);

/// Canonical byte string a record digest is computed over.
///
/// Layout (SCALE): u64 LE index, u64 LE timestamp, compact length prefix
/// followed by the payload bytes, then the 32 raw bytes of `prev_digest`.
onft::schema::bytes_t canonical_encoding(
    uint64_t index,
    onft::schema::timestamp_milliseconds_t timestamp,
    const onft::schema::bytes_t& payload,
    const onft::schema::digest_t& prev_digest);

onft::schema::digest_t record_digest(
    onft::schema::digest_algorithm algorithm,
    uint64_t index,
    onft::schema::timestamp_milliseconds_t timestamp,
    const onft::schema::bytes_t& payload,
    const onft::schema::digest_t& prev_digest);

/// Recompute the digest of `record` from its stored fields.
onft::schema::digest_t record_digest(onft::schema::digest_algorithm algorithm,
                                     const onft::schema::record_t& record);

}  // namespace onft::digest
