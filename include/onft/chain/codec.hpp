#pragma once

#include <onft/chain/chain.hpp>
#include <onft/schema/primitives.hpp>
#include <onft/schema/record.hpp>

#include <optional>

namespace onft::chain {

/// SCALE encoding of a single record, ownership included.
onft::schema::bytes_t encode_record(const onft::schema::record_t& record);
std::optional<onft::schema::record_t> try_decode_record(
    const onft::schema::bytes_view_t& bytes);

/// SCALE encoding of a chain snapshot (algorithm, limit, records).
onft::schema::bytes_t encode_chain(const chain& value);

/// Decode a chain without verifying it. Returns std::nullopt for bytes that do
/// not decode, trailing garbage, an unknown schema version or digest
/// algorithm. Run `verify()` on the result before trusting it.
std::optional<chain> try_decode_chain(const onft::schema::bytes_view_t& bytes);

}  // namespace onft::chain
