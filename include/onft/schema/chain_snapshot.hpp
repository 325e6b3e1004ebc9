#pragma once

#include <onft/schema/record.hpp>

#include <cstdint>
#include <vector>

// Schema type: chain snapshot.
// Wire form of a whole chain: the digest algorithm and length limit the
// records were produced under, followed by the records in chain order.
namespace onft::schema {

template <uint16_t Version>
struct chain_snapshot;

template <>
struct chain_snapshot<1> final {
  uint16_t version{1};
  uint8_t algorithm{};
  uint64_t max_length{};
  std::vector<record_t> records;
};

using chain_snapshot_t = chain_snapshot<1>;

}  // namespace onft::schema
