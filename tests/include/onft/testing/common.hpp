#pragma once

#include <onft/chain/chain.hpp>
#include <onft/schema/primitives.hpp>
#include <onft/schema/record.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace onft::testing {

inline onft::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = onft::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Clock that always reports `now`.
inline onft::chain::clock_fn_t fixed_clock(
    const onft::schema::timestamp_milliseconds_t now) {
  return [now]() { return now; };
}

/// Clock that starts at `start` and advances by `step` on every read.
inline onft::chain::clock_fn_t stepping_clock(
    const onft::schema::timestamp_milliseconds_t start,
    const onft::schema::timestamp_milliseconds_t step) {
  auto next = std::make_shared<onft::schema::timestamp_milliseconds_t>(start);
  return [next, step]() {
    auto now = *next;
    *next += step;
    return now;
  };
}

inline std::vector<onft::schema::bytes_t> make_numbered_payloads(
    const uint64_t count) {
  auto payloads = std::vector<onft::schema::bytes_t>{};
  payloads.reserve(count);
  for (uint64_t i = 0; i < count; ++i) {
    payloads.push_back(onft::schema::make_bytes(std::to_string(i)));
  }
  return payloads;
}

/// Copy of `source` with `mutate` applied to its records, bypassing push.
template <typename Mutate>
onft::chain::chain tampered_copy(const onft::chain::chain& source,
                                 Mutate&& mutate) {
  auto records = source.records();
  std::forward<Mutate>(mutate)(records);
  return onft::chain::chain::from_records(std::move(records),
                                          source.options());
}

}  // namespace onft::testing
