#pragma once

#include <onft/chain/query.hpp>
#include <onft/crypto/keypair.hpp>
#include <onft/schema/chain_result.hpp>
#include <onft/schema/digest_algorithm.hpp>
#include <onft/schema/primitives.hpp>
#include <onft/schema/record.hpp>

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string_view>
#include <vector>

namespace onft::chain {

/// Source of record timestamps, in milliseconds since the Unix epoch.
using clock_fn_t = std::function<onft::schema::timestamp_milliseconds_t()>;

/// Reads std::chrono::system_clock.
onft::schema::timestamp_milliseconds_t system_clock_milliseconds();

struct chain_options final {
  /// Maximum number of records, genesis included.
  uint64_t max_length{std::numeric_limits<uint64_t>::max()};
  onft::schema::digest_algorithm algorithm{
      onft::schema::digest_algorithm::blake3};
};

/// Tamper-evident append-only sequence of records.
///
/// Every record stores the digest of its predecessor, so rewriting any field
/// of any record breaks either its own digest or the link from its successor.
/// A chain starts with a genesis record and only ever grows at the tail.
///
/// Not synchronized: `push` needs exclusive access, and `verify` must not
/// overlap a `push`. See `synchronized_chain` for a locked wrapper.
class chain final {
 public:
  using const_iterator = std::vector<onft::schema::record_t>::const_iterator;

  /// Genesis-only chain using BLAKE3 and the system clock.
  chain();
  explicit chain(chain_options options,
                 clock_fn_t clock = system_clock_milliseconds);

  /// Adopt externally built records (for example decoded ones) as-is.
  ///
  /// Nothing is validated here; call `verify()` on the result. This is the
  /// only way to obtain a chain without a genesis record.
  static chain from_records(std::vector<onft::schema::record_t> records,
                            chain_options options = {},
                            clock_fn_t clock = system_clock_milliseconds);

  /// Append one record holding `payload`.
  onft::schema::push_result push(const onft::schema::bytes_view_t& payload);
  onft::schema::push_result push(const std::string_view& payload);

  /// Append one record and attach `owner`'s signature over its digest.
  onft::schema::push_result push_signed(
      const onft::schema::bytes_view_t& payload,
      const onft::crypto::ed25519_keypair& owner);

  /// Push every payload in order, stopping at the first failure.
  onft::schema::push_result extend(
      const std::vector<onft::schema::bytes_t>& payloads);

  /// Check every record from genesis to tail.
  onft::schema::verify_result verify() const;

  /// Position of the first record matching `query`.
  std::optional<uint64_t> find(const chain_query_t& query) const;

  uint64_t size() const { return records_.size(); }
  bool empty() const { return records_.empty(); }

  /// Bounds-checked access; throws std::out_of_range.
  const onft::schema::record_t& at(uint64_t index) const;
  const onft::schema::record_t& operator[](uint64_t index) const {
    return records_[index];
  }
  const onft::schema::record_t& front() const { return records_.front(); }
  const onft::schema::record_t& back() const { return records_.back(); }

  const_iterator begin() const { return records_.begin(); }
  const_iterator end() const { return records_.end(); }

  const std::vector<onft::schema::record_t>& records() const {
    return records_;
  }
  const chain_options& options() const { return options_; }
  onft::schema::digest_algorithm algorithm() const {
    return options_.algorithm;
  }

 private:
  struct adopt_records_tag {};

  chain(adopt_records_tag,
        std::vector<onft::schema::record_t> records,
        chain_options options,
        clock_fn_t clock);

  /// Capacity/structure check shared by every append path.
  std::optional<onft::schema::chain_error_t> check_appendable() const;

  onft::schema::record_t make_record(uint64_t index,
                                     onft::schema::bytes_t payload,
                                     const onft::schema::digest_t& prev_digest,
                                     onft::schema::timestamp_milliseconds_t
                                         not_before) const;

  std::vector<onft::schema::record_t> records_;
  chain_options options_;
  clock_fn_t clock_;
};

}  // namespace onft::chain
