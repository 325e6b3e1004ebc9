#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <iterator>
#include <onft/chain/chain.hpp>
#include <onft/crypto/verify.hpp>
#include <onft/digest/digest.hpp>
#include <utility>

using namespace onft::schema;

namespace {

bytes_view_t digest_view(const digest_t& digest) {
  return bytes_view_t{digest.data(), digest.size()};
}

bool ownership_valid(const record_t& record) {
  if (!record.ownership.has_value()) {
    return true;
  }
  return onft::crypto::verify_ed25519(digest_view(record.self_digest),
                                      record.ownership->owner,
                                      record.ownership->signature);
}

verify_failure check_genesis(const digest_algorithm algorithm,
                             const record_t& genesis) {
  if (genesis.index != 0 ||
      genesis.prev_digest != onft::digest::genesis_sentinel() ||
      genesis.ownership.has_value()) {
    return verify_failure::genesis_invalid;
  }
  if (onft::digest::record_digest(algorithm, genesis) != genesis.self_digest) {
    return verify_failure::digest_mismatch;
  }
  return verify_failure::none;
}

verify_failure check_successor(const digest_algorithm algorithm,
                               const uint64_t position,
                               const record_t& previous,
                               const record_t& current) {
  if (current.index != position || current.index != previous.index + 1) {
    return verify_failure::index_gap;
  }
  if (current.prev_digest != previous.self_digest) {
    return verify_failure::linkage_mismatch;
  }
  if (onft::digest::record_digest(algorithm, current) != current.self_digest) {
    return verify_failure::digest_mismatch;
  }
  if (current.timestamp < previous.timestamp) {
    return verify_failure::timestamp_regression;
  }
  if (!ownership_valid(current)) {
    return verify_failure::ownership_invalid;
  }
  return verify_failure::none;
}

}  // namespace

namespace onft::chain {

timestamp_milliseconds_t system_clock_milliseconds() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

chain::chain() : chain(chain_options{}) {}

chain::chain(chain_options options, clock_fn_t clock)
    : options_{options}, clock_{std::move(clock)} {
  if (!clock_) {
    clock_ = system_clock_milliseconds;
  }
  records_.push_back(
      make_record(0, bytes_t{}, onft::digest::genesis_sentinel(), 0));
  spdlog::debug("Created {} chain with genesis {}",
                to_string(options_.algorithm),
                to_hex(records_.front().self_digest));
}

chain::chain(adopt_records_tag,
             std::vector<record_t> records,
             chain_options options,
             clock_fn_t clock)
    : records_{std::move(records)},
      options_{options},
      clock_{std::move(clock)} {
  if (!clock_) {
    clock_ = system_clock_milliseconds;
  }
}

chain chain::from_records(std::vector<record_t> records,
                          chain_options options,
                          clock_fn_t clock) {
  return chain{adopt_records_tag{}, std::move(records), options,
               std::move(clock)};
}

std::optional<chain_error_t> chain::check_appendable() const {
  if (records_.empty()) {
    spdlog::error("Refusing append: chain has no genesis record");
    return chain_error_t{.code = chain_error_code::malformed_chain,
                         .message = "chain has no genesis record"};
  }
  if (records_.size() >= options_.max_length) {
    spdlog::warn("Refusing append: chain holds {} of {} records",
                 records_.size(), options_.max_length);
    return chain_error_t{.code = chain_error_code::capacity_exceeded,
                         .message = "chain reached its maximum length"};
  }
  if (records_.back().index == std::numeric_limits<uint64_t>::max()) {
    spdlog::warn("Refusing append: record index counter exhausted");
    return chain_error_t{.code = chain_error_code::index_overflow,
                         .message = "record index would overflow"};
  }
  return std::nullopt;
}

record_t chain::make_record(const uint64_t index,
                            bytes_t payload,
                            const digest_t& prev_digest,
                            const timestamp_milliseconds_t not_before) const {
  auto record = record_t{};
  record.index = index;
  record.timestamp = std::max(clock_(), not_before);
  record.payload = std::move(payload);
  record.prev_digest = prev_digest;
  record.self_digest = onft::digest::record_digest(
      options_.algorithm, record.index, record.timestamp, record.payload,
      record.prev_digest);
  return record;
}

push_result chain::push(const bytes_view_t& payload) {
  auto result = push_result{};
  if (auto error = check_appendable()) {
    result.error = std::move(error);
    return result;
  }

  const auto& last = records_.back();
  auto record = make_record(last.index + 1, make_bytes(payload),
                            last.self_digest, last.timestamp);
  result.index = record.index;
  records_.push_back(std::move(record));
  spdlog::debug("Appended record {} ({} payload bytes)", result.index,
                payload.size());
  return result;
}

push_result chain::push(const std::string_view& payload) {
  return push(make_bytes_view(payload));
}

push_result chain::push_signed(const bytes_view_t& payload,
                               const onft::crypto::ed25519_keypair& owner) {
  auto result = push_result{};
  if (auto error = check_appendable()) {
    result.error = std::move(error);
    return result;
  }

  const auto& last = records_.back();
  auto record = make_record(last.index + 1, make_bytes(payload),
                            last.self_digest, last.timestamp);
  auto signature = owner.sign(digest_view(record.self_digest));
  if (!signature.has_value()) {
    spdlog::error("Unable to sign record {}; chain left unchanged",
                  record.index);
    result.error =
        chain_error_t{.code = chain_error_code::signing_failed,
                      .message = "ed25519 signing of record digest failed"};
    return result;
  }
  record.ownership =
      ownership_t{.owner = owner.public_key(), .signature = *signature};

  result.index = record.index;
  records_.push_back(std::move(record));
  spdlog::debug("Appended signed record {} owned by {}", result.index,
                to_hex(bytes_view_t{owner.public_key().data(),
                                    owner.public_key().size()}));
  return result;
}

push_result chain::extend(const std::vector<bytes_t>& payloads) {
  auto result = push_result{};
  if (!records_.empty()) {
    result.index = records_.back().index;
  }
  for (const auto& payload : payloads) {
    result = push(make_bytes_view(payload));
    if (!result.ok()) {
      break;
    }
  }
  return result;
}

verify_result chain::verify() const {
  auto result = verify_result{};
  if (records_.empty()) {
    spdlog::error("Cannot verify chain: no genesis record");
    result.error =
        chain_error_t{.code = chain_error_code::malformed_chain,
                      .message = "chain has no genesis record to verify from"};
    return result;
  }

  auto note = [&](const uint64_t position, const verify_failure failure) {
    if (failure == verify_failure::none) {
      return;
    }
    ++result.failure_count;
    if (!result.first_failure_index.has_value()) {
      result.first_failure_index = position;
      result.first_failure = failure;
    }
    spdlog::warn("Record {} failed verification: {}", position,
                 to_string(failure));
  };

  note(0, check_genesis(options_.algorithm, records_.front()));
  for (uint64_t position = 1; position < records_.size(); ++position) {
    note(position, check_successor(options_.algorithm, position,
                                   records_[position - 1],
                                   records_[position]));
  }

  result.records_checked = records_.size();
  result.verified = result.failure_count == 0;
  if (result.verified) {
    spdlog::debug("Verified {} record(s)", result.records_checked);
  } else {
    spdlog::warn("Chain verification failed on {} of {} record(s)",
                 result.failure_count, result.records_checked);
  }
  return result;
}

std::optional<uint64_t> chain::find(const chain_query_t& query) const {
  auto matches = [&](const record_t& record) {
    return std::visit(
        overloaded{
            [&](const query_by_digest& value) {
              return record.self_digest == value.digest;
            },
            [&](const query_by_owner& value) {
              return record.ownership.has_value() &&
                     record.ownership->owner == value.owner;
            },
            [&](const query_by_signature& value) {
              return record.ownership.has_value() &&
                     record.ownership->signature == value.signature;
            }},
        query);
  };

  auto it = std::find_if(std::begin(records_), std::end(records_), matches);
  if (it == std::end(records_)) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(std::distance(std::begin(records_), it));
}

const record_t& chain::at(const uint64_t index) const {
  return records_.at(index);
}

}  // namespace onft::chain
