#pragma once

#include <onft/schema/chain_error_code.hpp>
#include <onft/schema/verify_failure.hpp>

#include <cstdint>
#include <optional>

namespace onft::schema {

/// Outcome of an append. On success `index` is the position of the new tail.
struct push_result final {
  uint64_t index{};
  std::optional<chain_error_t> error;

  bool ok() const { return !error.has_value(); }
};

/// Outcome of a whole-chain verification.
///
/// `error` is set only when verification could not run at all (for example a
/// chain without a genesis record). Tampering is reported through `verified`
/// being false, never through `error`.
struct verify_result final {
  bool verified{};
  uint64_t records_checked{};
  uint64_t failure_count{};
  std::optional<uint64_t> first_failure_index;
  verify_failure first_failure{verify_failure::none};
  std::optional<chain_error_t> error;

  bool ok() const { return !error.has_value(); }
};

}  // namespace onft::schema
