#pragma once

#include <onft/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: verify failure.
// First integrity check a record failed during chain verification.
namespace onft::schema {

enum class verify_failure : uint16_t {
  none = 0,
  genesis_invalid = 1,
  index_gap = 2,
  linkage_mismatch = 3,
  digest_mismatch = 4,
  timestamp_regression = 5,
  ownership_invalid = 6,
};

inline constexpr auto kVerifyFailureMappings = std::array{
    std::pair<std::string_view, verify_failure>{"none", verify_failure::none},
    std::pair<std::string_view, verify_failure>{
        "genesis_invalid", verify_failure::genesis_invalid},
    std::pair<std::string_view, verify_failure>{"index_gap",
                                                verify_failure::index_gap},
    std::pair<std::string_view, verify_failure>{
        "linkage_mismatch", verify_failure::linkage_mismatch},
    std::pair<std::string_view, verify_failure>{
        "digest_mismatch", verify_failure::digest_mismatch},
    std::pair<std::string_view, verify_failure>{
        "timestamp_regression", verify_failure::timestamp_regression},
    std::pair<std::string_view, verify_failure>{
        "ownership_invalid", verify_failure::ownership_invalid},
};

inline constexpr std::string_view to_string(const verify_failure value) {
  return to_string(value, kVerifyFailureMappings).value_or("unknown");
}

}  // namespace onft::schema
