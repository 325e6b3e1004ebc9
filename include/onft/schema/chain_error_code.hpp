#pragma once

#include <onft/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace onft::schema {

enum class chain_error_code : uint32_t {
  capacity_exceeded = 1,
  index_overflow = 2,
  malformed_chain = 3,
  signing_failed = 4,
};

inline constexpr auto kChainErrorCodeMappings = std::array{
    std::pair<std::string_view, chain_error_code>{
        "capacity_exceeded", chain_error_code::capacity_exceeded},
    std::pair<std::string_view, chain_error_code>{
        "index_overflow", chain_error_code::index_overflow},
    std::pair<std::string_view, chain_error_code>{
        "malformed_chain", chain_error_code::malformed_chain},
    std::pair<std::string_view, chain_error_code>{
        "signing_failed", chain_error_code::signing_failed},
};

inline constexpr std::string_view to_string(const chain_error_code value) {
  return to_string(value, kChainErrorCodeMappings).value_or("unknown");
}

/// capacity_exceeded and index_overflow both mean the chain cannot grow.
inline constexpr bool is_capacity_error(const chain_error_code value) {
  return value == chain_error_code::capacity_exceeded ||
         value == chain_error_code::index_overflow;
}

struct chain_error_t final {
  chain_error_code code{};
  std::string message;
};

}  // namespace onft::schema
