#pragma once

#include <onft/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: digest algorithm.
// Hash function a chain uses for every record digest. Fixed per chain.
namespace onft::schema {

enum class digest_algorithm : uint8_t {
  blake3 = 0,
  sha256 = 1,
};

inline constexpr auto kDigestAlgorithmMappings = std::array{
    std::pair<std::string_view, digest_algorithm>{"blake3",
                                                  digest_algorithm::blake3},
    std::pair<std::string_view, digest_algorithm>{"sha256",
                                                  digest_algorithm::sha256},
};

template <>
inline std::optional<digest_algorithm> try_from_string<digest_algorithm>(
    const std::string_view value) {
  return from_string(value, kDigestAlgorithmMappings);
}

inline constexpr std::string_view to_string(const digest_algorithm value) {
  return to_string(value, kDigestAlgorithmMappings).value_or("unknown");
}

inline std::optional<digest_algorithm> try_make_digest_algorithm(
    const uint8_t raw) {
  switch (raw) {
    case static_cast<uint8_t>(digest_algorithm::blake3):
      return digest_algorithm::blake3;
    case static_cast<uint8_t>(digest_algorithm::sha256):
      return digest_algorithm::sha256;
    default:
      return std::nullopt;
  }
}

}  // namespace onft::schema
