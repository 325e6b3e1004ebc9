#pragma once

#include <onft/schema/primitives.hpp>

#include <variant>

namespace onft::chain {

struct query_by_digest final {
  onft::schema::digest_t digest{};
};

struct query_by_owner final {
  onft::schema::ed25519_public_key_t owner{};
};

struct query_by_signature final {
  onft::schema::ed25519_signature_t signature{};
};

using chain_query_t =
    std::variant<query_by_digest, query_by_owner, query_by_signature>;

}  // namespace onft::chain
