#pragma once

#include <onft/schema/primitives.hpp>

namespace onft::crypto {

/// True when the OpenSSL build exposes ed25519.
bool available();

bool verify_ed25519(const onft::schema::bytes_view_t& message,
                    const onft::schema::ed25519_public_key_t& public_key,
                    const onft::schema::ed25519_signature_t& signature);

}  // namespace onft::crypto
