#pragma once

#include <onft/schema/primitives.hpp>

#include <memory>
#include <optional>

#include <openssl/evp.h>

namespace onft::crypto {

/// Owned ed25519 private key used to sign records pushed onto a chain.
class ed25519_keypair final {
 public:
  /// Generate a fresh key pair, or std::nullopt if OpenSSL refuses.
  static std::optional<ed25519_keypair> generate();

  /// Import a raw 32 byte private key (seed).
  static std::optional<ed25519_keypair> from_private_key(
      const onft::schema::ed25519_private_key_t& private_key);

  ed25519_keypair(ed25519_keypair&&) noexcept = default;
  ed25519_keypair& operator=(ed25519_keypair&&) noexcept = default;
  ed25519_keypair(const ed25519_keypair&) = delete;
  ed25519_keypair& operator=(const ed25519_keypair&) = delete;
  ~ed25519_keypair() = default;

  const onft::schema::ed25519_public_key_t& public_key() const;
  std::optional<onft::schema::ed25519_private_key_t> private_key() const;

  std::optional<onft::schema::ed25519_signature_t> sign(
      const onft::schema::bytes_view_t& message) const;

 private:
  using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

  ed25519_keypair(evp_pkey_ptr pkey,
                  const onft::schema::ed25519_public_key_t& public_key);

  static std::optional<ed25519_keypair> from_pkey(evp_pkey_ptr pkey);

  evp_pkey_ptr pkey_;
  onft::schema::ed25519_public_key_t public_key_{};
};

}  // namespace onft::crypto
