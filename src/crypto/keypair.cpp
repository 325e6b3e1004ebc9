#include <onft/crypto/keypair.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace onft::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

ed25519_keypair::ed25519_keypair(
    evp_pkey_ptr pkey,
    const onft::schema::ed25519_public_key_t& public_key)
    : pkey_{std::move(pkey)}, public_key_{public_key} {}

std::optional<ed25519_keypair> ed25519_keypair::from_pkey(evp_pkey_ptr pkey) {
  auto public_key = onft::schema::ed25519_public_key_t{};
  auto public_key_size = public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), public_key.data(),
                                  &public_key_size) != 1 ||
      public_key_size != public_key.size()) {
    spdlog::error("Unable to extract ed25519 public key");
    return std::nullopt;
  }
  return ed25519_keypair{std::move(pkey), public_key};
}

std::optional<ed25519_keypair> ed25519_keypair::generate() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    spdlog::error("OpenSSL ed25519 key generation unavailable");
    return std::nullopt;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_keygen(ctx.get(), &raw_pkey) != 1) {
    spdlog::error("OpenSSL ed25519 key generation failed");
    return std::nullopt;
  }
  return from_pkey(evp_pkey_ptr{raw_pkey, EVP_PKEY_free});
}

std::optional<ed25519_keypair> ed25519_keypair::from_private_key(
    const onft::schema::ed25519_private_key_t& private_key) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                   private_key.data(), private_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    spdlog::error("Rejected ed25519 private key");
    return std::nullopt;
  }
  return from_pkey(std::move(pkey));
}

const onft::schema::ed25519_public_key_t& ed25519_keypair::public_key() const {
  return public_key_;
}

std::optional<onft::schema::ed25519_private_key_t>
ed25519_keypair::private_key() const {
  auto private_key = onft::schema::ed25519_private_key_t{};
  auto private_key_size = private_key.size();
  if (EVP_PKEY_get_raw_private_key(pkey_.get(), private_key.data(),
                                   &private_key_size) != 1 ||
      private_key_size != private_key.size()) {
    return std::nullopt;
  }
  return private_key;
}

std::optional<onft::schema::ed25519_signature_t> ed25519_keypair::sign(
    const onft::schema::bytes_view_t& message) const {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey_.get()) !=
      1) {
    return std::nullopt;
  }

  auto signature = onft::schema::ed25519_signature_t{};
  auto signature_size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &signature_size,
                     message.data(), message.size()) != 1 ||
      signature_size != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

}  // namespace onft::crypto
