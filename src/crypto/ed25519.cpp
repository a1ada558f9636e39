#include <warden/crypto/ed25519.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>

namespace warden::crypto::ed25519 {

namespace {

using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

evp_pkey_ptr make_private_key(const seed_t& seed) {
  return evp_pkey_ptr{EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                   seed.data(), seed.size()),
                      EVP_PKEY_free};
}

}  // namespace

std::optional<keypair_t> keypair_from_seed(const seed_t& seed) {
  auto pkey = make_private_key(seed);
  if (!pkey) {
    return std::nullopt;
  }
  auto keypair = keypair_t{.seed = seed};
  auto size = keypair.public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), keypair.public_key.data(),
                                  &size) != 1 ||
      size != keypair.public_key.size()) {
    return std::nullopt;
  }
  return keypair;
}

std::optional<keypair_t> generate_keypair() {
  auto seed = seed_t{};
  if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
    return std::nullopt;
  }
  return keypair_from_seed(seed);
}

std::optional<signature64_t> sign(const keypair_t& keypair,
                                  const warden::schema::bytes_view_t& message) {
  auto pkey = make_private_key(keypair.seed);
  if (!pkey) {
    return std::nullopt;
  }
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    return std::nullopt;
  }
  auto signature = signature64_t{};
  auto size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                     message.size()) != 1 ||
      size != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

}  // namespace warden::crypto::ed25519
