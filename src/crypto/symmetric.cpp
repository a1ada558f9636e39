#include <warden/crypto/symmetric.hpp>

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

#include <memory>

namespace warden::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_cipher_ctx_ptr =
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

}  // namespace

warden::schema::hash32_t sha256(const warden::schema::bytes_view_t& bytes) {
  auto out = warden::schema::hash32_t{};
  auto size = static_cast<unsigned int>(out.size());
  EVP_Digest(bytes.data(), bytes.size(), out.data(), &size, EVP_sha256(),
             nullptr);
  return out;
}

std::optional<warden::schema::bytes_t> hkdf_sha256(
    const warden::schema::bytes_view_t& ikm,
    const warden::schema::bytes_view_t& salt,
    const warden::schema::bytes_view_t& info, const std::size_t length) {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_derive_init(ctx.get()) != 1 ||
      EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) != 1 ||
      EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), ikm.data(),
                                 static_cast<int>(ikm.size())) != 1) {
    return std::nullopt;
  }
  if (!salt.empty() &&
      EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt.data(),
                                  static_cast<int>(salt.size())) != 1) {
    return std::nullopt;
  }
  if (!info.empty() &&
      EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), info.data(),
                                  static_cast<int>(info.size())) != 1) {
    return std::nullopt;
  }
  auto out = warden::schema::bytes_t(length);
  auto out_size = out.size();
  if (EVP_PKEY_derive(ctx.get(), out.data(), &out_size) != 1 ||
      out_size != length) {
    return std::nullopt;
  }
  return out;
}

std::optional<warden::schema::bytes_t> random_bytes(const std::size_t length) {
  auto out = warden::schema::bytes_t(length);
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    return std::nullopt;
  }
  return out;
}

std::optional<warden::schema::bytes_t> aes256_gcm_seal(
    const aes256_key_t& key, const warden::schema::bytes_view_t& plaintext,
    const warden::schema::bytes_view_t& aad) {
  auto nonce = random_bytes(kAesGcmNonceSize);
  if (!nonce) {
    return std::nullopt;
  }
  auto ctx = evp_cipher_ctx_ptr{EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free};
  if (!ctx ||
      EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(),
                         nonce->data()) != 1) {
    return std::nullopt;
  }
  auto length = 0;
  if (!aad.empty() &&
      EVP_EncryptUpdate(ctx.get(), nullptr, &length, aad.data(),
                        static_cast<int>(aad.size())) != 1) {
    return std::nullopt;
  }

  auto out = *nonce;
  out.resize(kAesGcmNonceSize + plaintext.size() + kAesGcmTagSize);
  auto* cipher = out.data() + kAesGcmNonceSize;
  if (EVP_EncryptUpdate(ctx.get(), cipher, &length, plaintext.data(),
                        static_cast<int>(plaintext.size())) != 1) {
    return std::nullopt;
  }
  auto final_length = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), cipher + length, &final_length) != 1) {
    return std::nullopt;
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          static_cast<int>(kAesGcmTagSize),
                          out.data() + kAesGcmNonceSize + plaintext.size()) !=
      1) {
    return std::nullopt;
  }
  return out;
}

std::optional<warden::schema::bytes_t> aes256_gcm_open(
    const aes256_key_t& key, const warden::schema::bytes_view_t& sealed,
    const warden::schema::bytes_view_t& aad) {
  if (sealed.size() < kAesGcmNonceSize + kAesGcmTagSize) {
    return std::nullopt;
  }
  auto nonce = sealed.first(kAesGcmNonceSize);
  auto cipher = sealed.subspan(kAesGcmNonceSize, sealed.size() -
                                                     kAesGcmNonceSize -
                                                     kAesGcmTagSize);
  auto tag = sealed.last(kAesGcmTagSize);

  auto ctx = evp_cipher_ctx_ptr{EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free};
  if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr,
                                 key.data(), nonce.data()) != 1) {
    return std::nullopt;
  }
  auto length = 0;
  if (!aad.empty() &&
      EVP_DecryptUpdate(ctx.get(), nullptr, &length, aad.data(),
                        static_cast<int>(aad.size())) != 1) {
    return std::nullopt;
  }
  auto out = warden::schema::bytes_t(cipher.size());
  if (EVP_DecryptUpdate(ctx.get(), out.data(), &length, cipher.data(),
                        static_cast<int>(cipher.size())) != 1) {
    return std::nullopt;
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          static_cast<int>(tag.size()),
                          const_cast<uint8_t*>(tag.data())) != 1) {
    return std::nullopt;
  }
  auto final_length = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), out.data() + length, &final_length) !=
      1) {
    return std::nullopt;
  }
  return out;
}

}  // namespace warden::crypto
