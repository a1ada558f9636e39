#include <warden/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

// Half the group order of each curve. Signatures with a larger s are the
// malleated twin of a valid one.
constexpr auto kSecp256k1HalfOrder = std::string_view{
    "7FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF5D576E7357A4501DDFE92F46681B20A0"};
constexpr auto kSecp256r1HalfOrder = std::string_view{
    "7FFFFFFF800000007FFFFFFFFFFFFFFFDE737D56D38BCF4279DCE5617E3192A8"};

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx) {
    return false;
  }
  return true;
}

bool openssl_has_ec() {
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!ctx) {
    return false;
  }
  return true;
}

bool verify_ed25519(const warden::schema::bytes_view_t& message,
                    const ed25519_signer_id& signer,
                    const signature64_t& signature) {
  auto pkey =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               signer.public_key.data(),
                                               signer.public_key.size()),
                   EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

bool is_low_s(const BIGNUM* s, const std::string_view half_order_hex) {
  auto* raw_half = static_cast<BIGNUM*>(nullptr);
  auto half_order_str = std::string{half_order_hex};
  if (BN_hex2bn(&raw_half, half_order_str.c_str()) == 0) {
    return false;
  }
  auto half_order = bignum_ptr{raw_half, BN_free};
  return BN_cmp(s, half_order.get()) <= 0;
}

bool verify_ecdsa(const warden::schema::bytes_view_t& message,
                  const char* group, const std::string_view half_order_hex,
                  const compressed_ec_public_key_t& public_key,
                  const signature64_t& signature) {
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx) {
    return false;
  }

  if (EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return false;
  }

  auto* group_name = const_cast<char*>(group);
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(public_key.data()),
                     public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return false;
  }
  auto pkey = evp_pkey_ptr{raw_pkey, EVP_PKEY_free};

  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return false;
  }

  auto r = bignum_ptr{BN_bin2bn(signature.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(signature.data() + 32, 32, nullptr), BN_free};
  if (!r || !s || !is_low_s(s.get(), half_order_hex) ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.release(), s.release()) != 1) {
    return false;
  }

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return false;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr);

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                           pkey.get()) == 1) {
    ok = EVP_DigestVerify(ctx.get(), der.data(), der.size(), message.data(),
                          message.size()) == 1;
  }
  return ok;
}

}  // namespace

bool available() {
  static const auto available_now = openssl_has_ed25519() && openssl_has_ec();
  return available_now;
}

bool verify_signature(const warden::schema::bytes_view_t& message,
                      const signer_id_t& signer,
                      const signature64_t& signature) {
  return std::visit(
      overloaded{[&](const ed25519_signer_id& value) {
                   return verify_ed25519(message, value, signature);
                 },
                 [&](const secp256k1_signer_id& value) {
                   return verify_ecdsa(message, "secp256k1",
                                       kSecp256k1HalfOrder, value.public_key,
                                       signature);
                 },
                 [&](const secp256r1_signer_id& value) {
                   return verify_ecdsa(message, "prime256v1",
                                       kSecp256r1HalfOrder, value.public_key,
                                       signature);
                 }},
      signer);
}

}  // namespace warden::crypto
