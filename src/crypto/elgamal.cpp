#include <warden/crypto/elgamal.hpp>
#include <warden/crypto/symmetric.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace warden::crypto::elgamal {

namespace {

constexpr auto kSealInfo = std::string_view{"WARDEN-ELGAMAL-BLS12381-SEAL-00"};

std::optional<aes256_key_t> derive_key(const bls12381::g1_t& shared,
                                       const bls12381::g1_t& ephemeral) {
  auto ikm = bls12381::to_bytes(shared);
  auto salt = bls12381::to_bytes(ephemeral);
  auto okm = hkdf_sha256(ikm, salt, warden::schema::make_bytes_view(kSealInfo),
                         32);
  if (!okm) {
    return std::nullopt;
  }
  auto key = aes256_key_t{};
  std::copy(std::begin(*okm), std::end(*okm), std::begin(key));
  return key;
}

}  // namespace

keypair_t generate_keypair() {
  auto secret_key = bls12381::random_scalar();
  return keypair_t{
      .secret_key = secret_key,
      .public_key = bls12381::mul(bls12381::g1_generator(), secret_key),
      .verification_key = bls12381::mul(bls12381::g2_generator(), secret_key)};
}

bool verify_keys(const public_key_t& public_key,
                 const verification_key_t& verification_key) {
  return bls12381::pairing(public_key, bls12381::g2_generator()) ==
         bls12381::pairing(bls12381::g1_generator(), verification_key);
}

ciphertext_t encrypt(const public_key_t& public_key,
                     const bls12381::g1_t& message) {
  auto r = bls12381::random_scalar();
  return ciphertext_t{
      .c1 = bls12381::mul(bls12381::g1_generator(), r),
      .c2 = bls12381::add(bls12381::mul(public_key, r), message)};
}

bls12381::g1_t decrypt(const secret_key_t& secret_key,
                       const ciphertext_t& ciphertext) {
  return bls12381::sub(ciphertext.c2, bls12381::mul(ciphertext.c1, secret_key));
}

std::optional<sealed_box_t> seal(const public_key_t& public_key,
                                 const warden::schema::bytes_view_t& plaintext) {
  auto r = bls12381::random_scalar();
  auto ephemeral = bls12381::mul(bls12381::g1_generator(), r);
  auto key = derive_key(bls12381::mul(public_key, r), ephemeral);
  if (!key) {
    return std::nullopt;
  }
  auto aad = bls12381::to_bytes(ephemeral);
  auto sealed = aes256_gcm_seal(*key, plaintext, aad);
  if (!sealed) {
    return std::nullopt;
  }
  return sealed_box_t{.ephemeral = ephemeral, .sealed = std::move(*sealed)};
}

std::optional<warden::schema::bytes_t> open(const secret_key_t& secret_key,
                                            const sealed_box_t& box) {
  auto key = derive_key(bls12381::mul(box.ephemeral, secret_key), box.ephemeral);
  if (!key) {
    return std::nullopt;
  }
  auto aad = bls12381::to_bytes(box.ephemeral);
  return aes256_gcm_open(*key, box.sealed, aad);
}

warden::schema::bytes_t encode(const sealed_box_t& box) {
  auto ephemeral = bls12381::to_bytes(box.ephemeral);
  auto out = warden::schema::bytes_t{std::begin(ephemeral), std::end(ephemeral)};
  out.insert(std::end(out), std::begin(box.sealed), std::end(box.sealed));
  return out;
}

std::optional<sealed_box_t> try_decode(
    const warden::schema::bytes_view_t& bytes) {
  if (bytes.size() < bls12381::kG1Size) {
    return std::nullopt;
  }
  auto ephemeral = bls12381::try_g1_from_bytes(bytes.first(bls12381::kG1Size));
  if (!ephemeral) {
    return std::nullopt;
  }
  return sealed_box_t{
      .ephemeral = *ephemeral,
      .sealed = warden::schema::make_bytes(bytes.subspan(bls12381::kG1Size))};
}

}  // namespace warden::crypto::elgamal
