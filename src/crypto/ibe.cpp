#include <warden/crypto/ibe.hpp>
#include <warden/crypto/symmetric.hpp>

#include <algorithm>
#include <iterator>

namespace warden::crypto::ibe {

namespace {

constexpr auto kKemInfo = std::string_view{"WARDEN-IBE-BLS12381-KEM-00"};

std::optional<aes256_key_t> derive_key(const bls12381::gt_t& shared,
                                       const bls12381::g2_t& nonce,
                                       const warden::schema::bytes_view_t& id) {
  auto ikm = bls12381::to_bytes(shared);
  auto salt = bls12381::to_bytes(nonce);
  auto info = warden::schema::make_bytes(kKemInfo);
  info.insert(std::end(info), std::begin(id), std::end(id));
  auto okm = hkdf_sha256(ikm, salt, info, 32);
  if (!okm) {
    return std::nullopt;
  }
  auto key = aes256_key_t{};
  std::copy(std::begin(*okm), std::end(*okm), std::begin(key));
  return key;
}

}  // namespace

master_keypair_t generate_master_keypair() {
  auto master_key = bls12381::random_scalar();
  return master_keypair_t{.master_key = master_key,
                          .public_key = public_key_from(master_key)};
}

public_key_t public_key_from(const master_key_t& master_key) {
  return bls12381::mul(bls12381::g2_generator(), master_key);
}

warden::schema::bytes_t make_key_id(
    const warden::schema::object_id_t& namespace_prefix,
    const warden::schema::bytes_view_t& identity) {
  auto out = warden::schema::bytes_t{};
  out.reserve(namespace_prefix.size() + identity.size());
  out.insert(std::end(out), std::begin(namespace_prefix),
             std::end(namespace_prefix));
  out.insert(std::end(out), std::begin(identity), std::end(identity));
  return out;
}

user_secret_key_t extract(const master_key_t& master_key,
                          const warden::schema::bytes_view_t& id) {
  return bls12381::mul(bls12381::hash_to_g1(id), master_key);
}

bool verify_user_secret_key(const user_secret_key_t& usk,
                            const warden::schema::bytes_view_t& id,
                            const public_key_t& public_key) {
  return bls12381::pairing(usk, bls12381::g2_generator()) ==
         bls12381::pairing(bls12381::hash_to_g1(id), public_key);
}

proof_of_possession_t create_proof_of_possession(
    const master_key_t& master_key,
    const warden::schema::bytes_view_t& message) {
  auto public_key = bls12381::to_bytes(public_key_from(master_key));
  auto full = warden::schema::make_bytes(kProofOfPossessionDst);
  full.insert(std::end(full), std::begin(public_key), std::end(public_key));
  full.insert(std::end(full), std::begin(message), std::end(message));
  return extract(master_key, full);
}

bool verify_proof_of_possession(const proof_of_possession_t& pop,
                                const public_key_t& public_key,
                                const warden::schema::bytes_view_t& message) {
  auto public_key_bytes = bls12381::to_bytes(public_key);
  auto full = warden::schema::make_bytes(kProofOfPossessionDst);
  full.insert(std::end(full), std::begin(public_key_bytes),
              std::end(public_key_bytes));
  full.insert(std::end(full), std::begin(message), std::end(message));
  return verify_user_secret_key(pop, full, public_key);
}

std::optional<ciphertext_t> encrypt(
    const public_key_t& public_key, const warden::schema::bytes_view_t& id,
    const warden::schema::bytes_view_t& plaintext) {
  auto r = bls12381::random_scalar();
  auto nonce = bls12381::mul(bls12381::g2_generator(), r);
  auto shared =
      bls12381::pairing(bls12381::mul(bls12381::hash_to_g1(id), r), public_key);
  auto key = derive_key(shared, nonce, id);
  if (!key) {
    return std::nullopt;
  }
  auto sealed = aes256_gcm_seal(*key, plaintext, id);
  if (!sealed) {
    return std::nullopt;
  }
  return ciphertext_t{.nonce = nonce, .sealed = std::move(*sealed)};
}

std::optional<warden::schema::bytes_t> decrypt(
    const user_secret_key_t& usk, const warden::schema::bytes_view_t& id,
    const ciphertext_t& ciphertext) {
  auto shared = bls12381::pairing(usk, ciphertext.nonce);
  auto key = derive_key(shared, ciphertext.nonce, id);
  if (!key) {
    return std::nullopt;
  }
  return aes256_gcm_open(*key, ciphertext.sealed, id);
}

warden::schema::bytes_t encode(const ciphertext_t& ciphertext) {
  auto nonce = bls12381::to_bytes(ciphertext.nonce);
  auto out = warden::schema::bytes_t{std::begin(nonce), std::end(nonce)};
  out.insert(std::end(out), std::begin(ciphertext.sealed),
             std::end(ciphertext.sealed));
  return out;
}

std::optional<ciphertext_t> try_decode(
    const warden::schema::bytes_view_t& bytes) {
  if (bytes.size() < bls12381::kG2Size) {
    return std::nullopt;
  }
  auto nonce = bls12381::try_g2_from_bytes(bytes.first(bls12381::kG2Size));
  if (!nonce) {
    return std::nullopt;
  }
  return ciphertext_t{
      .nonce = *nonce,
      .sealed = warden::schema::make_bytes(bytes.subspan(bls12381::kG2Size))};
}

}  // namespace warden::crypto::ibe
