#pragma once

#include <warden/crypto/bls12381.hpp>
#include <warden/schema/primitives.hpp>

#include <optional>
#include <string_view>

// Boneh-Franklin identity-based encryption with master public keys in G2 and
// user secret keys in G1.
namespace warden::crypto::ibe {

using master_key_t = bls12381::scalar_t;
using public_key_t = bls12381::g2_t;
using user_secret_key_t = bls12381::g1_t;
using proof_of_possession_t = bls12381::g1_t;

inline constexpr auto kProofOfPossessionDst =
    std::string_view{"SUI-SEAL-IBE-BLS12381-POP-00"};

struct master_keypair_t final {
  master_key_t master_key;
  public_key_t public_key;
};

master_keypair_t generate_master_keypair();

public_key_t public_key_from(const master_key_t& master_key);

/// `namespace_prefix || identity`. The prefix is a fixed-width object id, so
/// distinct (prefix, identity) pairs never collide.
warden::schema::bytes_t make_key_id(
    const warden::schema::object_id_t& namespace_prefix,
    const warden::schema::bytes_view_t& identity);

/// `master_key * H1(id)`. Deterministic in both inputs.
user_secret_key_t extract(const master_key_t& master_key,
                          const warden::schema::bytes_view_t& id);

/// `e(usk, G2) == e(H1(id), pk)`.
bool verify_user_secret_key(const user_secret_key_t& usk,
                            const warden::schema::bytes_view_t& id,
                            const public_key_t& public_key);

proof_of_possession_t create_proof_of_possession(
    const master_key_t& master_key, const warden::schema::bytes_view_t& message);

bool verify_proof_of_possession(const proof_of_possession_t& pop,
                                const public_key_t& public_key,
                                const warden::schema::bytes_view_t& message);

struct ciphertext_t final {
  bls12381::g2_t nonce;
  // AES-256-GCM output: nonce || ciphertext || tag.
  warden::schema::bytes_t sealed;
};

std::optional<ciphertext_t> encrypt(const public_key_t& public_key,
                                    const warden::schema::bytes_view_t& id,
                                    const warden::schema::bytes_view_t& plaintext);

std::optional<warden::schema::bytes_t> decrypt(
    const user_secret_key_t& usk, const warden::schema::bytes_view_t& id,
    const ciphertext_t& ciphertext);

/// Wire form: 96-byte compressed nonce followed by the sealed payload.
warden::schema::bytes_t encode(const ciphertext_t& ciphertext);
std::optional<ciphertext_t> try_decode(const warden::schema::bytes_view_t& bytes);

}  // namespace warden::crypto::ibe
