#pragma once

#include <warden/crypto/bls12381.hpp>
#include <warden/schema/primitives.hpp>

#include <optional>

// ElGamal over G1, used to hand derived IBE keys back to exactly one caller.
namespace warden::crypto::elgamal {

using secret_key_t = bls12381::scalar_t;
using public_key_t = bls12381::g1_t;
using verification_key_t = bls12381::g2_t;

struct keypair_t final {
  secret_key_t secret_key;
  public_key_t public_key;
  verification_key_t verification_key;
};

struct ciphertext_t final {
  bls12381::g1_t c1;
  bls12381::g1_t c2;
};

keypair_t generate_keypair();

/// `pk = sk * G1` and `vk = sk * G2` for the same `sk`:
/// `e(pk, G2) == e(G1, vk)`.
bool verify_keys(const public_key_t& public_key,
                 const verification_key_t& verification_key);

/// `(r * G1, r * pk + message)` with a fresh `r` per call.
ciphertext_t encrypt(const public_key_t& public_key,
                     const bls12381::g1_t& message);

bls12381::g1_t decrypt(const secret_key_t& secret_key,
                       const ciphertext_t& ciphertext);

/// Byte payloads sealed to an ElGamal public key: hashed ElGamal on G1 with
/// HKDF-SHA256 and AES-256-GCM.
struct sealed_box_t final {
  bls12381::g1_t ephemeral;
  warden::schema::bytes_t sealed;
};

std::optional<sealed_box_t> seal(const public_key_t& public_key,
                                 const warden::schema::bytes_view_t& plaintext);

std::optional<warden::schema::bytes_t> open(const secret_key_t& secret_key,
                                            const sealed_box_t& box);

/// Wire form: 48-byte compressed ephemeral point followed by the AEAD output.
warden::schema::bytes_t encode(const sealed_box_t& box);
std::optional<sealed_box_t> try_decode(const warden::schema::bytes_view_t& bytes);

}  // namespace warden::crypto::elgamal
