#pragma once

#include <warden/crypto/ed25519.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/sui/signature.hpp>

#include <cstdint>
#include <optional>

namespace warden::testing {

inline warden::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = warden::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline warden::crypto::ed25519::keypair_t make_ed25519_keypair(
    const uint8_t seed) {
  auto bytes = warden::crypto::ed25519::seed_t{};
  bytes.fill(seed);
  return warden::crypto::ed25519::keypair_from_seed(bytes).value();
}

inline warden::crypto::signer_id_t signer_of(
    const warden::crypto::ed25519::keypair_t& keypair) {
  return warden::crypto::ed25519_signer_id{.public_key = keypair.public_key};
}

inline warden::schema::address_t address_of(
    const warden::crypto::ed25519::keypair_t& keypair) {
  return warden::sui::address_of(signer_of(keypair));
}

/// Serialized Ed25519 wallet signature over a personal message.
inline warden::schema::bytes_t sign_personal_message(
    const warden::crypto::ed25519::keypair_t& keypair,
    const warden::schema::bytes_view_t& message) {
  auto digest = warden::sui::personal_message_digest(message);
  auto signature = warden::crypto::ed25519::sign(keypair, digest).value();
  return warden::sui::serialize(warden::sui::simple_signature_t{
      .signer = signer_of(keypair), .signature = signature});
}

/// Flips one bit of `bytes` at `index`.
inline warden::schema::bytes_t flip_bit(warden::schema::bytes_t bytes,
                                        const std::size_t index,
                                        const uint8_t bit = 0) {
  bytes[index] ^= static_cast<uint8_t>(1u << bit);
  return bytes;
}

}  // namespace warden::testing
