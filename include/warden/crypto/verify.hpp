#pragma once

#include <warden/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <variant>

namespace warden::crypto {

using ed25519_public_key_t = std::array<uint8_t, 32>;
using compressed_ec_public_key_t = std::array<uint8_t, 33>;
using signature64_t = std::array<uint8_t, 64>;

struct ed25519_signer_id final {
  ed25519_public_key_t public_key{};
};

struct secp256k1_signer_id final {
  compressed_ec_public_key_t public_key{};
};

struct secp256r1_signer_id final {
  compressed_ec_public_key_t public_key{};
};

using signer_id_t =
    std::variant<ed25519_signer_id, secp256k1_signer_id, secp256r1_signer_id>;

bool available();

/// Ed25519 verifies over the message itself. Both ECDSA curves verify a
/// compact `r || s` signature over SHA-256(message) and reject high-S
/// values, so every signature has exactly one accepted encoding.
bool verify_signature(const warden::schema::bytes_view_t& message,
                      const signer_id_t& signer,
                      const signature64_t& signature);

}  // namespace warden::crypto
