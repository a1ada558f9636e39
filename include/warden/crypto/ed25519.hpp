#pragma once

#include <warden/crypto/verify.hpp>
#include <warden/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>

namespace warden::crypto::ed25519 {

using seed_t = std::array<uint8_t, 32>;

struct keypair_t final {
  seed_t seed{};
  ed25519_public_key_t public_key{};
};

std::optional<keypair_t> keypair_from_seed(const seed_t& seed);

/// Fresh keypair from the OpenSSL CSPRNG.
std::optional<keypair_t> generate_keypair();

std::optional<signature64_t> sign(const keypair_t& keypair,
                                  const warden::schema::bytes_view_t& message);

}  // namespace warden::crypto::ed25519
