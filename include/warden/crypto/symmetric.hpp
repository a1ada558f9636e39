#pragma once

#include <warden/schema/primitives.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

// OpenSSL-backed hashing, key derivation and authenticated encryption.
namespace warden::crypto {

using aes256_key_t = std::array<uint8_t, 32>;

inline constexpr auto kAesGcmNonceSize = std::size_t{12};
inline constexpr auto kAesGcmTagSize = std::size_t{16};

warden::schema::hash32_t sha256(const warden::schema::bytes_view_t& bytes);

std::optional<warden::schema::bytes_t> hkdf_sha256(
    const warden::schema::bytes_view_t& ikm,
    const warden::schema::bytes_view_t& salt,
    const warden::schema::bytes_view_t& info, std::size_t length);

std::optional<warden::schema::bytes_t> random_bytes(std::size_t length);

/// Output layout: nonce (12) || ciphertext || tag (16).
std::optional<warden::schema::bytes_t> aes256_gcm_seal(
    const aes256_key_t& key, const warden::schema::bytes_view_t& plaintext,
    const warden::schema::bytes_view_t& aad);

std::optional<warden::schema::bytes_t> aes256_gcm_open(
    const aes256_key_t& key, const warden::schema::bytes_view_t& sealed,
    const warden::schema::bytes_view_t& aad);

}  // namespace warden::crypto
