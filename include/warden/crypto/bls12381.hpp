#pragma once

#include <warden/schema/primitives.hpp>

#include <mcl/bn.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

// BLS12-381 over mcl, configured for the standard compressed encodings
// (48-byte G1, 96-byte G2, 32-byte big-endian scalars) and the RFC 9380
// hash-to-curve suite.
namespace warden::crypto::bls12381 {

using scalar_t = mcl::bn::Fr;
using g1_t = mcl::bn::G1;
using g2_t = mcl::bn::G2;
using gt_t = mcl::bn::GT;

inline constexpr auto kScalarSize = std::size_t{32};
inline constexpr auto kG1Size = std::size_t{48};
inline constexpr auto kG2Size = std::size_t{96};

using scalar_bytes_t = std::array<uint8_t, kScalarSize>;
using g1_bytes_t = std::array<uint8_t, kG1Size>;
using g2_bytes_t = std::array<uint8_t, kG2Size>;

/// Domain separation tag of the G1 hash-to-curve suite.
inline constexpr auto kHashToG1Dst =
    std::string_view{"BLS_SIG_BLS12381G1_XMD:SHA-256_SSWU_RO_NUL_"};

/// Idempotent and thread-safe. Every other function here calls it.
void init();

const g1_t& g1_generator();
const g2_t& g2_generator();

scalar_t random_scalar();
/// Canonical big-endian scalar; values at or above the group order fail.
std::optional<scalar_t> try_scalar_from_bytes(
    const warden::schema::bytes_view_t& bytes);
scalar_bytes_t to_bytes(const scalar_t& value);

/// Compressed, on-curve and in the prime-order subgroup, or nothing.
std::optional<g1_t> try_g1_from_bytes(const warden::schema::bytes_view_t& bytes);
std::optional<g2_t> try_g2_from_bytes(const warden::schema::bytes_view_t& bytes);
g1_bytes_t to_bytes(const g1_t& point);
g2_bytes_t to_bytes(const g2_t& point);

warden::schema::bytes_t to_bytes(const gt_t& element);

g1_t hash_to_g1(const warden::schema::bytes_view_t& message);

g1_t mul(const g1_t& point, const scalar_t& scalar);
g2_t mul(const g2_t& point, const scalar_t& scalar);
g1_t add(const g1_t& a, const g1_t& b);
g1_t sub(const g1_t& a, const g1_t& b);
gt_t pairing(const g1_t& p, const g2_t& q);

}  // namespace warden::crypto::bls12381
