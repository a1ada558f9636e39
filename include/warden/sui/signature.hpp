#pragma once

#include <warden/crypto/verify.hpp>
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace warden::sui {

enum class signature_scheme : uint8_t {
  ed25519 = 0x00,
  secp256k1 = 0x01,
  secp256r1 = 0x02,
  multisig = 0x03,
  bls12381 = 0x04,
  zklogin = 0x05,
  passkey = 0x06,
};

/// Flag byte followed by signature and public key.
struct simple_signature_t final {
  warden::crypto::signer_id_t signer;
  warden::crypto::signature64_t signature{};
};

struct multisig_member_t final {
  warden::crypto::signer_id_t public_key;
  uint8_t weight{};
};

struct multisig_public_key_t final {
  std::vector<multisig_member_t> members;
  uint16_t threshold{};
};

struct compressed_signature_t final {
  signature_scheme scheme{signature_scheme::ed25519};
  warden::crypto::signature64_t signature{};
};

struct multisig_signature_t final {
  std::vector<compressed_signature_t> signatures;
  uint16_t bitmap{};
  multisig_public_key_t public_key;
};

/// zkLogin authenticators are verified by the chain, so only the raw
/// serialized form (flag included) is kept.
struct zklogin_signature_t final {
  warden::schema::bytes_t serialized;
};

using generic_signature_t =
    std::variant<simple_signature_t, multisig_signature_t, zklogin_signature_t>;

/// Maximum members of a multisig committee.
inline constexpr auto kMaxMultisigMembers = std::size_t{10};

/// Parse serialized Sui signature bytes. BLS and passkey signatures, unknown
/// flags, wrong lengths and malformed multisig payloads yield std::nullopt.
std::optional<generic_signature_t> try_parse_signature(
    const warden::schema::bytes_view_t& bytes);

warden::schema::bytes_t serialize(const simple_signature_t& signature);
warden::schema::bytes_t serialize(const multisig_signature_t& signature);

signature_scheme scheme_of(const warden::crypto::signer_id_t& signer);

/// `blake2b256(flag || public key)`.
warden::schema::address_t address_of(const warden::crypto::signer_id_t& signer);

/// `blake2b256(0x03 || threshold || (flag || public key || weight)*)`.
warden::schema::address_t address_of(const multisig_public_key_t& public_key);

/// Digest a wallet signs for a personal message:
/// `blake2b256([3, 0, 0] || bcs(vector<u8> message))`.
warden::schema::hash32_t personal_message_digest(
    const warden::schema::bytes_view_t& message);

/// Verify a single-key signature over `digest` and return the signer address.
std::optional<warden::schema::address_t> verify_digest(
    const simple_signature_t& signature, const warden::schema::hash32_t& digest);

/// Verify a multisig over `digest`: structural rules, per-member signatures
/// and the weight threshold. Returns the multisig address.
std::optional<warden::schema::address_t> verify_digest(
    const multisig_signature_t& signature,
    const warden::schema::hash32_t& digest);

}  // namespace warden::sui
