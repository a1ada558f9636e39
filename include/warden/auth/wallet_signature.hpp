#pragma once

#include <warden/auth/certificate.hpp>
#include <warden/chain/chain_client.hpp>
#include <warden/schema/error_code.hpp>

#include <optional>

namespace warden::auth {

/// Check that `certificate.signature` is a valid signature by
/// `certificate.user` over the certificate message for `package`, wrapped as
/// a personal message. Ed25519, secp256k1, secp256r1 and multisig are verified
/// locally; zkLogin is delegated to the chain.
///
/// Returns std::nullopt when the signature is valid, `invalid_signature` when
/// it is not, and `failure` when the zkLogin verifier is unreachable.
std::optional<warden::schema::error_code> verify_wallet_signature(
    const certificate_t& certificate,
    const warden::schema::object_id_t& package,
    warden::chain::chain_client& chain);

}  // namespace warden::auth
