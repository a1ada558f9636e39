#pragma once

#include <warden/crypto/verify.hpp>
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace warden::auth {

/// Upper bound on a session key's lifetime, in minutes.
inline constexpr auto kMaxSessionTtlMinutes = uint16_t{10};

/// Wallet-signed delegation to a short-lived Ed25519 session key.
struct certificate_t final {
  warden::schema::address_t user{};
  warden::crypto::ed25519_public_key_t session_vk{};
  warden::schema::timestamp_milliseconds_t creation_time{};
  uint16_t ttl_min{};
  // Serialized Sui signature over the certificate message.
  warden::schema::bytes_t signature;
};

/// `YYYY-MM-DD HH:MM:SS UTC` for the whole second containing `timestamp`.
std::string format_utc(warden::schema::timestamp_milliseconds_t timestamp);

/// The exact text a wallet signs as a personal message.
std::string certificate_message(const warden::schema::object_id_t& package,
                                uint16_t ttl_min,
                                warden::schema::timestamp_milliseconds_t
                                    creation_time,
                                const warden::crypto::ed25519_public_key_t&
                                    session_vk);

/// `creation_time <= now`, `now - ttl <= creation_time`, `ttl <= 10 min`.
bool is_within_ttl(const certificate_t& certificate,
                   warden::schema::timestamp_milliseconds_t now);

/// Bytes the session key signs for a key request:
/// `bcs({ptb: vector<u8>, enc_key: vector<u8>, enc_verification_key:
/// vector<u8>})`.
warden::schema::bytes_t request_signing_message(
    const warden::schema::bytes_view_t& ptb,
    const warden::schema::bytes_view_t& enc_key,
    const warden::schema::bytes_view_t& enc_verification_key);

bool verify_request_signature(
    const certificate_t& certificate, const warden::schema::bytes_view_t& ptb,
    const warden::schema::bytes_view_t& enc_key,
    const warden::schema::bytes_view_t& enc_verification_key,
    const warden::crypto::signature64_t& request_signature);

}  // namespace warden::auth
