#pragma once

#include <warden/crypto/ed25519.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// HS256 bearer tokens minted after a successful session-token request.
namespace warden::auth {

inline constexpr auto kTokenIssuer = std::string_view{"warden"};
inline constexpr auto kJwtSecretMessage = std::string_view{"jwt_secret"};

struct session_claims_t final {
  warden::schema::address_t user{};
  warden::crypto::ed25519_public_key_t session_vk{};
  warden::schema::timestamp_milliseconds_t creation_time{};
  uint16_t ttl_min{};
  // Seconds since the epoch.
  uint32_t issued_at{};
  uint32_t expires_at{};
  std::optional<std::string> profile;
};

class session_token_issuer final {
 public:
  explicit session_token_issuer(warden::schema::bytes_t hmac_key);

  /// The HMAC key is the keypair's signature over `jwt_secret`, so tokens do
  /// not survive a restart.
  static std::optional<session_token_issuer> from_keypair(
      const warden::crypto::ed25519::keypair_t& keypair);

  std::string issue(const session_claims_t& claims) const;

  /// `invalid_token` for anything that is not a well-formed token signed by
  /// this issuer, `expired_token` once `expires_at < now_seconds`.
  std::variant<session_claims_t, warden::schema::error_code> verify(
      std::string_view token, uint64_t now_seconds) const;

 private:
  std::string secret() const;

  warden::schema::bytes_t hmac_key_;
};

/// Extracts the token from an `Authorization` header value.
std::variant<std::string_view, warden::schema::error_code> parse_bearer(
    std::optional<std::string_view> header);

}  // namespace warden::auth
