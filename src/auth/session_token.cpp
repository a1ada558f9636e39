#include <warden/auth/session_token.hpp>

#include <jwt-cpp/jwt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <system_error>
#include <utility>

namespace warden::auth {

namespace {

constexpr auto kBearerPrefix = std::string_view{"Bearer "};

using json_traits_t = jwt::traits::kazuho_picojson;

// The verifier reads the caller's clock instead of the system clock.
struct fixed_clock final {
  jwt::date at;
  jwt::date now() const { return at; }
};

jwt::date to_date(const uint64_t seconds) {
  return jwt::date{std::chrono::seconds{seconds}};
}

jwt::basic_claim<json_traits_t> integer_claim(const uint64_t value) {
  return jwt::basic_claim<json_traits_t>{
      picojson::value{static_cast<int64_t>(value)}};
}

std::optional<uint64_t> try_unsigned_claim(
    const jwt::decoded_jwt<json_traits_t>& decoded, const std::string& name) {
  if (!decoded.has_payload_claim(name)) {
    return std::nullopt;
  }
  auto claim = decoded.get_payload_claim(name);
  if (claim.get_type() != jwt::json::type::integer) {
    return std::nullopt;
  }
  auto value = claim.as_integer();
  if (value < 0) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(value);
}

std::optional<std::string> try_string_claim(
    const jwt::decoded_jwt<json_traits_t>& decoded, const std::string& name) {
  if (!decoded.has_payload_claim(name)) {
    return std::nullopt;
  }
  auto claim = decoded.get_payload_claim(name);
  if (claim.get_type() != jwt::json::type::string) {
    return std::nullopt;
  }
  return claim.as_string();
}

}  // namespace

session_token_issuer::session_token_issuer(warden::schema::bytes_t hmac_key)
    : hmac_key_{std::move(hmac_key)} {}

std::optional<session_token_issuer> session_token_issuer::from_keypair(
    const warden::crypto::ed25519::keypair_t& keypair) {
  auto signature = warden::crypto::ed25519::sign(
      keypair, warden::schema::make_bytes_view(kJwtSecretMessage));
  if (!signature) {
    return std::nullopt;
  }
  return session_token_issuer{
      warden::schema::bytes_t{std::begin(*signature), std::end(*signature)}};
}

std::string session_token_issuer::issue(const session_claims_t& claims) const {
  auto user = warden::schema::to_address_string(claims.user);
  auto token =
      jwt::create()
          .set_type("JWT")
          .set_issuer(std::string{kTokenIssuer})
          .set_subject(user)
          .set_issued_at(to_date(claims.issued_at))
          .set_expires_at(to_date(claims.expires_at))
          .set_payload_claim("user_address",
                             jwt::basic_claim<json_traits_t>{user})
          .set_payload_claim(
              "session_vk",
              jwt::basic_claim<json_traits_t>{
                  warden::schema::to_base64(claims.session_vk)})
          .set_payload_claim("creation_time",
                             integer_claim(claims.creation_time))
          .set_payload_claim("ttl_min", integer_claim(claims.ttl_min));
  if (claims.profile) {
    token.set_payload_claim("profile",
                            jwt::basic_claim<json_traits_t>{*claims.profile});
  }
  return token.sign(jwt::algorithm::hs256{secret()});
}

std::variant<session_claims_t, warden::schema::error_code>
session_token_issuer::verify(std::string_view token,
                             const uint64_t now_seconds) const {
  auto decoded = std::optional<jwt::decoded_jwt<json_traits_t>>{};
  try {
    decoded.emplace(std::string{token});
  } catch (const std::exception& e) {
    spdlog::debug("malformed session token: {}", e.what());
    return warden::schema::error_code::invalid_token;
  }

  auto error = std::error_code{};
  jwt::verify<fixed_clock, json_traits_t>(fixed_clock{to_date(now_seconds)})
      .allow_algorithm(jwt::algorithm::hs256{secret()})
      .with_issuer(std::string{kTokenIssuer})
      .leeway(0)
      .verify(*decoded, error);
  if (error == jwt::error::token_verification_error::token_expired) {
    return warden::schema::error_code::expired_token;
  }
  if (error) {
    spdlog::debug("session token rejected: {}", error.message());
    return warden::schema::error_code::invalid_token;
  }

  auto user_address = try_string_claim(*decoded, "user_address");
  auto session_vk_text = try_string_claim(*decoded, "session_vk");
  auto creation_time = try_unsigned_claim(*decoded, "creation_time");
  auto ttl_min = try_unsigned_claim(*decoded, "ttl_min");
  auto issued_at = try_unsigned_claim(*decoded, "iat");
  auto expires_at = try_unsigned_claim(*decoded, "exp");
  if (!user_address || !session_vk_text || !creation_time || !ttl_min ||
      !issued_at || !expires_at) {
    return warden::schema::error_code::invalid_token;
  }

  auto user = warden::schema::try_parse_address(*user_address);
  auto session_vk = warden::schema::try_from_base64(*session_vk_text);
  if (!user || !session_vk || session_vk->size() != 32 || *ttl_min > 0xFFFF ||
      *issued_at > 0xFFFFFFFF || *expires_at > 0xFFFFFFFF) {
    return warden::schema::error_code::invalid_token;
  }

  auto claims = session_claims_t{
      .user = *user,
      .creation_time = *creation_time,
      .ttl_min = static_cast<uint16_t>(*ttl_min),
      .issued_at = static_cast<uint32_t>(*issued_at),
      .expires_at = static_cast<uint32_t>(*expires_at),
      .profile = try_string_claim(*decoded, "profile")};
  std::copy(std::begin(*session_vk), std::end(*session_vk),
            std::begin(claims.session_vk));
  return claims;
}

std::string session_token_issuer::secret() const {
  return warden::schema::make_string(hmac_key_);
}

std::variant<std::string_view, warden::schema::error_code> parse_bearer(
    std::optional<std::string_view> header) {
  if (!header) {
    return warden::schema::error_code::missing_auth_token;
  }
  if (!header->starts_with(kBearerPrefix)) {
    return warden::schema::error_code::invalid_auth_header;
  }
  auto token = header->substr(kBearerPrefix.size());
  if (token.empty()) {
    return warden::schema::error_code::invalid_auth_header;
  }
  return token;
}

}  // namespace warden::auth
