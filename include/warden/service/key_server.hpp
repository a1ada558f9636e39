#pragma once

#include <warden/auth/certificate.hpp>
#include <warden/auth/session_token.hpp>
#include <warden/chain/chain_client.hpp>
#include <warden/crypto/elgamal.hpp>
#include <warden/crypto/ibe.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/service/policy_evaluator.hpp>
#include <warden/service/request_metrics.hpp>
#include <warden/state/chain_state.hpp>
#include <warden/validation/valid_ptb.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace warden::service {

/// A key request after transport decoding. Field contents are unchecked.
struct fetch_key_request_t final {
  warden::schema::bytes_t ptb;
  warden::schema::bytes_t enc_key;
  warden::schema::bytes_t enc_verification_key;
  warden::crypto::signature64_t request_signature{};
  warden::auth::certificate_t certificate;
  // Client `Request-Id` header, carried into log lines only.
  std::optional<std::string> request_id;
};

struct decryption_key_t final {
  // first package id || identity
  warden::schema::bytes_t id;
  warden::crypto::elgamal::ciphertext_t encrypted_key;
};

struct session_token_t final {
  std::string auth_token;
  // Milliseconds since the epoch.
  warden::schema::timestamp_milliseconds_t expires_at{};
  std::optional<std::string> profile;
};

struct service_info_t final {
  warden::schema::object_id_t service_id{};
  warden::crypto::ibe::proof_of_possession_t pop;
};

struct key_server_config_t final {
  warden::schema::object_id_t key_server_object_id{};
  std::vector<std::string> approve_prefixes{
      std::string{warden::validation::kDefaultApprovePrefix}};
  std::string session_module{"warden"};
  std::string session_function{"seal_approve_session"};
  warden::schema::duration_milliseconds_t allowed_staleness{120'000};
};

/// Request orchestration for the key endpoints. Each request runs the same
/// fail-fast pipeline: freshness, transaction shape, package version,
/// certificate, signatures, policy and key checks; only then are keys or
/// tokens issued.
class key_server final {
 public:
  using clock_t = std::function<warden::schema::timestamp_milliseconds_t()>;

  key_server(key_server_config_t config,
             warden::crypto::ibe::master_key_t master_key,
             warden::chain::chain_client& chain,
             warden::state::chain_state& state,
             warden::auth::session_token_issuer issuer,
             request_metrics& metrics, clock_t now);

  /// The ElGamal-encrypted user secret key for the identity argument.
  std::variant<std::vector<decryption_key_t>, warden::schema::error_code>
  fetch_key(const fetch_key_request_t& request);

  /// Same checks as fetch_key, restricted to the configured session
  /// function of the anchor package, then mints a bearer token.
  std::variant<session_token_t, warden::schema::error_code> session_token(
      const fetch_key_request_t& request);

  /// The session token JSON sealed to the request's `enc_key`.
  std::variant<warden::crypto::elgamal::sealed_box_t,
               warden::schema::error_code>
  encrypted_session_token(const fetch_key_request_t& request);

  /// Claims of a bearer token taken from an `Authorization` header value.
  std::variant<warden::auth::session_claims_t, warden::schema::error_code>
  session(std::optional<std::string_view> authorization,
          const std::optional<std::string>& request_id = std::nullopt);

  /// Records a request whose body never decoded. A stale chain view still
  /// takes precedence over `code`; returns the code to report.
  warden::schema::error_code reject_unparsed(
      endpoint which, warden::schema::error_code code,
      const std::optional<std::string>& request_id);

  /// Key server object id and the master key's proof of possession over it.
  const service_info_t& service() const;

  /// `(first, latest)` of the package's lineage; `latest` must be the
  /// package itself.
  std::variant<warden::chain::package_versions_t, warden::schema::error_code>
  resolve_package(const warden::schema::object_id_t& package);

  const warden::crypto::ibe::public_key_t& public_key() const;

  warden::schema::timestamp_milliseconds_t now() const;

 private:
  struct checked_request_t final {
    warden::validation::valid_ptb ptb;
    warden::chain::package_versions_t versions;
    warden::crypto::elgamal::public_key_t enc_key;
  };

  std::variant<checked_request_t, warden::schema::error_code> check_request(
      const fetch_key_request_t& request,
      const std::optional<std::string>& required_function);

  std::variant<session_token_t, warden::schema::error_code>
  issue_session_token(const fetch_key_request_t& request);

  key_server_config_t config_;
  warden::crypto::ibe::master_key_t master_key_;
  warden::crypto::ibe::public_key_t public_key_;
  warden::chain::chain_client& chain_;
  warden::state::chain_state& state_;
  warden::auth::session_token_issuer issuer_;
  request_metrics& metrics_;
  clock_t now_;
  policy_evaluator policy_;
  service_info_t service_;
};

/// Wall clock in milliseconds since the epoch.
warden::schema::timestamp_milliseconds_t system_now();

}  // namespace warden::service
