#include <warden/auth/wallet_signature.hpp>
#include <warden/service/key_server.hpp>
#include <warden/service/wire.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <utility>

namespace warden::service {

namespace {

void log_rejection(const std::optional<std::string>& request_id,
                   const warden::schema::error_code code) {
  spdlog::info("request {} rejected: {}", request_id.value_or("-"),
               warden::schema::to_string(code));
}

template <typename T>
std::variant<T, warden::schema::error_code> rejected(
    request_metrics& metrics, const warden::schema::error_code code,
    const std::optional<std::string>& request_id) {
  metrics.observe_error(code);
  log_rejection(request_id, code);
  return code;
}

}  // namespace

warden::schema::timestamp_milliseconds_t system_now() {
  using namespace std::chrono;
  return static_cast<warden::schema::timestamp_milliseconds_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch())
          .count());
}

key_server::key_server(key_server_config_t config,
                       warden::crypto::ibe::master_key_t master_key,
                       warden::chain::chain_client& chain,
                       warden::state::chain_state& state,
                       warden::auth::session_token_issuer issuer,
                       request_metrics& metrics, clock_t now)
    : config_{std::move(config)},
      master_key_{master_key},
      public_key_{warden::crypto::ibe::public_key_from(master_key)},
      chain_{chain},
      state_{state},
      issuer_{std::move(issuer)},
      metrics_{metrics},
      now_{std::move(now)},
      policy_{chain, state},
      service_{.service_id = config_.key_server_object_id,
               .pop = warden::crypto::ibe::create_proof_of_possession(
                   master_key, config_.key_server_object_id)} {}

warden::schema::timestamp_milliseconds_t key_server::now() const {
  return now_();
}

const warden::crypto::ibe::public_key_t& key_server::public_key() const {
  return public_key_;
}

const service_info_t& key_server::service() const { return service_; }

std::variant<warden::chain::package_versions_t, warden::schema::error_code>
key_server::resolve_package(const warden::schema::object_id_t& package) {
  auto lookup = chain_.resolve_package(package);
  switch (lookup.status) {
    case warden::chain::lookup_status::found:
      break;
    case warden::chain::lookup_status::not_found:
      return warden::schema::error_code::invalid_package;
    case warden::chain::lookup_status::failed:
    default:
      return warden::schema::error_code::failure;
  }
  if (lookup.versions.latest != package) {
    spdlog::debug("package {} is not the latest version {}",
                  warden::schema::to_address_string(package),
                  warden::schema::to_address_string(lookup.versions.latest));
    return warden::schema::error_code::old_package_version;
  }
  return lookup.versions;
}

std::variant<key_server::checked_request_t, warden::schema::error_code>
key_server::check_request(const fetch_key_request_t& request,
                          const std::optional<std::string>& required_function) {
  using warden::schema::error_code;

  if (auto stale = state_.check_fresh(now(), config_.allowed_staleness)) {
    return *stale;
  }

  auto ptb = warden::validation::valid_ptb::try_from(request.ptb,
                                                     config_.approve_prefixes);
  if (!ptb) {
    return error_code::invalid_ptb;
  }
  if (required_function && ptb->full_function() != *required_function) {
    spdlog::debug("expected {} but the transaction calls {}",
                  *required_function, ptb->full_function());
    return error_code::invalid_ptb;
  }

  auto versions = resolve_package(ptb->package());
  if (const auto* code = std::get_if<error_code>(&versions)) {
    return *code;
  }
  const auto& resolved = std::get<warden::chain::package_versions_t>(versions);

  const auto& certificate = request.certificate;
  if (!warden::auth::is_within_ttl(certificate, now())) {
    spdlog::debug("certificate outside its ttl: created {} ttl {} min",
                  certificate.creation_time, certificate.ttl_min);
    return error_code::invalid_certificate;
  }

  if (auto error = warden::auth::verify_wallet_signature(
          certificate, resolved.first, chain_)) {
    return *error;
  }

  if (!warden::auth::verify_request_signature(
          certificate, request.ptb, request.enc_key,
          request.enc_verification_key, request.request_signature)) {
    return error_code::invalid_session_signature;
  }

  if (auto denied = policy_.evaluate(*ptb, certificate.user)) {
    return *denied;
  }

  auto enc_key = warden::crypto::bls12381::try_g1_from_bytes(request.enc_key);
  auto enc_verification_key = warden::crypto::bls12381::try_g2_from_bytes(
      request.enc_verification_key);
  if (!enc_key || !enc_verification_key ||
      !warden::crypto::elgamal::verify_keys(*enc_key, *enc_verification_key)) {
    return error_code::invalid_input;
  }

  return checked_request_t{
      .ptb = std::move(*ptb), .versions = resolved, .enc_key = *enc_key};
}

std::variant<std::vector<decryption_key_t>, warden::schema::error_code>
key_server::fetch_key(const fetch_key_request_t& request) {
  metrics_.observe_request(endpoint::fetch_key);

  auto checked = check_request(request, std::nullopt);
  if (const auto* code = std::get_if<warden::schema::error_code>(&checked)) {
    return rejected<std::vector<decryption_key_t>>(metrics_, *code,
                                                   request.request_id);
  }
  const auto& approved = std::get<checked_request_t>(checked);

  auto keys = std::vector<decryption_key_t>{};
  keys.reserve(approved.ptb.identity_arguments().size());
  for (const auto& identity : approved.ptb.identity_arguments()) {
    auto id =
        warden::crypto::ibe::make_key_id(approved.versions.first, identity);
    auto usk = warden::crypto::ibe::extract(master_key_, id);
    keys.push_back(decryption_key_t{
        .id = std::move(id),
        .encrypted_key = warden::crypto::elgamal::encrypt(approved.enc_key, usk)});
  }
  spdlog::info("request {}: issued {} key(s) for {} to {}",
               request.request_id.value_or("-"), keys.size(),
               approved.ptb.full_function(),
               warden::schema::to_address_string(request.certificate.user));
  return keys;
}

std::variant<session_token_t, warden::schema::error_code>
key_server::issue_session_token(const fetch_key_request_t& request) {
  auto required = fmt::format(
      "{}::{}::{}",
      warden::schema::to_address_string(state_.anchor_package_latest()),
      config_.session_module, config_.session_function);
  auto checked = check_request(request, required);
  if (const auto* code = std::get_if<warden::schema::error_code>(&checked)) {
    return *code;
  }
  const auto& approved = std::get<checked_request_t>(checked);

  // The session function's first identity is the profile object id.
  const auto& first_identity = approved.ptb.identity_arguments().front();
  auto profile = "0x" + warden::schema::to_hex(first_identity);

  const auto issued_ms = now();
  const auto expires_at =
      issued_ms + static_cast<uint64_t>(request.certificate.ttl_min) * 60'000;
  auto claims = warden::auth::session_claims_t{
      .user = request.certificate.user,
      .session_vk = request.certificate.session_vk,
      .creation_time = request.certificate.creation_time,
      .ttl_min = request.certificate.ttl_min,
      .issued_at = static_cast<uint32_t>(issued_ms / 1000),
      .expires_at = static_cast<uint32_t>(expires_at / 1000),
      .profile = profile};

  spdlog::info("request {}: session token issued to {}",
               request.request_id.value_or("-"),
               warden::schema::to_address_string(request.certificate.user));
  return session_token_t{.auth_token = issuer_.issue(claims),
                         .expires_at = expires_at,
                         .profile = std::move(profile)};
}

std::variant<session_token_t, warden::schema::error_code>
key_server::session_token(const fetch_key_request_t& request) {
  metrics_.observe_request(endpoint::session_token);
  auto token = issue_session_token(request);
  if (const auto* code = std::get_if<warden::schema::error_code>(&token)) {
    return rejected<session_token_t>(metrics_, *code, request.request_id);
  }
  return token;
}

std::variant<warden::crypto::elgamal::sealed_box_t, warden::schema::error_code>
key_server::encrypted_session_token(const fetch_key_request_t& request) {
  using result_t = warden::crypto::elgamal::sealed_box_t;
  metrics_.observe_request(endpoint::encrypted_session_token);
  auto token = issue_session_token(request);
  if (const auto* code = std::get_if<warden::schema::error_code>(&token)) {
    return rejected<result_t>(metrics_, *code, request.request_id);
  }

  auto json = to_json(std::get<session_token_t>(token));
  if (!json) {
    return rejected<result_t>(metrics_,
                              warden::schema::error_code::serialization_error,
                              request.request_id);
  }
  // check_request has already validated enc_key.
  auto enc_key = warden::crypto::bls12381::try_g1_from_bytes(request.enc_key);
  auto sealed = enc_key ? warden::crypto::elgamal::seal(
                              *enc_key, warden::schema::make_bytes_view(*json))
                        : std::nullopt;
  if (!sealed) {
    return rejected<result_t>(metrics_, warden::schema::error_code::failure,
                              request.request_id);
  }
  return std::move(*sealed);
}

std::variant<warden::auth::session_claims_t, warden::schema::error_code>
key_server::session(std::optional<std::string_view> authorization,
                    const std::optional<std::string>& request_id) {
  metrics_.observe_request(endpoint::session);

  auto token = warden::auth::parse_bearer(authorization);
  if (const auto* code = std::get_if<warden::schema::error_code>(&token)) {
    return rejected<warden::auth::session_claims_t>(metrics_, *code,
                                                    request_id);
  }
  auto claims = issuer_.verify(std::get<std::string_view>(token), now() / 1000);
  if (const auto* code = std::get_if<warden::schema::error_code>(&claims)) {
    return rejected<warden::auth::session_claims_t>(metrics_, *code,
                                                    request_id);
  }
  return claims;
}

warden::schema::error_code key_server::reject_unparsed(
    const endpoint which, const warden::schema::error_code code,
    const std::optional<std::string>& request_id) {
  metrics_.observe_request(which);
  auto reported = state_.check_fresh(now(), config_.allowed_staleness)
                      .value_or(code);
  metrics_.observe_error(reported);
  log_rejection(request_id, reported);
  return reported;
}

}  // namespace warden::service
