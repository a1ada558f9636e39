#include <warden/api.pb.h>
#include <warden/crypto/bls12381.hpp>
#include <warden/service/wire.hpp>

#include <google/protobuf/util/json_util.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <iterator>
#include <utility>

namespace warden::service {

namespace {

std::optional<std::string> print(const google::protobuf::Message& message) {
  auto options = google::protobuf::util::JsonPrintOptions{};
  options.preserve_proto_field_names = true;
  auto json = std::string{};
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    spdlog::error("failed to serialize {}: {}", message.GetTypeName(),
                  status.ToString());
    return std::nullopt;
  }
  return json;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_fixed_base64(
    std::string_view encoded) {
  auto bytes = warden::schema::try_from_base64(encoded);
  if (!bytes || bytes->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(out));
  return out;
}

std::variant<warden::auth::certificate_t, warden::schema::error_code>
try_parse_certificate(const warden::api::Certificate& message) {
  using warden::schema::error_code;

  auto user = warden::schema::try_parse_address(message.user());
  auto session_vk = try_fixed_base64<32>(message.session_vk());
  if (!user || !session_vk || message.ttl_min() > 0xFFFF) {
    return error_code::invalid_certificate;
  }
  auto signature = warden::schema::try_from_base64(message.signature());
  if (!signature || signature->empty()) {
    return error_code::invalid_signature;
  }
  return warden::auth::certificate_t{
      .user = *user,
      .session_vk = *session_vk,
      .creation_time = message.creation_time(),
      .ttl_min = static_cast<uint16_t>(message.ttl_min()),
      .signature = std::move(*signature)};
}

}  // namespace

std::variant<fetch_key_request_t, warden::schema::error_code>
try_parse_fetch_key_request(std::string_view json) {
  using warden::schema::error_code;

  auto message = warden::api::FetchKeyRequest{};
  auto options = google::protobuf::util::JsonParseOptions{};
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(
      std::string{json}, &message, options);
  if (!status.ok()) {
    spdlog::debug("malformed key request: {}", status.ToString());
    return error_code::invalid_input;
  }
  if (!message.has_certificate()) {
    return error_code::invalid_certificate;
  }

  auto ptb = warden::schema::try_from_base64(message.ptb());
  if (!ptb) {
    return error_code::invalid_ptb;
  }
  auto enc_key = warden::schema::try_from_base64(message.enc_key());
  auto enc_verification_key =
      warden::schema::try_from_base64(message.enc_verification_key());
  if (!enc_key || !enc_verification_key) {
    return error_code::invalid_input;
  }
  auto request_signature =
      try_fixed_base64<64>(message.request_signature());
  if (!request_signature) {
    return error_code::invalid_session_signature;
  }
  auto certificate = try_parse_certificate(message.certificate());
  if (const auto* code = std::get_if<error_code>(&certificate)) {
    return *code;
  }

  return fetch_key_request_t{
      .ptb = std::move(*ptb),
      .enc_key = std::move(*enc_key),
      .enc_verification_key = std::move(*enc_verification_key),
      .request_signature = *request_signature,
      .certificate =
          std::move(std::get<warden::auth::certificate_t>(certificate))};
}

std::optional<std::string> to_json(const std::vector<decryption_key_t>& keys) {
  auto message = warden::api::FetchKeyResponse{};
  for (const auto& key : keys) {
    auto* out = message.add_decryption_keys();
    out->set_id(warden::schema::to_base64(key.id));
    auto c1 = warden::crypto::bls12381::to_bytes(key.encrypted_key.c1);
    auto c2 = warden::crypto::bls12381::to_bytes(key.encrypted_key.c2);
    out->add_encrypted_key(warden::schema::to_base64(c1));
    out->add_encrypted_key(warden::schema::to_base64(c2));
  }
  return print(message);
}

std::optional<std::string> to_json(const session_token_t& token) {
  auto message = warden::api::SessionTokenResponse{};
  message.set_auth_token(token.auth_token);
  message.set_expires_at(token.expires_at);
  if (token.profile) {
    message.set_profile(*token.profile);
  }
  return print(message);
}

std::optional<std::string> to_json(
    const warden::crypto::elgamal::sealed_box_t& box) {
  auto message = warden::api::EncryptedSessionTokenResponse{};
  message.set_encrypted_data(
      warden::schema::to_base64(warden::crypto::elgamal::encode(box)));
  return print(message);
}

std::optional<std::string> to_json(const service_info_t& info) {
  auto message = warden::api::GetServiceResponse{};
  message.set_service_id(warden::schema::to_address_string(info.service_id));
  message.set_pop(
      warden::schema::to_base64(warden::crypto::bls12381::to_bytes(info.pop)));
  return print(message);
}

std::optional<std::string> to_json(
    const warden::auth::session_claims_t& claims) {
  auto message = warden::api::SessionInfoResponse{};
  message.set_user_address(warden::schema::to_address_string(claims.user));
  message.set_session_vk(warden::schema::to_base64(claims.session_vk));
  message.set_exp(claims.expires_at);
  if (claims.profile) {
    message.set_profile(*claims.profile);
  }
  return print(message);
}

std::string error_json(const warden::schema::error_code code) {
  auto message = warden::api::ErrorResponse{};
  message.set_error(std::string{warden::schema::to_string(code)});
  message.set_message(std::string{warden::schema::message(code)});
  return print(message).value_or(R"({"error":"Failure"})");
}

std::string health_json() {
  auto message = warden::api::HealthResponse{};
  message.set_status("ok");
  return print(message).value_or(R"({"status":"ok"})");
}

}  // namespace warden::service
