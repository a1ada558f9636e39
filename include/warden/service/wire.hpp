#pragma once

#include <warden/auth/session_token.hpp>
#include <warden/crypto/elgamal.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/service/key_server.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// JSON bodies of the HTTP API, mapped through the protobuf messages in
// warden/api.proto. Binary fields travel as base64.
namespace warden::service {

/// Transport decoding only. A field that does not decode is reported with
/// the error of the check that would have rejected it.
std::variant<fetch_key_request_t, warden::schema::error_code>
try_parse_fetch_key_request(std::string_view json);

std::optional<std::string> to_json(const std::vector<decryption_key_t>& keys);
std::optional<std::string> to_json(const session_token_t& token);
std::optional<std::string> to_json(
    const warden::crypto::elgamal::sealed_box_t& box);
std::optional<std::string> to_json(const service_info_t& info);
std::optional<std::string> to_json(const warden::auth::session_claims_t& claims);

std::string error_json(warden::schema::error_code code);
std::string health_json();

}  // namespace warden::service
