#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Every way a key-server request can be rejected. The string tag is the wire
// value clients match on.
namespace warden::schema {

enum class error_code : uint8_t {
  invalid_ptb = 1,
  invalid_package = 2,
  no_access = 3,
  old_package_version = 4,
  invalid_signature = 5,
  invalid_session_signature = 6,
  invalid_certificate = 7,
  failure = 8,
  sui_client_not_fresh = 9,
  invalid_input = 10,
  decryption_error = 11,
  serialization_error = 12,
  invalid_token = 13,
  expired_token = 14,
  missing_auth_token = 15,
  invalid_auth_header = 16,
  unauthorized = 17,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"InvalidPTB",
                                            error_code::invalid_ptb},
    std::pair<std::string_view, error_code>{"InvalidPackage",
                                            error_code::invalid_package},
    std::pair<std::string_view, error_code>{"NoAccess", error_code::no_access},
    std::pair<std::string_view, error_code>{"OldPackageVersion",
                                            error_code::old_package_version},
    std::pair<std::string_view, error_code>{"InvalidSignature",
                                            error_code::invalid_signature},
    std::pair<std::string_view, error_code>{
        "InvalidSessionSignature", error_code::invalid_session_signature},
    std::pair<std::string_view, error_code>{"InvalidCertificate",
                                            error_code::invalid_certificate},
    std::pair<std::string_view, error_code>{"Failure", error_code::failure},
    std::pair<std::string_view, error_code>{"SuiClientNotFresh",
                                            error_code::sui_client_not_fresh},
    std::pair<std::string_view, error_code>{"InvalidInput",
                                            error_code::invalid_input},
    std::pair<std::string_view, error_code>{"DecryptionError",
                                            error_code::decryption_error},
    std::pair<std::string_view, error_code>{"SerializationError",
                                            error_code::serialization_error},
    std::pair<std::string_view, error_code>{"InvalidToken",
                                            error_code::invalid_token},
    std::pair<std::string_view, error_code>{"ExpiredToken",
                                            error_code::expired_token},
    std::pair<std::string_view, error_code>{"MissingAuthToken",
                                            error_code::missing_auth_token},
    std::pair<std::string_view, error_code>{"InvalidAuthHeader",
                                            error_code::invalid_auth_header},
    std::pair<std::string_view, error_code>{"Unauthorized",
                                            error_code::unauthorized}};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("Failure");
}

/// HTTP status the server answers with for a rejection.
unsigned http_status(error_code code);

/// Generic, client-safe description. Never includes upstream details.
std::string_view message(error_code code);

}  // namespace warden::schema
