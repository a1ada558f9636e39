#include <warden/schema/error_code.hpp>

namespace warden::schema {

unsigned http_status(const error_code code) {
  switch (code) {
    case error_code::failure:
    case error_code::sui_client_not_fresh:
      return 503;
    case error_code::invalid_token:
    case error_code::expired_token:
    case error_code::missing_auth_token:
    case error_code::invalid_auth_header:
      return 401;
    case error_code::invalid_ptb:
    case error_code::invalid_package:
    case error_code::no_access:
    case error_code::old_package_version:
    case error_code::invalid_signature:
    case error_code::invalid_session_signature:
    case error_code::invalid_certificate:
    case error_code::invalid_input:
    case error_code::decryption_error:
    case error_code::serialization_error:
    case error_code::unauthorized:
      return 403;
  }
  return 503;
}

std::string_view message(const error_code code) {
  switch (code) {
    case error_code::invalid_ptb:
      return "Invalid PTB";
    case error_code::invalid_package:
      return "Invalid package ID";
    case error_code::no_access:
      return "Access denied";
    case error_code::old_package_version:
      return "Package has been upgraded, please use the latest version";
    case error_code::invalid_signature:
      return "Invalid user signature";
    case error_code::invalid_session_signature:
      return "Invalid session key signature";
    case error_code::invalid_certificate:
      return "Invalid certificate time or ttl";
    case error_code::failure:
      return "Internal server error, please try again later";
    case error_code::sui_client_not_fresh:
      return "Key server chain view is stale, please try again later";
    case error_code::invalid_input:
      return "Invalid input";
    case error_code::decryption_error:
      return "Decryption error";
    case error_code::serialization_error:
      return "Serialization error";
    case error_code::invalid_token:
      return "Invalid authentication token";
    case error_code::expired_token:
      return "Authentication token has expired";
    case error_code::missing_auth_token:
      return "Authentication token is missing";
    case error_code::invalid_auth_header:
      return "Invalid Authorization header format";
    case error_code::unauthorized:
      return "User is not authorized to access this resource";
  }
  return "Internal server error, please try again later";
}

}  // namespace warden::schema
