#pragma once

#include <warden/schema/enum_string.hpp>
#include <warden/schema/error_code.hpp>

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace warden::service {

enum class endpoint : uint8_t {
  fetch_key,
  get_service,
  session_token,
  encrypted_session_token,
  session,
  health,
};

inline constexpr auto kEndpointMappings = std::array{
    std::pair<std::string_view, endpoint>{"fetch_key", endpoint::fetch_key},
    std::pair<std::string_view, endpoint>{"get_service",
                                          endpoint::get_service},
    std::pair<std::string_view, endpoint>{"session_token",
                                          endpoint::session_token},
    std::pair<std::string_view, endpoint>{"encrypted_session_token",
                                          endpoint::encrypted_session_token},
    std::pair<std::string_view, endpoint>{"session", endpoint::session},
    std::pair<std::string_view, endpoint>{"health", endpoint::health}};

/// Request and rejection counters. Lock-free; read for the periodic summary
/// and by tests.
class request_metrics final {
 public:
  void observe_request(endpoint value);
  void observe_error(warden::schema::error_code code);

  uint64_t requests(endpoint value) const;
  uint64_t errors(warden::schema::error_code code) const;
  uint64_t total_errors() const;

  /// One info line with every non-zero counter.
  void log_summary() const;

 private:
  static constexpr auto kErrorSlots =
      static_cast<std::size_t>(warden::schema::error_code::unauthorized) + 1;

  std::array<std::atomic<uint64_t>, kEndpointMappings.size()> requests_{};
  std::array<std::atomic<uint64_t>, kErrorSlots> errors_{};
};

}  // namespace warden::service

namespace warden::schema {

template <>
inline std::optional<warden::service::endpoint>
try_from_string<warden::service::endpoint>(const std::string_view value) {
  return from_string(value, warden::service::kEndpointMappings);
}

}  // namespace warden::schema
