#include <warden/service/api.hpp>
#include <warden/service/wire.hpp>

#include <spdlog/spdlog.h>

#include <optional>
#include <string>
#include <variant>

namespace warden::service {

namespace {

using warden::http::find_header;
using warden::http::make_json_response;
using warden::http::request_t;
using warden::http::response_t;

void log_request_headers(std::string_view endpoint_name,
                         const request_t& request) {
  spdlog::info(
      "{}: request id {}, sdk version {}, sdk type {}, target api version {}",
      endpoint_name, find_header(request, "Request-Id").value_or("-"),
      find_header(request, "Client-Sdk-Version").value_or("-"),
      find_header(request, "Client-Sdk-Type").value_or("-"),
      find_header(request, "Client-Target-Api-Version").value_or("-"));
}

response_t error_response(const request_t& request,
                          const warden::schema::error_code code) {
  return make_json_response(request, warden::schema::http_status(code),
                            error_json(code));
}

template <typename T>
response_t respond(const request_t& request,
                   const std::variant<T, warden::schema::error_code>& result) {
  if (const auto* code = std::get_if<warden::schema::error_code>(&result)) {
    return error_response(request, *code);
  }
  auto json = to_json(std::get<T>(result));
  if (!json) {
    return error_response(request,
                          warden::schema::error_code::serialization_error);
  }
  return make_json_response(request, 200, std::move(*json));
}

std::optional<std::string> request_id_of(const request_t& request) {
  auto id = find_header(request, "Request-Id");
  if (!id) {
    return std::nullopt;
  }
  return std::string{*id};
}

// Decodes the body and runs `handle` on it; a body that does not decode is
// still recorded and logged by the server.
template <typename Handler>
response_t with_parsed_request(key_server& server, const endpoint which,
                               const request_t& request, Handler&& handle) {
  auto request_id = request_id_of(request);
  auto parsed = try_parse_fetch_key_request(request.body());
  if (const auto* code = std::get_if<warden::schema::error_code>(&parsed)) {
    return error_response(request,
                          server.reject_unparsed(which, *code, request_id));
  }
  auto& decoded = std::get<fetch_key_request_t>(parsed);
  decoded.request_id = std::move(request_id);
  return respond(request, handle(decoded));
}

}  // namespace

warden::http::router make_router(key_server& server,
                                 request_metrics& metrics) {
  using boost::beast::http::verb;
  auto routes = warden::http::router{};

  routes.add(verb::post, "/v1/fetch_key", [&server](const request_t& request) {
    log_request_headers("fetch_key", request);
    return with_parsed_request(
        server, endpoint::fetch_key, request,
        [&server](const fetch_key_request_t& decoded) {
          return server.fetch_key(decoded);
        });
  });

  routes.add(verb::get, "/v1/service",
             [&server, &metrics](const request_t& request) {
               metrics.observe_request(endpoint::get_service);
               auto json = to_json(server.service());
               if (!json) {
                 return error_response(request,
                                       warden::schema::error_code::failure);
               }
               return make_json_response(request, 200, std::move(*json));
             });

  routes.add(verb::post, "/auth/session_token",
             [&server](const request_t& request) {
               log_request_headers("session_token", request);
               return with_parsed_request(
                   server, endpoint::session_token, request,
                   [&server](const fetch_key_request_t& decoded) {
                     return server.session_token(decoded);
                   });
             });

  routes.add(verb::post, "/auth/encrypted_session_token",
             [&server](const request_t& request) {
               log_request_headers("encrypted_session_token", request);
               return with_parsed_request(
                   server, endpoint::encrypted_session_token, request,
                   [&server](const fetch_key_request_t& decoded) {
                     return server.encrypted_session_token(decoded);
                   });
             });

  routes.add(verb::get, "/auth/session", [&server](const request_t& request) {
    return respond(request,
                   server.session(find_header(request, "Authorization"),
                                  request_id_of(request)));
  });

  routes.add(verb::get, "/health",
             [&metrics](const request_t& request) {
               metrics.observe_request(endpoint::health);
               return make_json_response(request, 200, health_json());
             });

  return routes;
}

}  // namespace warden::service
