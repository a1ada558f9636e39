#include <warden/http/router.hpp>
#include <warden/schema/error_code.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace beast = boost::beast;

namespace warden::http {

namespace {

std::string_view to_std(const beast::string_view& view) {
  return std::string_view{view.data(), view.size()};
}

std::string error_body(std::string_view tag, std::string_view message) {
  return fmt::format(R"({{"error":"{}","message":"{}"}})", tag, message);
}

}  // namespace

response_t make_json_response(const request_t& request, const unsigned status,
                              std::string body) {
  auto response =
      response_t{static_cast<beast::http::status>(status), request.version()};
  response.set(beast::http::field::server, "warden");
  response.set(beast::http::field::content_type, "application/json");
  response.keep_alive(request.keep_alive());
  response.body() = std::move(body);
  response.prepare_payload();
  return response;
}

std::optional<std::string_view> find_header(const request_t& request,
                                            std::string_view name) {
  auto it = request.find(beast::string_view{name.data(), name.size()});
  if (it == request.end()) {
    return std::nullopt;
  }
  return to_std(it->value());
}

void router::add(const beast::http::verb method, std::string path,
                 handler_t handler) {
  routes_[{std::move(path), method}] = std::move(handler);
}

response_t router::dispatch(const request_t& request) const {
  auto target = to_std(request.target());
  auto path = std::string{target.substr(0, target.find('?'))};

  auto it = routes_.find({path, request.method()});
  if (it == std::end(routes_)) {
    auto known = std::any_of(std::begin(routes_), std::end(routes_),
                             [&](const auto& route) {
                               return route.first.first == path;
                             });
    if (known) {
      return make_json_response(
          request, 405, error_body("MethodNotAllowed", "Method not allowed"));
    }
    return make_json_response(request, 404,
                              error_body("NotFound", "Not found"));
  }

  try {
    return it->second(request);
  } catch (const std::exception& e) {
    spdlog::error("handler for {} threw: {}", path, e.what());
    const auto code = warden::schema::error_code::failure;
    return make_json_response(
        request, warden::schema::http_status(code),
        error_body(warden::schema::to_string(code),
                   warden::schema::message(code)));
  }
}

}  // namespace warden::http
