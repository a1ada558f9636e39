#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace warden::http {

using request_t =
    boost::beast::http::request<boost::beast::http::string_body>;
using response_t =
    boost::beast::http::response<boost::beast::http::string_body>;

/// JSON response mirroring the request's version and keep-alive.
response_t make_json_response(const request_t& request, unsigned status,
                              std::string body);

/// Header value by name, std::nullopt when absent.
std::optional<std::string_view> find_header(const request_t& request,
                                            std::string_view name);

/// Exact-path dispatch table. The query string is ignored.
class router final {
 public:
  using handler_t = std::function<response_t(const request_t&)>;

  void add(boost::beast::http::verb method, std::string path,
           handler_t handler);

  /// 404 for unknown paths, 405 for known paths with another method. A
  /// throwing handler yields a 503 `Failure` body.
  response_t dispatch(const request_t& request) const;

 private:
  std::map<std::pair<std::string, boost::beast::http::verb>, handler_t>
      routes_;
};

}  // namespace warden::http
