#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace warden::http {

struct url_t final {
  bool tls{};
  std::string host;
  std::string port;
  std::string target;
};

/// `http://` and `https://` URLs with an optional port and path.
std::optional<url_t> try_parse_url(std::string_view url);

struct client_response_t final {
  unsigned status{};
  std::string body;
};

using header_list_t = std::vector<std::pair<std::string, std::string>>;

/// Blocking HTTP/1.1 client. Each call opens its own connection and runs its
/// own io_context, so one instance can be shared across threads. Every step,
/// name resolution included, is bounded by the timeout.
class client final {
 public:
  explicit client(std::chrono::milliseconds timeout);
  ~client();

  client(const client&) = delete;
  client& operator=(const client&) = delete;

  /// std::nullopt on transport failure or timeout. Non-2xx statuses are
  /// returned to the caller.
  std::optional<client_response_t> post(const url_t& url,
                                        std::string body,
                                        const header_list_t& headers = {});

  std::chrono::milliseconds timeout() const;

 private:
  std::optional<boost::asio::ip::tcp::resolver::results_type> resolve(
      const url_t& url);

  std::chrono::milliseconds timeout_;
  boost::asio::ssl::context ssl_context_;
  // Lookups run here so one that stalls can be abandoned at the deadline.
  boost::asio::io_context resolver_io_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      resolver_work_;
  std::thread resolver_thread_;
};

}  // namespace warden::http
