#include <warden/http/client.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <future>
#include <memory>
#include <utility>

namespace asio = boost::asio;
namespace beast = boost::beast;

namespace warden::http {

namespace {

using tcp = asio::ip::tcp;
using request_t = beast::http::request<beast::http::string_body>;

// Runs one asynchronous step to completion on a private io_context. The
// stream's expiry turns a stalled step into operation_aborted.
template <typename Initiate>
beast::error_code run_step(asio::io_context& io, Initiate&& initiate) {
  auto result = beast::error_code{asio::error::operation_aborted};
  initiate([&result](const beast::error_code& ec, auto&&...) { result = ec; });
  io.restart();
  io.run();
  return result;
}

template <typename Stream>
std::optional<client_response_t> exchange(
    asio::io_context& io, Stream& stream, request_t& request,
    const std::chrono::milliseconds timeout) {
  beast::get_lowest_layer(stream).expires_after(timeout);
  auto ec = run_step(io, [&](auto handler) {
    beast::http::async_write(stream, request, std::move(handler));
  });
  if (ec) {
    spdlog::warn("http write failed: {}", ec.message());
    return std::nullopt;
  }

  auto buffer = beast::flat_buffer{};
  auto response = beast::http::response<beast::http::string_body>{};
  beast::get_lowest_layer(stream).expires_after(timeout);
  ec = run_step(io, [&](auto handler) {
    beast::http::async_read(stream, buffer, response, std::move(handler));
  });
  if (ec) {
    spdlog::warn("http read failed: {}", ec.message());
    return std::nullopt;
  }
  return client_response_t{.status = response.result_int(),
                           .body = std::move(response.body())};
}

// Shared with the completion handler, which may outlive an abandoned lookup.
struct pending_resolve final {
  explicit pending_resolve(asio::io_context& io) : resolver{io} {}

  tcp::resolver resolver;
  std::promise<std::pair<beast::error_code, tcp::resolver::results_type>>
      done;
};

}  // namespace

std::optional<url_t> try_parse_url(std::string_view url) {
  auto parsed = url_t{};
  if (url.starts_with("https://")) {
    parsed.tls = true;
    url.remove_prefix(8);
  } else if (url.starts_with("http://")) {
    url.remove_prefix(7);
  } else {
    return std::nullopt;
  }

  auto slash = url.find('/');
  auto authority = url.substr(0, slash);
  parsed.target =
      slash == std::string_view::npos ? "/" : std::string{url.substr(slash)};

  auto colon = authority.rfind(':');
  if (colon != std::string_view::npos) {
    auto port = authority.substr(colon + 1);
    auto value = uint16_t{};
    auto [end, error] =
        std::from_chars(port.data(), port.data() + port.size(), value);
    if (error != std::errc{} || end != port.data() + port.size() ||
        value == 0) {
      return std::nullopt;
    }
    parsed.port = std::string{port};
    authority = authority.substr(0, colon);
  } else {
    parsed.port = parsed.tls ? "443" : "80";
  }
  if (authority.empty()) {
    return std::nullopt;
  }
  parsed.host = std::string{authority};
  return parsed;
}

client::client(const std::chrono::milliseconds timeout)
    : timeout_{timeout},
      ssl_context_{asio::ssl::context::tlsv12_client},
      resolver_work_{asio::make_work_guard(resolver_io_)},
      resolver_thread_{[this]() { resolver_io_.run(); }} {
  ssl_context_.set_default_verify_paths();
  ssl_context_.set_verify_mode(asio::ssl::verify_peer);
}

client::~client() {
  resolver_work_.reset();
  resolver_io_.stop();
  resolver_thread_.join();
}

std::optional<tcp::resolver::results_type> client::resolve(const url_t& url) {
  auto pending = std::make_shared<pending_resolve>(resolver_io_);
  auto result = pending->done.get_future();
  asio::post(resolver_io_, [pending, host = url.host, port = url.port]() {
    pending->resolver.async_resolve(
        host, port,
        [pending](const beast::error_code& error,
                  tcp::resolver::results_type results) {
          pending->done.set_value(std::make_pair(error, std::move(results)));
        });
  });

  if (result.wait_for(timeout_) != std::future_status::ready) {
    asio::post(resolver_io_, [pending]() { pending->resolver.cancel(); });
    spdlog::warn("resolving {} timed out after {} ms", url.host,
                 timeout_.count());
    return std::nullopt;
  }
  auto [ec, endpoints] = result.get();
  if (ec) {
    spdlog::warn("failed to resolve {}: {}", url.host, ec.message());
    return std::nullopt;
  }
  return endpoints;
}

std::chrono::milliseconds client::timeout() const { return timeout_; }

std::optional<client_response_t> client::post(const url_t& url,
                                              std::string body,
                                              const header_list_t& headers) {
  auto request = request_t{beast::http::verb::post, url.target, 11};
  request.set(beast::http::field::host, url.host);
  request.set(beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  request.set(beast::http::field::content_type, "application/json");
  for (const auto& [name, value] : headers) {
    request.set(name, value);
  }
  request.body() = std::move(body);
  request.prepare_payload();

  auto endpoints = resolve(url);
  if (!endpoints) {
    return std::nullopt;
  }
  auto io = asio::io_context{};

  if (!url.tls) {
    auto stream = beast::tcp_stream{io};
    stream.expires_after(timeout_);
    auto ec = run_step(io, [&](auto handler) {
      stream.async_connect(*endpoints, std::move(handler));
    });
    if (ec) {
      spdlog::warn("failed to connect to {}:{}: {}", url.host, url.port,
                   ec.message());
      return std::nullopt;
    }
    auto response = exchange(io, stream, request, timeout_);
    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    return response;
  }

  auto stream = beast::ssl_stream<beast::tcp_stream>{io, ssl_context_};
  if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
    spdlog::warn("failed to set SNI for {}", url.host);
    return std::nullopt;
  }
  stream.set_verify_callback(asio::ssl::host_name_verification{url.host});

  beast::get_lowest_layer(stream).expires_after(timeout_);
  auto ec = run_step(io, [&](auto handler) {
    beast::get_lowest_layer(stream).async_connect(*endpoints,
                                                  std::move(handler));
  });
  if (ec) {
    spdlog::warn("failed to connect to {}:{}: {}", url.host, url.port,
                 ec.message());
    return std::nullopt;
  }
  beast::get_lowest_layer(stream).expires_after(timeout_);
  ec = run_step(io, [&](auto handler) {
    stream.async_handshake(asio::ssl::stream_base::client, std::move(handler));
  });
  if (ec) {
    spdlog::warn("tls handshake with {} failed: {}", url.host, ec.message());
    return std::nullopt;
  }
  // The TLS close_notify exchange is skipped; the connection is not reused.
  return exchange(io, stream, request, timeout_);
}

}  // namespace warden::http
