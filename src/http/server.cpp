#include <warden/http/server.hpp>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>

namespace asio = boost::asio;
namespace beast = boost::beast;

namespace warden::http {

namespace {

using tcp = asio::ip::tcp;

constexpr auto kReadTimeout = std::chrono::seconds{30};
constexpr auto kBodyLimit = std::size_t{1024 * 1024};

class session final : public std::enable_shared_from_this<session> {
 public:
  session(tcp::socket&& socket, const router& routes,
          asio::thread_pool& workers)
      : stream_{std::move(socket)}, routes_{routes}, workers_{workers} {}

  void run() {
    asio::dispatch(stream_.get_executor(),
                   beast::bind_front_handler(&session::do_read,
                                             shared_from_this()));
  }

 private:
  void do_read() {
    parser_.emplace();
    parser_->body_limit(kBodyLimit);
    stream_.expires_after(kReadTimeout);
    beast::http::async_read(
        stream_, buffer_, *parser_,
        beast::bind_front_handler(&session::on_read, shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t) {
    if (ec == beast::http::error::end_of_stream) {
      return do_close();
    }
    if (ec) {
      if (ec != beast::error::timeout && ec != asio::error::operation_aborted) {
        spdlog::debug("http read failed: {}", ec.message());
      }
      return;
    }

    auto request = std::make_shared<request_t>(parser_->release());
    // Handlers may block on upstream calls; keep them off the io threads.
    asio::post(workers_, [self = shared_from_this(), request]() {
      auto response = std::make_shared<response_t>(
          self->routes_.dispatch(*request));
      asio::post(self->stream_.get_executor(), [self, response]() {
        self->do_write(response);
      });
    });
  }

  void do_write(std::shared_ptr<response_t> response) {
    auto keep_alive = response->keep_alive();
    beast::http::async_write(
        stream_, *response,
        [self = shared_from_this(), response, keep_alive](
            beast::error_code ec, std::size_t) {
          self->on_write(keep_alive, ec);
        });
  }

  void on_write(const bool keep_alive, beast::error_code ec) {
    if (ec) {
      spdlog::debug("http write failed: {}", ec.message());
      return;
    }
    if (!keep_alive) {
      return do_close();
    }
    do_read();
  }

  void do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<beast::http::request_parser<beast::http::string_body>> parser_;
  const router& routes_;
  asio::thread_pool& workers_;
};

}  // namespace

class server::listener final
    : public std::enable_shared_from_this<server::listener> {
 public:
  listener(asio::io_context& io, const router& routes,
           asio::thread_pool& workers)
      : io_{io},
        acceptor_{asio::make_strand(io)},
        routes_{routes},
        workers_{workers} {}

  bool open(const tcp::endpoint& endpoint) {
    auto ec = beast::error_code{};
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
      acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
      acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
      acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
      spdlog::error("failed to listen on {}:{}: {}",
                    endpoint.address().to_string(), endpoint.port(),
                    ec.message());
      return false;
    }
    return true;
  }

  void run() { do_accept(); }

  void close() {
    asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
      auto ec = beast::error_code{};
      self->acceptor_.close(ec);
    });
  }

  unsigned short port() const { return acceptor_.local_endpoint().port(); }

 private:
  void do_accept() {
    acceptor_.async_accept(
        asio::make_strand(io_),
        beast::bind_front_handler(&listener::on_accept, shared_from_this()));
  }

  void on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec == asio::error::operation_aborted) {
      return;
    }
    if (ec) {
      spdlog::warn("accept failed: {}", ec.message());
    } else {
      std::make_shared<session>(std::move(socket), routes_, workers_)->run();
    }
    do_accept();
  }

  asio::io_context& io_;
  tcp::acceptor acceptor_;
  const router& routes_;
  asio::thread_pool& workers_;
};

server::server(server_config_t config, const router& routes)
    : config_{std::move(config)},
      routes_{routes},
      io_{static_cast<int>(std::max<std::size_t>(config_.io_threads, 1))},
      workers_{std::max<std::size_t>(config_.worker_threads, 1)} {}

server::~server() { stop(); }

bool server::start() {
  listener_ = std::make_shared<listener>(io_, routes_, workers_);
  if (!listener_->open(config_.endpoint)) {
    listener_.reset();
    return false;
  }
  listener_->run();
  spdlog::info("http server listening on {}:{}",
               config_.endpoint.address().to_string(), listener_->port());

  const auto count = std::max<std::size_t>(config_.io_threads, 1);
  threads_.reserve(count);
  for (auto i = std::size_t{0}; i < count; ++i) {
    threads_.emplace_back([this]() { io_.run(); });
  }
  return true;
}

void server::stop() {
  if (listener_) {
    listener_->close();
    listener_.reset();
  }
  workers_.join();
  io_.stop();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
}

unsigned short server::port() const {
  return listener_ ? listener_->port() : config_.endpoint.port();
}

}  // namespace warden::http
