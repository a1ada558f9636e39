#pragma once

#include <warden/http/router.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

namespace warden::http {

struct server_config_t final {
  boost::asio::ip::tcp::endpoint endpoint;
  // Threads running the acceptor and connection io.
  std::size_t io_threads{1};
  // Threads running route handlers.
  std::size_t worker_threads{4};
};

/// Asynchronous HTTP/1.1 server. Connections are served on the io threads;
/// handlers run on a separate worker pool so that blocking upstream calls
/// never stall accepts or other connections.
class server final {
 public:
  server(server_config_t config, const router& routes);
  ~server();

  server(const server&) = delete;
  server& operator=(const server&) = delete;

  /// Binds and starts serving. Returns false when the endpoint cannot be
  /// bound.
  bool start();

  /// Stops accepting, drains the worker pool and joins all threads.
  void stop();

  /// Port actually bound; useful when configured with port 0.
  unsigned short port() const;

 private:
  class listener;

  server_config_t config_;
  const router& routes_;
  boost::asio::io_context io_;
  boost::asio::thread_pool workers_;
  std::shared_ptr<listener> listener_;
  std::vector<std::thread> threads_;
};

}  // namespace warden::http
