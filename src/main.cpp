#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/asio/ip/address.hpp>
#include <sodium.h>
#include <warden/chain/rpc_client.hpp>
#include <warden/common/critical.hpp>
#include <warden/crypto/bls12381.hpp>
#include <warden/http/client.hpp>
#include <warden/http/server.hpp>
#include <warden/service/api.hpp>
#include <warden/service/config.hpp>
#include <warden/service/key_server.hpp>
#include <warden/state/chain_state.hpp>
#include <warden/state/periodic_updater.hpp>

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) { shutdown_requested() = true; }

namespace {

boost::asio::ip::tcp::endpoint parse_listen(const std::string& listen) {
  auto colon = listen.rfind(':');
  if (colon == std::string::npos) {
    warden::common::critical("--listen must be IP:Port");
  }
  auto ec = boost::system::error_code{};
  auto address = boost::asio::ip::make_address(listen.substr(0, colon), ec);
  auto port = uint16_t{};
  auto port_text = std::string_view{listen}.substr(colon + 1);
  auto [end, error] = std::from_chars(
      port_text.data(), port_text.data() + port_text.size(), port);
  if (ec || error != std::errc{} || end != port_text.data() + port_text.size()) {
    warden::common::critical("--listen must be IP:Port");
  }
  return {address, port};
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto config = std::optional<warden::service::config_t>{};
  try {
    config = warden::service::parse_config(argc, argv, std::cout);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << std::endl;
    return 1;
  }
  if (!config) {
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      config->log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "warden", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(config->verbose ? spdlog::level::debug
                                    : spdlog::level::info);

  if (sodium_init() < 0) {
    warden::common::critical("failed to initialize libsodium");
  }
  warden::crypto::bls12381::init();

  auto keypair = warden::service::make_ephemeral_keypair(config->seed);
  if (!keypair) {
    warden::common::critical("failed to create the ephemeral keypair");
  }
  auto issuer = warden::auth::session_token_issuer::from_keypair(*keypair);
  if (!issuer) {
    warden::common::critical("failed to derive the session token key");
  }

  auto node_url = warden::http::try_parse_url(config->node_url);
  auto graphql_url = warden::http::try_parse_url(config->graphql_url);
  if (!node_url || !graphql_url) {
    warden::common::critical("invalid node or graphql url");
  }

  auto http = warden::http::client{config->rpc_timeout};
  auto chain = warden::chain::rpc_client{*node_url, *graphql_url, http};
  auto state = warden::state::chain_state{config->anchor_package};

  // The first fetch of every value must succeed before serving.
  auto updaters = std::vector<std::unique_ptr<warden::state::periodic_updater>>{};
  updaters.push_back(std::make_unique<warden::state::periodic_updater>(
      "latest checkpoint timestamp", config->checkpoint_interval,
      [&chain, &state]() {
        return warden::state::refresh_checkpoint_timestamp(chain, state);
      }));
  updaters.push_back(std::make_unique<warden::state::periodic_updater>(
      "reference gas price", config->gas_price_interval,
      [&chain, &state]() {
        return warden::state::refresh_reference_gas_price(chain, state);
      }));
  updaters.push_back(std::make_unique<warden::state::periodic_updater>(
      "anchor package", config->package_interval,
      [&chain, &state, anchor = config->anchor_package]() {
        return warden::state::refresh_anchor_package(chain, state, anchor);
      }));
  for (auto& updater : updaters) {
    if (!updater->start()) {
      warden::common::critical("initial chain fetch failed");
    }
  }

  auto metrics = warden::service::request_metrics{};
  auto server = warden::service::key_server{
      config->key_server,     config->master_key,
      chain,                  state,
      std::move(*issuer),     metrics,
      warden::service::system_now};
  spdlog::info("key server {} ready, public key {}",
               warden::schema::to_address_string(
                   config->key_server.key_server_object_id),
               warden::schema::to_base64(
                   warden::crypto::bls12381::to_bytes(server.public_key())));

  auto routes = warden::service::make_router(server, metrics);
  auto http_server = warden::http::server{
      warden::http::server_config_t{.endpoint = parse_listen(config->listen),
                                    .io_threads = config->io_threads,
                                    .worker_threads = config->worker_threads},
      routes};
  if (!http_server.start()) {
    warden::common::critical("failed to start the http server");
  }

  auto ticks = 0;
  while (!shutdown_requested()) {
    std::this_thread::sleep_for(std::chrono::seconds(1));
    if (++ticks % 60 == 0) {
      metrics.log_summary();
    }
  }

  spdlog::info("shutting down");
  http_server.stop();
  for (auto& updater : updaters) {
    updater->stop();
  }
  metrics.log_summary();
  spdlog::shutdown();
  return 0;
}
