#pragma once

#include <warden/chain/network.hpp>
#include <warden/crypto/ed25519.hpp>
#include <warden/crypto/ibe.hpp>
#include <warden/service/key_server.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace warden::service {

struct config_t final {
  std::string listen{"0.0.0.0:2024"};
  std::size_t io_threads{1};
  std::size_t worker_threads{4};
  warden::crypto::ibe::master_key_t master_key;
  warden::schema::object_id_t anchor_package{};
  warden::chain::network network{warden::chain::network::testnet};
  std::string node_url;
  std::string graphql_url;
  std::chrono::milliseconds rpc_timeout{10'000};
  std::chrono::milliseconds checkpoint_interval{10'000};
  std::chrono::milliseconds gas_price_interval{60'000};
  std::chrono::milliseconds package_interval{1'800'000};
  // Deterministic ephemeral keypair, for tests and local runs.
  std::optional<uint64_t> seed;
  std::string log_file{"warden.log"};
  bool verbose{false};
  key_server_config_t key_server;
};

/// Command line, then `--config` INI file, then environment. Earlier
/// sources win. Returns std::nullopt after writing the help text to `out`.
///
/// Throws boost::program_options::error for malformed options and
/// std::invalid_argument for values that do not validate.
std::optional<config_t> parse_config(int argc, const char* const argv[],
                                     std::ostream& out);

/// Environment variable to option name; empty for unrelated variables.
std::string environment_option(const std::string& variable);

/// Ed25519 seed derived from a numeric seed, or a random one.
std::optional<warden::crypto::ed25519::keypair_t> make_ephemeral_keypair(
    std::optional<uint64_t> seed);

}  // namespace warden::service
