#include <warden/crypto/symmetric.hpp>
#include <warden/service/config.hpp>

#include <boost/endian/conversion.hpp>
#include <boost/program_options.hpp>

#include <array>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace po = boost::program_options;

namespace warden::service {

namespace {

constexpr auto kEnvironment = std::array{
    std::pair<std::string_view, std::string_view>{"MASTER_KEY", "master-key"},
    std::pair<std::string_view, std::string_view>{"KEY_SERVER_OBJECT_ID",
                                                  "key-server-object-id"},
    std::pair<std::string_view, std::string_view>{"ANCHOR_PACKAGE",
                                                  "anchor-package"},
    std::pair<std::string_view, std::string_view>{"NETWORK", "network"},
    std::pair<std::string_view, std::string_view>{"NODE_URL", "node-url"},
    std::pair<std::string_view, std::string_view>{"GRAPHQL_URL",
                                                  "graphql-url"},
    std::pair<std::string_view, std::string_view>{"LISTEN", "listen"},
    std::pair<std::string_view, std::string_view>{"SEED", "seed"}};

warden::schema::object_id_t require_object_id(const po::variables_map& vm,
                                              const char* name) {
  if (!vm.contains(name)) {
    throw std::invalid_argument{std::string{"missing required option --"} +
                                name};
  }
  auto id = warden::schema::try_parse_address(vm[name].as<std::string>());
  if (!id) {
    throw std::invalid_argument{std::string{"--"} + name +
                                " is not a valid object id"};
  }
  return *id;
}

}  // namespace

std::string environment_option(const std::string& variable) {
  for (const auto& [name, option] : kEnvironment) {
    if (name == variable) {
      return std::string{option};
    }
  }
  return {};
}

std::optional<warden::crypto::ed25519::keypair_t> make_ephemeral_keypair(
    const std::optional<uint64_t> seed) {
  if (!seed) {
    return warden::crypto::ed25519::generate_keypair();
  }
  auto seed_bytes = std::array<uint8_t, 8>{};
  boost::endian::store_little_u64(seed_bytes.data(), *seed);
  auto digest = warden::crypto::sha256(seed_bytes);
  return warden::crypto::ed25519::keypair_from_seed(digest);
}

std::optional<config_t> parse_config(const int argc, const char* const argv[],
                                     std::ostream& out) {
  auto config = config_t{};
  auto config_file = std::string{};
  auto network = std::string{};
  auto staleness_ms = uint64_t{};
  auto timeout_ms = uint64_t{};
  auto seed = uint64_t{};

  auto description = po::options_description{"Warden key server"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with the same options")(
      "listen,l", po::value<std::string>(&config.listen)->default_value(config.listen),
      "IP:Port for the HTTP server")(
      "io-threads", po::value<std::size_t>(&config.io_threads)->default_value(config.io_threads),
      "Threads serving connections")(
      "threads,t",
      po::value<std::size_t>(&config.worker_threads)->default_value(config.worker_threads),
      "Threads running request handlers")(
      "master-key", po::value<std::string>(),
      "IBE master key, 32-byte scalar in base64 or 0x-hex")(
      "key-server-object-id", po::value<std::string>(),
      "On-chain key server object id")(
      "anchor-package", po::value<std::string>(),
      "Package that owns the session function")(
      "network",
      po::value<std::string>(&network)->default_value("testnet"),
      ("Sui network: " +
       warden::schema::joined_names(warden::chain::kNetworkMappings))
          .c_str())(
      "node-url", po::value<std::string>(&config.node_url),
      "Full node JSON-RPC URL, overrides the network default")(
      "graphql-url", po::value<std::string>(&config.graphql_url),
      "GraphQL URL, overrides the network default")(
      "allowed-staleness-ms",
      po::value<uint64_t>(&staleness_ms)->default_value(120'000),
      "Largest accepted age of the latest checkpoint")(
      "rpc-timeout-ms", po::value<uint64_t>(&timeout_ms)->default_value(10'000),
      "Timeout of every outbound call")(
      "approve-prefix", po::value<std::vector<std::string>>()->composing(),
      "Accepted approve function prefix (repeatable)")(
      "session-module",
      po::value<std::string>(&config.key_server.session_module)
          ->default_value(config.key_server.session_module),
      "Module of the session function")(
      "session-function",
      po::value<std::string>(&config.key_server.session_function)
          ->default_value(config.key_server.session_function),
      "Name of the session function")(
      "seed", po::value<uint64_t>(&seed),
      "Seed for a deterministic ephemeral keypair")(
      "log-file", po::value<std::string>(&config.log_file)->default_value(config.log_file),
      "Log file path")("verbose,v", "Enable verbose output");

  auto vm = po::variables_map{};
  po::store(po::parse_command_line(argc, argv, description), vm);
  if (vm.contains("config")) {
    po::store(po::parse_config_file<char>(vm["config"].as<std::string>().c_str(),
                                    description),
              vm);
  }
  po::store(po::parse_environment(description, environment_option), vm);
  po::notify(vm);

  if (vm.contains("help")) {
    out << description << std::endl;
    return std::nullopt;
  }
  config.verbose = vm.contains("verbose");

  if (!vm.contains("master-key")) {
    throw std::invalid_argument{"missing required option --master-key"};
  }
  auto master_key_bytes =
      warden::schema::try_decode_binary(vm["master-key"].as<std::string>());
  auto master_key =
      master_key_bytes
          ? warden::crypto::bls12381::try_scalar_from_bytes(*master_key_bytes)
          : std::nullopt;
  if (!master_key) {
    throw std::invalid_argument{"--master-key is not a 32-byte scalar"};
  }
  config.master_key = *master_key;

  config.key_server.key_server_object_id =
      require_object_id(vm, "key-server-object-id");
  config.anchor_package = require_object_id(vm, "anchor-package");

  auto parsed_network =
      warden::schema::try_from_string<warden::chain::network>(network);
  if (!parsed_network) {
    throw std::invalid_argument{"unknown network " + network};
  }
  config.network = *parsed_network;
  if (auto defaults = warden::chain::default_endpoints(config.network)) {
    if (config.node_url.empty()) {
      config.node_url = defaults->node_url;
    }
    if (config.graphql_url.empty()) {
      config.graphql_url = defaults->graphql_url;
    }
  }
  if (config.node_url.empty() || config.graphql_url.empty()) {
    throw std::invalid_argument{
        "--node-url and --graphql-url are required for a custom network"};
  }

  if (vm.contains("approve-prefix")) {
    config.key_server.approve_prefixes =
        vm["approve-prefix"].as<std::vector<std::string>>();
  }
  if (config.worker_threads == 0 || config.io_threads == 0) {
    throw std::invalid_argument{"thread counts must be positive"};
  }
  config.key_server.allowed_staleness = staleness_ms;
  config.rpc_timeout = std::chrono::milliseconds{timeout_ms};
  if (vm.contains("seed")) {
    config.seed = seed;
  }
  return config;
}

}  // namespace warden::service
