#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace warden::chain {

enum class network : uint8_t { devnet, testnet, mainnet, custom };

inline constexpr auto kNetworkMappings = std::array{
    std::pair<std::string_view, network>{"devnet", network::devnet},
    std::pair<std::string_view, network>{"testnet", network::testnet},
    std::pair<std::string_view, network>{"mainnet", network::mainnet},
    std::pair<std::string_view, network>{"custom", network::custom}};

struct endpoints_t final {
  std::string node_url;
  std::string graphql_url;
};

/// Public full node and GraphQL endpoints; std::nullopt for `custom`.
std::optional<endpoints_t> default_endpoints(network value);

}  // namespace warden::chain

namespace warden::schema {

template <>
inline std::optional<warden::chain::network>
try_from_string<warden::chain::network>(const std::string_view value) {
  return from_string(value, warden::chain::kNetworkMappings);
}

}  // namespace warden::schema
