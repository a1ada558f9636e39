#include <warden/chain/network.hpp>

#include <spdlog/fmt/fmt.h>

namespace warden::chain {

std::optional<endpoints_t> default_endpoints(const network value) {
  auto name = warden::schema::to_string(value, kNetworkMappings);
  if (value == network::custom || !name) {
    return std::nullopt;
  }
  return endpoints_t{
      .node_url = fmt::format("https://fullnode.{}.sui.io:443", *name),
      .graphql_url = fmt::format("https://sui-{}.mystenlabs.com/graphql", *name)};
}

}  // namespace warden::chain
