#pragma once

#include <warden/chain/chain_client.hpp>
#include <warden/http/client.hpp>

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace warden::chain {

/// chain_client over a Sui full node's JSON-RPC endpoint and the GraphQL
/// service. Every call is a single blocking round trip with the http
/// client's timeout.
class rpc_client final : public chain_client {
 public:
  rpc_client(warden::http::url_t node_url, warden::http::url_t graphql_url,
             warden::http::client& http);

  std::optional<warden::schema::timestamp_milliseconds_t>
  latest_checkpoint_timestamp() override;

  std::optional<uint64_t> reference_gas_price() override;

  package_lookup_t resolve_package(
      const warden::schema::object_id_t& package) override;

  dry_run_status dry_run(
      const warden::schema::bytes_view_t& transaction_data) override;

  std::optional<bool> verify_zklogin_signature(
      const warden::schema::bytes_view_t& personal_message,
      const warden::schema::bytes_view_t& signature,
      const warden::schema::address_t& author) override;

 private:
  /// `result` of a JSON-RPC call, std::nullopt on transport or RPC error.
  std::optional<google::protobuf::Value> call(
      std::string_view method, google::protobuf::ListValue params);

  /// `data` of a GraphQL query, std::nullopt when `errors` is present.
  std::optional<google::protobuf::Struct> query(
      std::string_view document, google::protobuf::Struct variables);

  std::optional<google::protobuf::Struct> post_json(
      const warden::http::url_t& url, const google::protobuf::Struct& body);

  warden::http::url_t node_url_;
  warden::http::url_t graphql_url_;
  warden::http::client& http_;
};

namespace json {

/// Value at `path` inside nested objects, nullptr when any step is missing.
const google::protobuf::Value* find(const google::protobuf::Struct& object,
                                    std::initializer_list<std::string_view>
                                        path);

/// Sui encodes u64 as decimal strings; plain numbers are accepted too.
std::optional<uint64_t> try_u64(const google::protobuf::Value& value);

}  // namespace json

}  // namespace warden::chain
