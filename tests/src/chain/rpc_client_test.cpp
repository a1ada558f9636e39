#include <gtest/gtest.h>
#include <warden/chain/network.hpp>
#include <warden/chain/rpc_client.hpp>
#include <warden/http/server.hpp>
#include <warden/testing/common.hpp>

#include <google/protobuf/util/json_util.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace http = boost::beast::http;

namespace {

google::protobuf::Struct parse(const std::string& json) {
  auto out = google::protobuf::Struct{};
  EXPECT_TRUE(google::protobuf::util::JsonStringToMessage(json, &out).ok());
  return out;
}

std::string string_at(const google::protobuf::Struct& object,
                      std::initializer_list<std::string_view> path) {
  const auto* value = warden::chain::json::find(object, path);
  return value != nullptr ? value->string_value() : std::string{};
}

/// Loopback full node: JSON-RPC on `/` and GraphQL on `/graphql`, answering
/// with canned bodies keyed by method name or query root field.
class fake_node final {
 public:
  std::map<std::string, std::string> rpc_results;
  std::map<std::string, std::string> graphql_bodies;
  std::string last_dry_run;

  fake_node() {
    routes_.add(http::verb::post, "/",
                [this](const warden::http::request_t& request) {
                  auto body = parse(request.body());
                  auto method = string_at(body, {"method"});
                  if (method == "sui_dryRunTransactionBlock") {
                    last_dry_run = body.fields()
                                       .at("params")
                                       .list_value()
                                       .values(0)
                                       .string_value();
                  }
                  auto it = rpc_results.find(method);
                  auto reply =
                      it == rpc_results.end()
                          ? std::string{R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"unknown"}})"}
                          : R"({"jsonrpc":"2.0","id":1,"result":)" +
                                it->second + "}";
                  return warden::http::make_json_response(request, 200,
                                                          std::move(reply));
                });
    routes_.add(http::verb::post, "/graphql",
                [this](const warden::http::request_t& request) {
                  auto query = string_at(parse(request.body()), {"query"});
                  for (const auto& [field, reply] : graphql_bodies) {
                    if (query.find(field) != std::string::npos) {
                      return warden::http::make_json_response(request, 200,
                                                              reply);
                    }
                  }
                  return warden::http::make_json_response(request, 500, "{}");
                });
    server_ = std::make_unique<warden::http::server>(
        warden::http::server_config_t{
            .endpoint = {boost::asio::ip::make_address("127.0.0.1"), 0},
            .io_threads = 1,
            .worker_threads = 1},
        routes_);
  }

  bool start() { return server_->start(); }

  warden::http::url_t url(const std::string& path) const {
    return warden::http::try_parse_url("http://127.0.0.1:" +
                                       std::to_string(server_->port()) + path)
        .value();
  }

 private:
  warden::http::router routes_;
  std::unique_ptr<warden::http::server> server_;
};

class rpc_client_test : public ::testing::Test {
 protected:
  void SetUp() override { ASSERT_TRUE(node_.start()); }

  warden::chain::rpc_client make_client() {
    return warden::chain::rpc_client{node_.url("/"), node_.url("/graphql"),
                                     http_};
  }

  fake_node node_;
  warden::http::client http_{std::chrono::milliseconds{2000}};
};

}  // namespace

TEST(chain_json, find_walks_nested_objects) {
  auto object = parse(R"({"effects":{"status":{"status":"success"}}})");
  const auto* value =
      warden::chain::json::find(object, {"effects", "status", "status"});
  ASSERT_NE(value, nullptr);
  EXPECT_EQ(value->string_value(), "success");
  EXPECT_EQ(warden::chain::json::find(object, {"effects", "missing"}),
            nullptr);
  EXPECT_EQ(
      warden::chain::json::find(object, {"effects", "status", "status", "x"}),
      nullptr);
}

TEST(chain_json, try_u64_accepts_strings_and_exact_numbers) {
  auto object = parse(
      R"({"a":"18446744073709551615","b":42,"c":1.5,"d":-1,"e":"12x","f":true})");
  const auto& fields = object.fields();
  EXPECT_EQ(warden::chain::json::try_u64(fields.at("a")),
            uint64_t{18446744073709551615u});
  EXPECT_EQ(warden::chain::json::try_u64(fields.at("b")), 42u);
  EXPECT_FALSE(warden::chain::json::try_u64(fields.at("c")));
  EXPECT_FALSE(warden::chain::json::try_u64(fields.at("d")));
  EXPECT_FALSE(warden::chain::json::try_u64(fields.at("e")));
  EXPECT_FALSE(warden::chain::json::try_u64(fields.at("f")));
}

TEST(chain_network, public_networks_have_default_endpoints) {
  auto testnet = warden::chain::default_endpoints(warden::chain::network::testnet);
  ASSERT_TRUE(testnet.has_value());
  EXPECT_EQ(testnet->node_url, "https://fullnode.testnet.sui.io:443");
  EXPECT_FALSE(warden::chain::default_endpoints(warden::chain::network::custom));
  EXPECT_EQ(warden::schema::try_from_string<warden::chain::network>("mainnet"),
            warden::chain::network::mainnet);
}

TEST_F(rpc_client_test, reads_the_latest_checkpoint_timestamp) {
  node_.rpc_results["sui_getLatestCheckpointSequenceNumber"] = R"("1234")";
  node_.rpc_results["sui_getCheckpoint"] =
      R"({"sequenceNumber":"1234","timestampMs":"1700000000000"})";
  auto client = make_client();
  EXPECT_EQ(client.latest_checkpoint_timestamp(), 1'700'000'000'000u);
}

TEST_F(rpc_client_test, reads_the_reference_gas_price) {
  node_.rpc_results["suix_getReferenceGasPrice"] = R"("750")";
  auto client = make_client();
  EXPECT_EQ(client.reference_gas_price(), 750u);
}

TEST_F(rpc_client_test, rpc_errors_are_reported_as_missing_values) {
  auto client = make_client();
  EXPECT_FALSE(client.reference_gas_price());
  EXPECT_FALSE(client.latest_checkpoint_timestamp());
}

TEST_F(rpc_client_test, resolves_package_lineage) {
  auto first = warden::testing::make_hash(0x01);
  auto latest = warden::testing::make_hash(0x02);
  node_.graphql_bodies["latestPackage"] =
      R"({"data":{"latestPackage":{"address":")" +
      warden::schema::to_address_string(latest) +
      R"(","packageAtVersion":{"address":")" +
      warden::schema::to_address_string(first) + R"("}}}})";
  auto client = make_client();
  auto lookup = client.resolve_package(first);
  EXPECT_EQ(lookup.status, warden::chain::lookup_status::found);
  EXPECT_EQ(lookup.versions.first, first);
  EXPECT_EQ(lookup.versions.latest, latest);
}

TEST_F(rpc_client_test, unknown_packages_are_not_found) {
  node_.graphql_bodies["latestPackage"] = R"({"data":{"latestPackage":null}})";
  auto client = make_client();
  EXPECT_EQ(client.resolve_package(warden::testing::make_hash(0x01)).status,
            warden::chain::lookup_status::not_found);
}

TEST_F(rpc_client_test, graphql_errors_fail_the_lookup) {
  node_.graphql_bodies["latestPackage"] =
      R"({"errors":[{"message":"rate limited"}]})";
  auto client = make_client();
  EXPECT_EQ(client.resolve_package(warden::testing::make_hash(0x01)).status,
            warden::chain::lookup_status::failed);
}

TEST_F(rpc_client_test, dry_run_maps_effects_status) {
  auto client = make_client();
  auto transaction = warden::schema::bytes_t{1, 2, 3};

  node_.rpc_results["sui_dryRunTransactionBlock"] =
      R"({"effects":{"status":{"status":"success"}}})";
  EXPECT_EQ(client.dry_run(transaction),
            warden::chain::dry_run_status::success);
  EXPECT_EQ(node_.last_dry_run, warden::schema::to_base64(transaction));

  node_.rpc_results["sui_dryRunTransactionBlock"] =
      R"({"effects":{"status":{"status":"failure","error":"MoveAbort"}}})";
  EXPECT_EQ(client.dry_run(transaction), warden::chain::dry_run_status::denied);

  node_.rpc_results["sui_dryRunTransactionBlock"] = R"({"effects":{}})";
  EXPECT_EQ(client.dry_run(transaction), warden::chain::dry_run_status::failed);

  node_.rpc_results.erase("sui_dryRunTransactionBlock");
  EXPECT_EQ(client.dry_run(transaction), warden::chain::dry_run_status::failed);
}

TEST_F(rpc_client_test, zklogin_verification_reads_success) {
  node_.graphql_bodies["verifyZkloginSignature"] =
      R"({"data":{"verifyZkloginSignature":{"success":true,"errors":[]}}})";
  auto client = make_client();
  EXPECT_EQ(client.verify_zklogin_signature(warden::schema::bytes_t{1},
                                            warden::schema::bytes_t{5},
                                            warden::testing::make_hash(3)),
            true);
}

TEST(rpc_client, unreachable_nodes_fail) {
  auto http = warden::http::client{std::chrono::milliseconds{500}};
  auto url = warden::http::try_parse_url("http://127.0.0.1:1/").value();
  auto client = warden::chain::rpc_client{url, url, http};
  EXPECT_FALSE(client.reference_gas_price());
  EXPECT_EQ(client.resolve_package(warden::testing::make_hash(1)).status,
            warden::chain::lookup_status::failed);
  EXPECT_EQ(client.dry_run(warden::schema::bytes_t{1}),
            warden::chain::dry_run_status::failed);
}

TEST(rpc_client, name_resolution_is_bounded_by_the_timeout) {
  auto http = warden::http::client{std::chrono::milliseconds{300}};
  auto url = warden::http::try_parse_url("http://warden-node.invalid:9000/");
  ASSERT_TRUE(url.has_value());
  const auto started = std::chrono::steady_clock::now();
  EXPECT_FALSE(http.post(*url, "{}"));
  // Lookup, connect and exchange each get the timeout at most.
  EXPECT_LT(std::chrono::steady_clock::now() - started,
            std::chrono::milliseconds{1500});
}
