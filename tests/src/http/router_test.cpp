#include <gtest/gtest.h>
#include <warden/http/client.hpp>
#include <warden/http/router.hpp>

#include <stdexcept>

namespace http = boost::beast::http;

namespace {

warden::http::request_t make_request(const http::verb method,
                                     const std::string& target) {
  auto request = warden::http::request_t{method, target, 11};
  request.set(http::field::host, "localhost");
  return request;
}

warden::http::router make_routes() {
  auto routes = warden::http::router{};
  routes.add(http::verb::get, "/health",
             [](const warden::http::request_t& request) {
               return warden::http::make_json_response(request, 200,
                                                       R"({"status":"ok"})");
             });
  routes.add(http::verb::post, "/boom",
             [](const warden::http::request_t&) -> warden::http::response_t {
               throw std::runtime_error{"boom"};
             });
  return routes;
}

}  // namespace

TEST(http_router, dispatches_by_method_and_path) {
  auto routes = make_routes();
  auto response = routes.dispatch(make_request(http::verb::get, "/health"));
  EXPECT_EQ(response.result_int(), 200u);
  EXPECT_EQ(response.body(), R"({"status":"ok"})");
  EXPECT_EQ(response[http::field::content_type], "application/json");
}

TEST(http_router, ignores_the_query_string) {
  auto routes = make_routes();
  auto response =
      routes.dispatch(make_request(http::verb::get, "/health?verbose=1"));
  EXPECT_EQ(response.result_int(), 200u);
}

TEST(http_router, unknown_paths_are_not_found) {
  auto routes = make_routes();
  auto response = routes.dispatch(make_request(http::verb::get, "/missing"));
  EXPECT_EQ(response.result_int(), 404u);
}

TEST(http_router, wrong_methods_are_not_allowed) {
  auto routes = make_routes();
  auto response = routes.dispatch(make_request(http::verb::post, "/health"));
  EXPECT_EQ(response.result_int(), 405u);
}

TEST(http_router, throwing_handlers_fail_closed) {
  auto routes = make_routes();
  auto response = routes.dispatch(make_request(http::verb::post, "/boom"));
  EXPECT_EQ(response.result_int(), 503u);
  EXPECT_NE(response.body().find("Failure"), std::string::npos);
}

TEST(http_router, find_header_is_case_insensitive) {
  auto request = make_request(http::verb::get, "/health");
  request.set("Request-Id", "abc");
  EXPECT_EQ(warden::http::find_header(request, "request-id"), "abc");
  EXPECT_FALSE(warden::http::find_header(request, "Client-Sdk-Version"));
}

TEST(http_client, parses_urls) {
  auto url = warden::http::try_parse_url("https://fullnode.testnet.sui.io:443");
  ASSERT_TRUE(url.has_value());
  EXPECT_TRUE(url->tls);
  EXPECT_EQ(url->host, "fullnode.testnet.sui.io");
  EXPECT_EQ(url->port, "443");
  EXPECT_EQ(url->target, "/");

  auto plain = warden::http::try_parse_url("http://127.0.0.1/graphql");
  ASSERT_TRUE(plain.has_value());
  EXPECT_FALSE(plain->tls);
  EXPECT_EQ(plain->port, "80");
  EXPECT_EQ(plain->target, "/graphql");

  EXPECT_FALSE(warden::http::try_parse_url("ftp://example.com"));
  EXPECT_FALSE(warden::http::try_parse_url("https://"));
}
