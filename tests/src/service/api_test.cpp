#include <gtest/gtest.h>
#include <warden/crypto/verify.hpp>
#include <warden/service/api.hpp>
#include <warden/service/wire.hpp>
#include <warden/testing/fake_chain_client.hpp>
#include <warden/testing/log_capture.hpp>
#include <warden/testing/request_fixture.hpp>

#include <spdlog/fmt/fmt.h>

#include <memory>
#include <string>
#include <variant>

namespace {

using boost::beast::http::verb;
using warden::schema::error_code;

constexpr auto kNow = uint64_t{1'700'000'000'000};

std::string to_request_json(
    const warden::service::fetch_key_request_t& request) {
  const auto& certificate = request.certificate;
  return fmt::format(
      R"({{"ptb":"{}","enc_key":"{}","enc_verification_key":"{}",)"
      R"("request_signature":"{}","certificate":{{"user":"{}",)"
      R"("session_vk":"{}","creation_time":{},"ttl_min":{},"signature":"{}"}}}})",
      warden::schema::to_base64(request.ptb),
      warden::schema::to_base64(request.enc_key),
      warden::schema::to_base64(request.enc_verification_key),
      warden::schema::to_base64(request.request_signature),
      warden::schema::to_address_string(certificate.user),
      warden::schema::to_base64(certificate.session_vk),
      certificate.creation_time, certificate.ttl_min,
      warden::schema::to_base64(certificate.signature));
}

error_code parse_error(std::string_view json) {
  auto parsed = warden::service::try_parse_fetch_key_request(json);
  EXPECT_TRUE(std::holds_alternative<error_code>(parsed));
  return std::holds_alternative<error_code>(parsed)
             ? std::get<error_code>(parsed)
             : error_code::failure;
}

class api_test : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!warden::crypto::available()) {
      GTEST_SKIP() << "OpenSSL backend does not expose required crypto "
                      "providers";
    }
    chain_.checkpoint_timestamp = kNow;
    chain_.publish(package_, package_);
    chain_.publish(anchor_, anchor_);
    ASSERT_TRUE(warden::state::refresh_checkpoint_timestamp(chain_, state_));
    ASSERT_TRUE(warden::state::refresh_reference_gas_price(chain_, state_));

    server_ = std::make_unique<warden::service::key_server>(
        warden::service::key_server_config_t{
            .key_server_object_id = warden::testing::make_hash(0x77)},
        warden::crypto::ibe::generate_master_keypair().master_key, chain_,
        state_,
        warden::auth::session_token_issuer::from_keypair(
            warden::testing::make_ed25519_keypair(0x44))
            .value(),
        metrics_, []() { return kNow; });
    router_ = std::make_unique<warden::http::router>(
        warden::service::make_router(*server_, metrics_));
  }

  warden::http::response_t call(const verb method, const std::string& target,
                                std::string body = {},
                                std::string request_id = {}) const {
    auto request = warden::http::request_t{method, target, 11};
    if (!request_id.empty()) {
      request.set("Request-Id", request_id);
    }
    request.body() = std::move(body);
    request.prepare_payload();
    return router_->dispatch(request);
  }

  warden::service::fetch_key_request_t make_request() const {
    return fixture_.make_request(package_, package_,
                                 {warden::schema::bytes_t{0x01}},
                                 kNow - 60'000);
  }

  const warden::schema::object_id_t package_{warden::testing::make_hash(0x10)};
  const warden::schema::object_id_t anchor_{warden::testing::make_hash(0x30)};

  warden::testing::request_fixture fixture_;
  warden::testing::fake_chain_client chain_;
  warden::state::chain_state state_{anchor_};
  warden::service::request_metrics metrics_;
  std::unique_ptr<warden::service::key_server> server_;
  std::unique_ptr<warden::http::router> router_;
};

}  // namespace

TEST_F(api_test, request_json_decodes_every_field) {
  auto request = make_request();
  auto parsed =
      warden::service::try_parse_fetch_key_request(to_request_json(request));
  ASSERT_TRUE(
      std::holds_alternative<warden::service::fetch_key_request_t>(parsed));
  const auto& decoded = std::get<warden::service::fetch_key_request_t>(parsed);
  EXPECT_EQ(decoded.ptb, request.ptb);
  EXPECT_EQ(decoded.enc_key, request.enc_key);
  EXPECT_EQ(decoded.enc_verification_key, request.enc_verification_key);
  EXPECT_EQ(decoded.request_signature, request.request_signature);
  EXPECT_EQ(decoded.certificate.user, request.certificate.user);
  EXPECT_EQ(decoded.certificate.session_vk, request.certificate.session_vk);
  EXPECT_EQ(decoded.certificate.creation_time,
            request.certificate.creation_time);
  EXPECT_EQ(decoded.certificate.ttl_min, request.certificate.ttl_min);
  EXPECT_EQ(decoded.certificate.signature, request.certificate.signature);
}

TEST_F(api_test, undecodable_fields_map_to_the_check_they_fail) {
  auto json = to_request_json(make_request());
  auto replace = [&json](const std::string& from, const std::string& to) {
    auto out = json;
    auto at = out.find(from);
    EXPECT_NE(at, std::string::npos) << from;
    out.replace(at, from.size(), to);
    return out;
  };

  EXPECT_EQ(parse_error("{not json"), error_code::invalid_input);
  EXPECT_EQ(parse_error(R"({"ptb":""})"), error_code::invalid_certificate);
  EXPECT_EQ(parse_error(replace(R"("ptb":")", R"("ptb":"@@)")),
            error_code::invalid_ptb);
  EXPECT_EQ(parse_error(replace(R"("enc_key":")", R"("enc_key":"@@)")),
            error_code::invalid_input);
  EXPECT_EQ(parse_error(replace(R"("request_signature":")",
                                R"("request_signature":"AAAA",)"
                                R"("ignored":")")),
            error_code::invalid_session_signature);
  EXPECT_EQ(parse_error(replace(R"("user":"0x)", R"("user":"0xZZ)")),
            error_code::invalid_certificate);
  EXPECT_EQ(parse_error(replace(R"("ttl_min":10)", R"("ttl_min":70000)")),
            error_code::invalid_certificate);
  EXPECT_EQ(parse_error(replace(R"("signature":")",
                                R"("signature":"","other":")")),
            error_code::invalid_signature);
}

TEST(api_wire, session_token_json_prints_milliseconds) {
  auto json = warden::service::to_json(warden::service::session_token_t{
      .auth_token = "a.b.c", .expires_at = 1700000600000, .profile = "0xab"});
  ASSERT_TRUE(json.has_value());
  EXPECT_NE(json->find(R"("auth_token":"a.b.c")"), std::string::npos);
  EXPECT_NE(json->find(R"("expires_at":"1700000600000")"), std::string::npos);
  EXPECT_NE(json->find(R"("profile":"0xab")"), std::string::npos);

  auto anonymous = warden::service::to_json(
      warden::service::session_token_t{.auth_token = "t", .expires_at = 1});
  ASSERT_TRUE(anonymous.has_value());
  EXPECT_EQ(anonymous->find("profile"), std::string::npos);
}

TEST(api_wire, error_json_names_the_tag_and_message) {
  auto json = warden::service::error_json(error_code::old_package_version);
  EXPECT_NE(json.find(R"("error":"OldPackageVersion")"), std::string::npos);
  EXPECT_NE(json.find("please use the latest version"), std::string::npos);
  EXPECT_EQ(warden::service::health_json(), R"({"status":"ok"})");
}

TEST_F(api_test, health_and_service) {
  auto health = call(verb::get, "/health");
  EXPECT_EQ(health.result_int(), 200u);
  EXPECT_EQ(health.body(), R"({"status":"ok"})");

  auto service = call(verb::get, "/v1/service");
  EXPECT_EQ(service.result_int(), 200u);
  EXPECT_NE(service.body().find(fmt::format(
                R"("service_id":"{}")",
                warden::schema::to_address_string(
                    warden::testing::make_hash(0x77)))),
            std::string::npos);
  EXPECT_NE(service.body().find(R"("pop":")"), std::string::npos);
  EXPECT_EQ(metrics_.requests(warden::service::endpoint::health), 1u);
  EXPECT_EQ(metrics_.requests(warden::service::endpoint::get_service), 1u);
}

TEST_F(api_test, fetch_key_returns_one_key_with_two_ciphertext_points) {
  auto response =
      call(verb::post, "/v1/fetch_key", to_request_json(make_request()));
  ASSERT_EQ(response.result_int(), 200u) << response.body();
  EXPECT_EQ(response[boost::beast::http::field::content_type],
            "application/json");
  const auto& body = response.body();
  EXPECT_NE(body.find(R"("decryption_keys")"), std::string::npos);

  auto count = std::size_t{0};
  for (auto at = body.find(R"("encrypted_key")"); at != std::string::npos;
       at = body.find(R"("encrypted_key")", at + 1)) {
    ++count;
  }
  EXPECT_EQ(count, 1u);
}

TEST_F(api_test, rejections_carry_status_and_tag) {
  auto malformed = call(verb::post, "/v1/fetch_key", "{");
  EXPECT_EQ(malformed.result_int(), 403u);
  EXPECT_NE(malformed.body().find("InvalidInput"), std::string::npos);
  EXPECT_EQ(metrics_.requests(warden::service::endpoint::fetch_key), 1u);
  EXPECT_EQ(metrics_.errors(error_code::invalid_input), 1u);

  chain_.checkpoint_timestamp = kNow - 200'000;
  ASSERT_TRUE(warden::state::refresh_checkpoint_timestamp(chain_, state_));
  auto stale =
      call(verb::post, "/v1/fetch_key", to_request_json(make_request()));
  EXPECT_EQ(stale.result_int(), 503u);
  EXPECT_NE(stale.body().find("SuiClientNotFresh"), std::string::npos);

  EXPECT_EQ(call(verb::get, "/v1/fetch_key").result_int(), 405u);
  EXPECT_EQ(call(verb::get, "/v2/fetch_key").result_int(), 404u);
}

TEST_F(api_test, a_stale_chain_outranks_a_malformed_body) {
  chain_.checkpoint_timestamp = kNow - 200'000;
  ASSERT_TRUE(warden::state::refresh_checkpoint_timestamp(chain_, state_));

  for (const auto* target :
       {"/v1/fetch_key", "/auth/session_token", "/auth/encrypted_session_token"}) {
    auto response = call(verb::post, target, "{");
    EXPECT_EQ(response.result_int(), 503u) << target;
    EXPECT_NE(response.body().find("SuiClientNotFresh"), std::string::npos)
        << target;
  }
  EXPECT_EQ(metrics_.errors(error_code::sui_client_not_fresh), 3u);
  EXPECT_EQ(metrics_.errors(error_code::invalid_input), 0u);
}

TEST_F(api_test, malformed_bodies_are_logged_with_the_request_id) {
  auto capture = warden::testing::log_capture{};
  auto response = call(verb::post, "/v1/fetch_key", "{", "req-42");
  EXPECT_EQ(response.result_int(), 403u);
  EXPECT_NE(capture.text().find("request req-42 rejected: InvalidInput"),
            std::string::npos)
      << capture.text();
}

TEST_F(api_test, pipeline_rejections_are_logged_with_the_request_id) {
  auto request = make_request();
  request.ptb = warden::schema::bytes_t{0xFF};
  auto capture = warden::testing::log_capture{};
  auto response =
      call(verb::post, "/v1/fetch_key", to_request_json(request), "req-7");
  EXPECT_EQ(response.result_int(), 403u);
  EXPECT_NE(capture.text().find("request req-7 rejected: InvalidPTB"),
            std::string::npos)
      << capture.text();
}

TEST_F(api_test, session_endpoints_round_trip_a_token) {
  auto profile = warden::testing::make_hash(0x55);
  auto request = fixture_.make_request(
      anchor_, anchor_, {warden::schema::bytes_t{profile.begin(), profile.end()}},
      kNow - 60'000, "warden", "seal_approve_session");
  auto issued =
      call(verb::post, "/auth/session_token", to_request_json(request));
  ASSERT_EQ(issued.result_int(), 200u) << issued.body();

  auto token = std::get<warden::service::session_token_t>(
                   server_->session_token(request))
                   .auth_token;
  auto session_request = warden::http::request_t{verb::get, "/auth/session", 11};
  session_request.set(boost::beast::http::field::authorization,
                      "Bearer " + token);
  auto session = router_->dispatch(session_request);
  ASSERT_EQ(session.result_int(), 200u) << session.body();
  EXPECT_NE(session.body().find(warden::schema::to_address_string(
                fixture_.user())),
            std::string::npos);

  auto anonymous = call(verb::get, "/auth/session");
  EXPECT_EQ(anonymous.result_int(), 401u);
  EXPECT_NE(anonymous.body().find("MissingAuthToken"), std::string::npos);

  auto sealed = call(verb::post, "/auth/encrypted_session_token",
                     to_request_json(request));
  ASSERT_EQ(sealed.result_int(), 200u) << sealed.body();
  EXPECT_NE(sealed.body().find(R"("encrypted_data")"), std::string::npos);
}
