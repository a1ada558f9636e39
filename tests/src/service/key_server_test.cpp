#include <gtest/gtest.h>
#include <warden/crypto/verify.hpp>
#include <warden/service/key_server.hpp>
#include <warden/testing/fake_chain_client.hpp>
#include <warden/testing/log_capture.hpp>
#include <warden/testing/request_fixture.hpp>

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace {

using warden::schema::bytes_t;
using warden::schema::error_code;

constexpr auto kNow = uint64_t{1'700'000'000'000};
constexpr auto kMinute = uint64_t{60'000};

class key_server_test : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!warden::crypto::available()) {
      GTEST_SKIP() << "OpenSSL backend does not expose required crypto "
                      "providers";
    }
    chain_.checkpoint_timestamp = kNow;
    chain_.publish(policy_package_, policy_package_);
    chain_.publish(upgraded_first_, upgraded_latest_);
    chain_.publish(anchor_, anchor_);
    ASSERT_TRUE(warden::state::refresh_checkpoint_timestamp(chain_, state_));
    ASSERT_TRUE(warden::state::refresh_reference_gas_price(chain_, state_));
    ASSERT_TRUE(warden::state::refresh_anchor_package(chain_, state_, anchor_));

    server_ = std::make_unique<warden::service::key_server>(
        warden::service::key_server_config_t{
            .key_server_object_id = object_id_},
        master_.master_key, chain_, state_,
        warden::auth::session_token_issuer::from_keypair(
            warden::testing::make_ed25519_keypair(0x44))
            .value(),
        metrics_, [this]() { return now_; });
  }

  warden::service::fetch_key_request_t make_request(
      const std::vector<bytes_t>& identities = {bytes_t{0xAA}}) const {
    return fixture_.make_request(policy_package_, policy_package_, identities,
                                 kNow - kMinute);
  }

  warden::service::fetch_key_request_t make_session_request() const {
    auto profile = warden::testing::make_hash(0x55);
    return fixture_.make_request(
        anchor_, anchor_, {bytes_t{profile.begin(), profile.end()}},
        kNow - kMinute, "warden", "seal_approve_session");
  }

  template <typename T>
  static error_code error_of(const std::variant<T, error_code>& result) {
    EXPECT_TRUE(std::holds_alternative<error_code>(result));
    return std::holds_alternative<error_code>(result)
               ? std::get<error_code>(result)
               : error_code::failure;
  }

  std::vector<warden::service::decryption_key_t> fetch(
      const warden::service::fetch_key_request_t& request) {
    auto result = server_->fetch_key(request);
    if (const auto* code = std::get_if<error_code>(&result)) {
      ADD_FAILURE() << "fetch_key rejected: "
                    << warden::schema::to_string(*code);
      return {};
    }
    return std::get<std::vector<warden::service::decryption_key_t>>(result);
  }

  const warden::schema::object_id_t object_id_{warden::testing::make_hash(0x77)};
  const warden::schema::object_id_t policy_package_{
      warden::testing::make_hash(0x10)};
  const warden::schema::object_id_t upgraded_first_{
      warden::testing::make_hash(0x20)};
  const warden::schema::object_id_t upgraded_latest_{
      warden::testing::make_hash(0x21)};
  const warden::schema::object_id_t anchor_{warden::testing::make_hash(0x30)};

  warden::crypto::ibe::master_keypair_t master_{
      warden::crypto::ibe::generate_master_keypair()};
  warden::testing::request_fixture fixture_;
  warden::testing::fake_chain_client chain_;
  warden::state::chain_state state_{anchor_};
  warden::service::request_metrics metrics_;
  warden::schema::timestamp_milliseconds_t now_{kNow};
  std::unique_ptr<warden::service::key_server> server_;
};

}  // namespace

TEST_F(key_server_test, issues_one_verifiable_key_for_the_identity) {
  auto keys = fetch(make_request({bytes_t{0x01}}));
  ASSERT_EQ(keys.size(), 1u);

  auto expected_id =
      warden::crypto::ibe::make_key_id(policy_package_, bytes_t{0x01});
  EXPECT_EQ(keys.front().id, expected_id);
  auto usk = warden::crypto::elgamal::decrypt(fixture_.enc.secret_key,
                                              keys.front().encrypted_key);
  EXPECT_TRUE(warden::crypto::ibe::verify_user_secret_key(
      usk, keys.front().id, server_->public_key()));
  EXPECT_EQ(metrics_.requests(warden::service::endpoint::fetch_key), 1u);
  EXPECT_EQ(metrics_.total_errors(), 0u);
}

TEST_F(key_server_test, trailing_byte_vector_arguments_get_no_key) {
  auto keys = fetch(make_request({bytes_t{0x01}, bytes_t{0x02, 0x03}}));
  ASSERT_EQ(keys.size(), 1u);
  EXPECT_EQ(keys.front().id,
            warden::crypto::ibe::make_key_id(policy_package_, bytes_t{0x01}));
}

TEST_F(key_server_test, same_identity_yields_one_key_for_every_caller) {
  using warden::crypto::bls12381::to_bytes;
  auto identity = bytes_t{0xAA, 0xBB};
  auto first_enc = fixture_.enc;
  auto first = fetch(make_request({identity}));

  fixture_.enc = warden::crypto::elgamal::generate_keypair();
  auto second = fetch(make_request({identity}));
  ASSERT_EQ(first.size(), 1u);
  ASSERT_EQ(second.size(), 1u);

  const auto& a = first.front();
  const auto& b = second.front();
  EXPECT_EQ(a.id, b.id);
  EXPECT_NE(to_bytes(a.encrypted_key.c1), to_bytes(b.encrypted_key.c1));
  EXPECT_NE(to_bytes(a.encrypted_key.c2), to_bytes(b.encrypted_key.c2));

  auto first_usk =
      warden::crypto::elgamal::decrypt(first_enc.secret_key, a.encrypted_key);
  auto second_usk = warden::crypto::elgamal::decrypt(fixture_.enc.secret_key,
                                                     b.encrypted_key);
  auto expected = warden::crypto::ibe::extract(
      master_.master_key,
      warden::crypto::ibe::make_key_id(policy_package_, identity));
  EXPECT_EQ(to_bytes(first_usk), to_bytes(second_usk));
  EXPECT_EQ(to_bytes(first_usk), to_bytes(expected));
}

TEST_F(key_server_test, rejections_name_the_request_id) {
  auto request = make_request();
  request.request_signature[0] ^= 0x01;
  request.request_id = "abc-123";
  auto capture = warden::testing::log_capture{};
  EXPECT_EQ(error_of(server_->fetch_key(request)),
            error_code::invalid_session_signature);
  EXPECT_EQ(error_of(server_->session(std::nullopt, "def-456")),
            error_code::missing_auth_token);
  EXPECT_NE(capture.text().find("request abc-123 rejected"), std::string::npos)
      << capture.text();
  EXPECT_NE(capture.text().find("request def-456 rejected"), std::string::npos)
      << capture.text();
}

TEST_F(key_server_test, unparsed_requests_report_staleness_first) {
  EXPECT_EQ(server_->reject_unparsed(warden::service::endpoint::fetch_key,
                                     error_code::invalid_input, std::nullopt),
            error_code::invalid_input);
  now_ = kNow + 120'001;
  EXPECT_EQ(server_->reject_unparsed(warden::service::endpoint::session_token,
                                     error_code::invalid_input, std::nullopt),
            error_code::sui_client_not_fresh);
  EXPECT_EQ(metrics_.requests(warden::service::endpoint::fetch_key), 1u);
  EXPECT_EQ(metrics_.requests(warden::service::endpoint::session_token), 1u);
  EXPECT_EQ(metrics_.errors(error_code::invalid_input), 1u);
  EXPECT_EQ(metrics_.errors(error_code::sui_client_not_fresh), 1u);
}

TEST_F(key_server_test, dry_runs_the_call_as_the_user) {
  fetch(make_request());
  ASSERT_EQ(chain_.dry_runs.size(), 1u);
  const auto& transaction = chain_.dry_runs.front();
  EXPECT_EQ(transaction.sender, fixture_.user());
  EXPECT_EQ(transaction.gas_data.owner, fixture_.user());
  EXPECT_EQ(transaction.gas_data.price, 1000u);
  EXPECT_EQ(transaction.gas_data.budget, warden::sui::kGasBudget);
}

TEST_F(key_server_test, stale_chain_view_rejects_before_any_other_check) {
  now_ = kNow + 120'001;
  auto request = make_request();
  request.ptb = bytes_t{0xFF};
  EXPECT_EQ(error_of(server_->fetch_key(request)),
            error_code::sui_client_not_fresh);
  EXPECT_TRUE(chain_.dry_runs.empty());
  EXPECT_EQ(metrics_.errors(error_code::sui_client_not_fresh), 1u);
}

TEST_F(key_server_test, staleness_at_the_limit_is_accepted) {
  now_ = kNow + 120'000;
  EXPECT_EQ(fetch(make_request()).size(), 1u);
}

TEST_F(key_server_test, malformed_transactions_are_invalid_ptb) {
  auto request = make_request();
  request.ptb.pop_back();
  fixture_.sign(request);
  EXPECT_EQ(error_of(server_->fetch_key(request)), error_code::invalid_ptb);
}

TEST_F(key_server_test, functions_outside_the_approve_prefix_are_invalid_ptb) {
  auto request = fixture_.make_request(policy_package_, policy_package_,
                                       {bytes_t{1}}, kNow - kMinute, "policy",
                                       "transfer");
  EXPECT_EQ(error_of(server_->fetch_key(request)), error_code::invalid_ptb);
}

TEST_F(key_server_test, unknown_packages_are_invalid) {
  auto unknown = warden::testing::make_hash(0x66);
  auto request =
      fixture_.make_request(unknown, unknown, {bytes_t{1}}, kNow - kMinute);
  EXPECT_EQ(error_of(server_->fetch_key(request)),
            error_code::invalid_package);

  chain_.package_lookup_fails = true;
  EXPECT_EQ(error_of(server_->fetch_key(make_request())), error_code::failure);
}

TEST_F(key_server_test, superseded_package_versions_are_rejected) {
  auto request = fixture_.make_request(upgraded_first_, upgraded_first_,
                                       {bytes_t{1}}, kNow - kMinute);
  EXPECT_EQ(error_of(server_->fetch_key(request)),
            error_code::old_package_version);
}

TEST_F(key_server_test, key_ids_stay_under_the_first_version) {
  auto request = fixture_.make_request(upgraded_latest_, upgraded_first_,
                                       {bytes_t{0x0F}}, kNow - kMinute);
  auto keys = fetch(request);
  ASSERT_EQ(keys.size(), 1u);
  EXPECT_EQ(keys[0].id,
            warden::crypto::ibe::make_key_id(upgraded_first_, bytes_t{0x0F}));
}

TEST_F(key_server_test, certificates_outside_their_ttl_are_rejected) {
  auto request = make_request();
  request.certificate =
      fixture_.make_certificate(policy_package_, kNow - 10 * kMinute - 1);
  EXPECT_EQ(error_of(server_->fetch_key(request)),
            error_code::invalid_certificate);

  request.certificate =
      fixture_.make_certificate(policy_package_, kNow - 10 * kMinute);
  EXPECT_EQ(fetch(request).size(), 1u);

  request.certificate = fixture_.make_certificate(policy_package_, kNow + 1);
  EXPECT_EQ(error_of(server_->fetch_key(request)),
            error_code::invalid_certificate);

  request.certificate =
      fixture_.make_certificate(policy_package_, kNow - kMinute, 11);
  EXPECT_EQ(error_of(server_->fetch_key(request)),
            error_code::invalid_certificate);
}

TEST_F(key_server_test, certificates_for_another_package_are_invalid) {
  auto request = make_request();
  request.certificate =
      fixture_.make_certificate(upgraded_first_, kNow - kMinute);
  EXPECT_EQ(error_of(server_->fetch_key(request)),
            error_code::invalid_signature);
}

TEST_F(key_server_test, request_signature_covers_ptb_and_keys) {
  auto request = make_request();
  auto valid_signature = request.request_signature;
  for (std::size_t i = 0; i < valid_signature.size(); i += 9) {
    request.request_signature = valid_signature;
    request.request_signature[i] ^= 0x01;
    EXPECT_EQ(error_of(server_->fetch_key(request)),
              error_code::invalid_session_signature)
        << i;
  }

  request = make_request();
  auto other = warden::crypto::elgamal::generate_keypair();
  auto other_key = warden::crypto::bls12381::to_bytes(other.public_key);
  request.enc_key = bytes_t{other_key.begin(), other_key.end()};
  EXPECT_EQ(error_of(server_->fetch_key(request)),
            error_code::invalid_session_signature);
  EXPECT_TRUE(chain_.dry_runs.empty());
}

TEST_F(key_server_test, policy_denial_and_failure_both_refuse_keys) {
  chain_.dry_run_result = warden::chain::dry_run_status::denied;
  EXPECT_EQ(error_of(server_->fetch_key(make_request())),
            error_code::no_access);

  chain_.dry_run_result = warden::chain::dry_run_status::failed;
  EXPECT_EQ(error_of(server_->fetch_key(make_request())), error_code::failure);
  EXPECT_EQ(metrics_.errors(error_code::no_access), 1u);
  EXPECT_EQ(metrics_.errors(error_code::failure), 1u);
}

TEST_F(key_server_test, mismatched_encryption_keys_are_invalid_input) {
  auto request = make_request();
  auto other = warden::crypto::elgamal::generate_keypair();
  auto other_vk = warden::crypto::bls12381::to_bytes(other.verification_key);
  request.enc_verification_key = bytes_t{other_vk.begin(), other_vk.end()};
  fixture_.sign(request);
  EXPECT_EQ(error_of(server_->fetch_key(request)), error_code::invalid_input);

  request.enc_key = bytes_t(48, 0x00);
  fixture_.sign(request);
  EXPECT_EQ(error_of(server_->fetch_key(request)), error_code::invalid_input);
}

TEST_F(key_server_test, service_carries_a_proof_of_possession) {
  const auto& info = server_->service();
  EXPECT_EQ(info.service_id, object_id_);
  EXPECT_TRUE(warden::crypto::ibe::verify_proof_of_possession(
      info.pop, server_->public_key(), object_id_));
}

TEST_F(key_server_test, session_tokens_name_the_profile) {
  auto result = server_->session_token(make_session_request());
  ASSERT_TRUE(std::holds_alternative<warden::service::session_token_t>(result));
  const auto& token = std::get<warden::service::session_token_t>(result);
  EXPECT_EQ(token.expires_at, kNow + 10 * kMinute);
  auto profile = warden::testing::make_hash(0x55);
  EXPECT_EQ(token.profile.value_or(""),
            "0x" + warden::schema::to_hex(profile));

  auto claims = server_->session("Bearer " + token.auth_token);
  ASSERT_TRUE(std::holds_alternative<warden::auth::session_claims_t>(claims));
  const auto& session = std::get<warden::auth::session_claims_t>(claims);
  EXPECT_EQ(session.user, fixture_.user());
  EXPECT_EQ(session.session_vk, fixture_.session.public_key);
  EXPECT_EQ(session.profile.value_or(""), token.profile.value_or(""));
  EXPECT_EQ(uint64_t{session.expires_at} * 1000, token.expires_at);
}

TEST_F(key_server_test, session_tokens_expire) {
  auto result = server_->session_token(make_session_request());
  ASSERT_TRUE(std::holds_alternative<warden::service::session_token_t>(result));
  auto header =
      "Bearer " + std::get<warden::service::session_token_t>(result).auth_token;

  now_ = kNow + 10 * kMinute;
  EXPECT_TRUE(std::holds_alternative<warden::auth::session_claims_t>(
      server_->session(header)));
  now_ = kNow + 10 * kMinute + 1000;
  EXPECT_EQ(error_of(server_->session(header)), error_code::expired_token);
}

TEST_F(key_server_test, session_tokens_require_the_session_function) {
  auto request = fixture_.make_request(anchor_, anchor_, {bytes_t{1}},
                                       kNow - kMinute, "warden",
                                       "seal_approve_other");
  EXPECT_EQ(error_of(server_->session_token(request)), error_code::invalid_ptb);
  EXPECT_EQ(error_of(server_->session_token(make_request())),
            error_code::invalid_ptb);
}

TEST_F(key_server_test, session_tokens_follow_anchor_upgrades) {
  auto upgraded = warden::testing::make_hash(0x31);
  chain_.publish(anchor_, upgraded);
  ASSERT_TRUE(warden::state::refresh_anchor_package(chain_, state_, anchor_));

  EXPECT_EQ(error_of(server_->session_token(make_session_request())),
            error_code::invalid_ptb);

  auto profile = warden::testing::make_hash(0x55);
  auto request = fixture_.make_request(
      upgraded, anchor_, {bytes_t{profile.begin(), profile.end()}},
      kNow - kMinute, "warden", "seal_approve_session");
  EXPECT_TRUE(std::holds_alternative<warden::service::session_token_t>(
      server_->session_token(request)));
}

TEST_F(key_server_test, encrypted_session_tokens_open_with_the_enc_key) {
  auto result = server_->encrypted_session_token(make_session_request());
  ASSERT_TRUE(
      std::holds_alternative<warden::crypto::elgamal::sealed_box_t>(result));
  auto opened = warden::crypto::elgamal::open(
      fixture_.enc.secret_key,
      std::get<warden::crypto::elgamal::sealed_box_t>(result));
  ASSERT_TRUE(opened.has_value());
  auto json = warden::schema::make_string(*opened);
  EXPECT_NE(json.find("\"auth_token\""), std::string::npos);
  EXPECT_NE(json.find("\"profile\""), std::string::npos);
}

TEST_F(key_server_test, session_requires_a_bearer_token) {
  EXPECT_EQ(error_of(server_->session(std::nullopt)),
            error_code::missing_auth_token);
  EXPECT_EQ(error_of(server_->session("Token abc")),
            error_code::invalid_auth_header);
  EXPECT_EQ(error_of(server_->session("Bearer abc.def.ghi")),
            error_code::invalid_token);
  EXPECT_EQ(metrics_.requests(warden::service::endpoint::session), 3u);
}
