#include <gtest/gtest.h>
#include <warden/bcs/codec.hpp>
#include <warden/sui/codec.hpp>
#include <warden/testing/common.hpp>
#include <warden/validation/valid_ptb.hpp>

#include <string>
#include <vector>

namespace {

using warden::schema::bytes_t;

const auto kPrefixes = std::vector<std::string>{"seal_approve"};

warden::sui::programmable_transaction_t make_ptb(
    std::vector<bytes_t> identities, std::string function = "seal_approve") {
  return warden::sui::make_approve_transaction(
      warden::testing::make_hash(0x40), "policy", std::move(function),
      identities);
}

}  // namespace

TEST(valid_ptb, accepts_a_single_approve_call) {
  auto bytes = warden::sui::encode_programmable_transaction(
      make_ptb({bytes_t{0x01}}));
  auto ptb = warden::validation::valid_ptb::try_from(bytes, kPrefixes);
  ASSERT_TRUE(ptb.has_value());
  EXPECT_EQ(ptb->package(), warden::testing::make_hash(0x40));
  EXPECT_EQ(ptb->module(), "policy");
  EXPECT_EQ(ptb->function(), "seal_approve");
  EXPECT_EQ(ptb->full_function(),
            warden::schema::to_address_string(
                warden::testing::make_hash(0x40)) +
                "::policy::seal_approve");
  ASSERT_EQ(ptb->identity_arguments().size(), 1u);
  EXPECT_EQ(ptb->identity_arguments()[0], bytes_t{0x01});
}

TEST(valid_ptb, only_the_first_argument_is_an_identity) {
  // Both trailing arguments decode as pure vector<u8>.
  auto valid = warden::validation::valid_ptb::try_from(
      make_ptb({bytes_t{0x01}, bytes_t{0x02, 0x03}}), kPrefixes);
  ASSERT_TRUE(valid.has_value());
  ASSERT_EQ(valid->identity_arguments().size(), 1u);
  EXPECT_EQ(valid->identity_arguments()[0], bytes_t{0x01});
}

TEST(valid_ptb, a_u64_policy_argument_is_not_an_identity) {
  auto ptb = make_ptb({bytes_t{0xaa, 0xbb}});
  // Little endian 0x0605040302010007 reads as a BCS vector<u8> of length 7.
  auto nonce = warden::bcs::encode(uint64_t{0x0605040302010007});
  ASSERT_TRUE(warden::bcs::try_decode<bytes_t>(nonce).has_value());
  ptb.inputs.push_back(warden::sui::pure_arg_t{.bytes = nonce});
  auto& call = std::get<warden::sui::move_call_t>(ptb.commands.front());
  call.arguments.push_back(warden::sui::input_t{
      .index = static_cast<uint16_t>(ptb.inputs.size() - 1)});

  auto bytes = warden::sui::encode_programmable_transaction(ptb);
  auto valid = warden::validation::valid_ptb::try_from(bytes, kPrefixes);
  ASSERT_TRUE(valid.has_value());
  ASSERT_EQ(valid->identity_arguments().size(), 1u);
  EXPECT_EQ(valid->identity_arguments()[0], (bytes_t{0xaa, 0xbb}));
}

TEST(valid_ptb, accepts_prefixed_function_names) {
  auto ptb = warden::validation::valid_ptb::try_from(
      make_ptb({bytes_t{0x01}}, "seal_approve_allowlist"), kPrefixes);
  EXPECT_TRUE(ptb.has_value());
}

TEST(valid_ptb, rejects_other_functions) {
  EXPECT_FALSE(warden::validation::valid_ptb::try_from(
      make_ptb({bytes_t{0x01}}, "transfer"), kPrefixes));
  EXPECT_FALSE(warden::validation::valid_ptb::try_from(
      make_ptb({bytes_t{0x01}}), std::vector<std::string>{}));
}

TEST(valid_ptb, rejects_multiple_commands) {
  auto ptb = make_ptb({bytes_t{0x01}});
  ptb.commands.push_back(ptb.commands.front());
  EXPECT_FALSE(warden::validation::valid_ptb::try_from(ptb, kPrefixes));
}

TEST(valid_ptb, rejects_commands_other_than_move_calls) {
  auto ptb = make_ptb({bytes_t{0x01}});
  ptb.commands.front() = warden::sui::split_coins_t{
      .coin = warden::sui::gas_coin_t{},
      .amounts = {warden::sui::input_t{.index = 0}}};
  EXPECT_FALSE(warden::validation::valid_ptb::try_from(ptb, kPrefixes));
}

TEST(valid_ptb, requires_a_leading_identity) {
  auto ptb = make_ptb({bytes_t{0x01}});
  auto& call = std::get<warden::sui::move_call_t>(ptb.commands.front());
  call.arguments.front() = warden::sui::gas_coin_t{};
  EXPECT_FALSE(warden::validation::valid_ptb::try_from(ptb, kPrefixes));
}

TEST(valid_ptb, object_arguments_may_follow_the_identity) {
  auto ptb = make_ptb({bytes_t{0x01}, bytes_t{0x02}});
  ptb.inputs.push_back(warden::sui::object_call_arg_t{
      .object = warden::sui::shared_object_t{
          .object_id = warden::testing::make_hash(6),
          .initial_shared_version = 1,
          .is_mutable = false}});
  auto& call = std::get<warden::sui::move_call_t>(ptb.commands.front());
  call.arguments.insert(call.arguments.begin() + 1,
                        warden::sui::input_t{.index = 2});

  auto valid = warden::validation::valid_ptb::try_from(ptb, kPrefixes);
  ASSERT_TRUE(valid.has_value());
  EXPECT_EQ(valid->identity_arguments().size(), 1u);
}

TEST(valid_ptb, a_first_argument_that_is_not_a_byte_vector_is_rejected) {
  auto ptb = make_ptb({bytes_t{0x01}});
  // A u64 pure input: eight bytes with no length prefix.
  std::get<warden::sui::pure_arg_t>(ptb.inputs.front()).bytes =
      bytes_t{9, 0, 0, 0, 0, 0, 0, 0};
  EXPECT_FALSE(warden::validation::valid_ptb::try_from(ptb, kPrefixes));
}

TEST(valid_ptb, a_call_without_arguments_is_rejected) {
  auto ptb = make_ptb({bytes_t{0x01}});
  std::get<warden::sui::move_call_t>(ptb.commands.front()).arguments.clear();
  EXPECT_FALSE(warden::validation::valid_ptb::try_from(ptb, kPrefixes));
}

TEST(valid_ptb, out_of_range_inputs_are_rejected) {
  auto ptb = make_ptb({bytes_t{0x01}});
  auto& call = std::get<warden::sui::move_call_t>(ptb.commands.front());
  call.arguments.front() = warden::sui::input_t{.index = 9};
  EXPECT_FALSE(warden::validation::valid_ptb::try_from(ptb, kPrefixes));
}

TEST(valid_ptb, every_truncation_is_rejected_without_throwing) {
  auto bytes = warden::sui::encode_programmable_transaction(
      make_ptb({bytes_t{0x01, 0x02}, bytes_t{0x03}}));
  for (std::size_t size = 0; size < bytes.size(); ++size) {
    auto prefix = warden::schema::bytes_view_t{bytes.data(), size};
    EXPECT_NO_THROW({
      EXPECT_FALSE(
          warden::validation::valid_ptb::try_from(prefix, kPrefixes));
    }) << size;
  }
}

TEST(valid_ptb, arbitrary_bytes_never_throw) {
  auto state = uint32_t{0x12345678};
  for (auto round = 0; round < 500; ++round) {
    auto bytes = bytes_t(static_cast<std::size_t>(round % 64));
    for (auto& byte : bytes) {
      state = state * 1664525u + 1013904223u;
      byte = static_cast<uint8_t>(state >> 24u);
    }
    EXPECT_NO_THROW(
        static_cast<void>(warden::validation::valid_ptb::try_from(bytes,
                                                                  kPrefixes)));
  }
}
