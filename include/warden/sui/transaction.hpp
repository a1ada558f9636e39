#pragma once
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Programmable transaction blocks as they appear on the wire. Variant
// alternatives are listed in BCS tag order; the tag of a decoded value is its
// `index()`.
namespace warden::sui {

using address_t = warden::schema::address_t;
using object_id_t = warden::schema::object_id_t;
using digest_t = warden::schema::hash32_t;

struct object_ref_t final {
  object_id_t object_id{};
  uint64_t version{};
  digest_t digest{};
};

struct imm_or_owned_object_t final {
  object_ref_t reference;
};

struct shared_object_t final {
  object_id_t object_id{};
  uint64_t initial_shared_version{};
  bool is_mutable{};
};

struct receiving_object_t final {
  object_ref_t reference;
};

using object_arg_t =
    std::variant<imm_or_owned_object_t, shared_object_t, receiving_object_t>;

struct pure_arg_t final {
  warden::schema::bytes_t bytes;
};

struct object_call_arg_t final {
  object_arg_t object;
};

using call_arg_t = std::variant<pure_arg_t, object_call_arg_t>;

struct gas_coin_t final {};

struct input_t final {
  uint16_t index{};
};

struct result_t final {
  uint16_t index{};
};

struct nested_result_t final {
  uint16_t index{};
  uint16_t result_index{};
};

using argument_t = std::variant<gas_coin_t, input_t, result_t, nested_result_t>;

enum class type_tag_kind : uint8_t {
  bool_type = 0,
  u8 = 1,
  u64 = 2,
  u128 = 3,
  address = 4,
  signer = 5,
  vector = 6,
  struct_type = 7,
  u16 = 8,
  u32 = 9,
  u256 = 10,
};

struct struct_tag_t;

struct type_tag_t final {
  type_tag_kind kind{type_tag_kind::bool_type};
  // Exactly one element when kind is vector.
  std::vector<type_tag_t> element;
  // Exactly one element when kind is struct_type.
  std::vector<struct_tag_t> struct_tag;
};

struct struct_tag_t final {
  address_t address{};
  std::string module;
  std::string name;
  std::vector<type_tag_t> type_params;
};

struct move_call_t final {
  object_id_t package{};
  std::string module;
  std::string function;
  std::vector<type_tag_t> type_arguments;
  std::vector<argument_t> arguments;
};

struct transfer_objects_t final {
  std::vector<argument_t> objects;
  argument_t address;
};

struct split_coins_t final {
  argument_t coin;
  std::vector<argument_t> amounts;
};

struct merge_coins_t final {
  argument_t destination;
  std::vector<argument_t> sources;
};

struct publish_t final {
  std::vector<warden::schema::bytes_t> modules;
  std::vector<object_id_t> dependencies;
};

struct make_move_vec_t final {
  std::optional<type_tag_t> type;
  std::vector<argument_t> elements;
};

struct upgrade_t final {
  std::vector<warden::schema::bytes_t> modules;
  std::vector<object_id_t> dependencies;
  object_id_t package{};
  argument_t ticket;
};

using command_t = std::variant<move_call_t, transfer_objects_t, split_coins_t,
                               merge_coins_t, publish_t, make_move_vec_t,
                               upgrade_t>;

struct programmable_transaction_t final {
  std::vector<call_arg_t> inputs;
  std::vector<command_t> commands;
};

struct gas_data_t final {
  std::vector<object_ref_t> payment;
  address_t owner{};
  uint64_t price{};
  uint64_t budget{};
};

/// `TransactionData::V1` with a programmable-transaction kind. Other
/// transaction kinds are system transactions and never reach a key server.
struct transaction_data_t final {
  programmable_transaction_t kind;
  address_t sender{};
  gas_data_t gas_data;
  std::optional<uint64_t> expiration_epoch;
};

/// Budget used for dry runs.
inline constexpr auto kGasBudget = uint64_t{500'000'000};

transaction_data_t make_dry_run_transaction(programmable_transaction_t ptb,
                                            const address_t& sender,
                                            uint64_t gas_price);

/// A single `package::module::function(id_0, .., id_n)` call whose arguments
/// are pure `vector<u8>` inputs.
programmable_transaction_t make_approve_transaction(
    const object_id_t& package, std::string module, std::string function,
    const std::vector<warden::schema::bytes_t>& identities);

}  // namespace warden::sui
