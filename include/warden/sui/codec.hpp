#pragma once
#include <warden/bcs/codec.hpp>
#include <warden/sui/transaction.hpp>

#include <optional>
#include <string_view>

namespace warden::sui {

/// Nesting limit for `vector<...>` and struct type parameters.
inline constexpr auto kMaxTypeTagDepth = std::size_t{16};

/// Move identifier rules: `[A-Za-z][A-Za-z0-9_]*` or `_` followed by at least
/// one more identifier character.
bool is_valid_identifier(std::string_view identifier);

bool decode(warden::bcs::reader& in, object_ref_t& out);
bool decode(warden::bcs::reader& in, object_arg_t& out);
bool decode(warden::bcs::reader& in, call_arg_t& out);
bool decode(warden::bcs::reader& in, argument_t& out);
bool decode(warden::bcs::reader& in, type_tag_t& out);
bool decode(warden::bcs::reader& in, struct_tag_t& out);
bool decode(warden::bcs::reader& in, command_t& out);
bool decode(warden::bcs::reader& in, programmable_transaction_t& out);
bool decode(warden::bcs::reader& in, gas_data_t& out);
bool decode(warden::bcs::reader& in, transaction_data_t& out);

void encode(warden::bcs::writer& out, const object_ref_t& value);
void encode(warden::bcs::writer& out, const object_arg_t& value);
void encode(warden::bcs::writer& out, const call_arg_t& value);
void encode(warden::bcs::writer& out, const argument_t& value);
void encode(warden::bcs::writer& out, const type_tag_t& value);
void encode(warden::bcs::writer& out, const struct_tag_t& value);
void encode(warden::bcs::writer& out, const command_t& value);
void encode(warden::bcs::writer& out, const programmable_transaction_t& value);
void encode(warden::bcs::writer& out, const gas_data_t& value);
void encode(warden::bcs::writer& out, const transaction_data_t& value);

/// Decode programmable-transaction bytes, as carried by key requests (no
/// TransactionKind tag in front). Trailing bytes are rejected.
std::optional<programmable_transaction_t> try_decode_programmable_transaction(
    const warden::schema::bytes_view_t& bytes);

warden::schema::bytes_t encode_programmable_transaction(
    const programmable_transaction_t& value);

warden::schema::bytes_t encode_transaction_data(
    const transaction_data_t& value);

}  // namespace warden::sui
