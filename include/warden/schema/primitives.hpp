#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace warden::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = hash32_t;
using object_id_t = hash32_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
std::optional<hash32_t> try_make_hash32(const bytes_view_t& bytes);
hash32_t make_zero_hash();

/// Parse a Sui address / object id literal. Accepts an optional `0x` prefix
/// and short forms (`0x2`), which are left-padded to 32 bytes.
std::optional<address_t> try_parse_address(std::string_view literal);

/// `0x` followed by all 64 lowercase hex digits.
std::string to_address_string(const address_t& address);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);
bytes_t from_base64(std::string_view encoded);


/// Accept either base64 or hex (with `0x` prefix) and decode it.
std::optional<bytes_t> try_decode_binary(std::string_view encoded);

}  // namespace warden::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
