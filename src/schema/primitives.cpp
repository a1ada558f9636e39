#include <warden/common/critical.hpp>
#include <warden/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>

namespace warden::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<bytes_t> try_from_hex_internal(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

constexpr auto kBase64Alphabet = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

std::string encode_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  auto buffer = uint32_t{0};
  auto bits = 0u;
  for (const auto byte : bytes) {
    buffer = (buffer << 8u) | byte;
    bits += 8;
    while (bits >= 6) {
      bits -= 6;
      out.push_back(kBase64Alphabet[(buffer >> bits) & 0x3Fu]);
    }
  }
  if (bits > 0) {
    out.push_back(kBase64Alphabet[(buffer << (6 - bits)) & 0x3Fu]);
  }
  while ((out.size() % 4) != 0) {
    out.push_back('=');
  }
  return out;
}

std::optional<bytes_t> decode_base64(std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  for (const auto ch : encoded) {
    if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
      compact.push_back(ch);
    }
  }

  auto digits = std::string_view{compact};
  if ((digits.size() % 4) != 0) {
    return std::nullopt;
  }
  auto padding = std::size_t{0};
  while (!digits.empty() && digits.back() == '=') {
    digits.remove_suffix(1);
    ++padding;
  }
  if (padding > 2) {
    return std::nullopt;
  }
  // A lone trailing digit carries fewer than eight bits.
  if ((digits.size() % 4) == 1) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((digits.size() * 3) / 4);
  auto buffer = uint32_t{0};
  auto bits = 0u;
  for (const auto ch : digits) {
    auto value = kBase64Alphabet.find(ch);
    if (value == std::string_view::npos) {
      return std::nullopt;
    }
    buffer = (buffer << 6u) | static_cast<uint32_t>(value);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFFu));
    }
  }
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    warden::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

std::optional<hash32_t> try_make_hash32(const bytes_view_t& bytes) {
  if (bytes.size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

std::optional<address_t> try_parse_address(std::string_view literal) {
  auto hex = normalize_hex(literal);
  if (hex.empty() || hex.size() > 64) {
    return std::nullopt;
  }
  auto padded = std::string(64 - hex.size(), '0');
  padded.append(hex);
  auto decoded = try_from_hex_internal(padded);
  if (!decoded) {
    return std::nullopt;
  }
  return try_make_hash32(bytes_view_t{decoded->data(), decoded->size()});
}

std::string to_address_string(const address_t& address) {
  return "0x" + to_hex(bytes_view_t{address.data(), address.size()});
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  return try_from_hex_internal(hex);
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded.has_value()) {
    warden::common::critical("invalid hex input");
  }
  return *decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  return encode_base64(bytes);
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(bytes_view_t{bytes.data(), bytes.size()});
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  return decode_base64(encoded);
}

bytes_t from_base64(const std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded.has_value()) {
    warden::common::critical("invalid base64 input");
  }
  return *decoded;
}

std::optional<bytes_t> try_decode_binary(const std::string_view encoded) {
  if (encoded.size() >= 2 && encoded[0] == '0' &&
      (encoded[1] == 'x' || encoded[1] == 'X')) {
    return try_from_hex_internal(encoded);
  }
  return try_from_base64(encoded);
}

}  // namespace warden::schema
