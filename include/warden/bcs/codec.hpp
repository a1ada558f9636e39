#pragma once
#include <warden/bcs/reader.hpp>
#include <warden/bcs/writer.hpp>
#include <warden/schema/primitives.hpp>

#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Primitive and container codecs. Domain types provide
// `bool decode(reader&, T&)` and `void encode(writer&, const T&)` in their own
// namespace and are picked up through argument-dependent lookup.
namespace warden::bcs {

inline bool decode(reader& in, uint8_t& out) {
  auto value = in.read_u8();
  if (!value) {
    return false;
  }
  out = *value;
  return true;
}

inline bool decode(reader& in, uint16_t& out) {
  auto value = in.read_u16();
  if (!value) {
    return false;
  }
  out = *value;
  return true;
}

inline bool decode(reader& in, uint32_t& out) {
  auto value = in.read_u32();
  if (!value) {
    return false;
  }
  out = *value;
  return true;
}

inline bool decode(reader& in, uint64_t& out) {
  auto value = in.read_u64();
  if (!value) {
    return false;
  }
  out = *value;
  return true;
}

inline bool decode(reader& in, bool& out) {
  auto value = in.read_bool();
  if (!value) {
    return false;
  }
  out = *value;
  return true;
}

inline bool decode(reader& in, warden::schema::bytes_t& out) {
  auto value = in.read_byte_vector();
  if (!value) {
    return false;
  }
  out = std::move(*value);
  return true;
}

inline bool decode(reader& in, std::string& out) {
  auto value = in.read_string();
  if (!value) {
    return false;
  }
  out = std::move(*value);
  return true;
}

template <std::size_t N>
bool decode(reader& in, std::array<uint8_t, N>& out) {
  auto value = in.read_array<N>();
  if (!value) {
    return false;
  }
  out = *value;
  return true;
}

template <typename T>
bool decode(reader& in, std::vector<T>& out) {
  auto length = in.read_sequence_length();
  if (!length) {
    return false;
  }
  out.clear();
  out.reserve(*length);
  for (auto i = uint32_t{0}; i < *length; ++i) {
    auto element = T{};
    if (!decode(in, element)) {
      return false;
    }
    out.push_back(std::move(element));
  }
  return true;
}

template <typename T>
bool decode(reader& in, std::optional<T>& out) {
  auto tag = in.read_u8();
  if (!tag) {
    return false;
  }
  if (*tag == 0) {
    out.reset();
    return true;
  }
  if (*tag != 1) {
    return false;
  }
  auto value = T{};
  if (!decode(in, value)) {
    return false;
  }
  out = std::move(value);
  return true;
}

inline void encode(writer& out, const uint8_t value) {
  out.write_u8(value);
}

inline void encode(writer& out, const uint16_t value) {
  out.write_u16(value);
}

inline void encode(writer& out, const uint32_t value) {
  out.write_u32(value);
}

inline void encode(writer& out, const uint64_t value) {
  out.write_u64(value);
}

inline void encode(writer& out, const bool value) {
  out.write_bool(value);
}

inline void encode(writer& out, const warden::schema::bytes_t& value) {
  out.write_byte_vector(value);
}

inline void encode(writer& out, const std::string& value) {
  out.write_string(value);
}

template <std::size_t N>
void encode(writer& out, const std::array<uint8_t, N>& value) {
  out.write_fixed(warden::schema::bytes_view_t{value.data(), value.size()});
}

template <typename T>
void encode(writer& out, const std::vector<T>& values) {
  out.write_uleb128(static_cast<uint32_t>(values.size()));
  for (const auto& value : values) {
    encode(out, value);
  }
}

template <typename T>
void encode(writer& out, const std::optional<T>& value) {
  if (!value) {
    out.write_u8(0);
    return;
  }
  out.write_u8(1);
  encode(out, *value);
}

/// Decode a complete value; any bytes left over are an error.
template <typename T>
std::optional<T> try_decode(const warden::schema::bytes_view_t& bytes) {
  auto in = reader{bytes};
  auto value = T{};
  if (!decode(in, value) || !in.done()) {
    return std::nullopt;
  }
  return value;
}

template <typename T>
warden::schema::bytes_t encode(const T& value) {
  auto out = writer{};
  encode(out, value);
  return out.take();
}

}  // namespace warden::bcs
