#pragma once
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <string_view>

namespace warden::bcs {

class writer final {
 public:
  void write_u8(uint8_t value);
  void write_u16(uint16_t value);
  void write_u32(uint32_t value);
  void write_u64(uint64_t value);
  void write_bool(bool value);
  void write_uleb128(uint32_t value);
  void write_fixed(const warden::schema::bytes_view_t& bytes);
  void write_byte_vector(const warden::schema::bytes_view_t& bytes);
  void write_string(std::string_view value);

  const warden::schema::bytes_t& bytes() const;
  warden::schema::bytes_t take();

 private:
  warden::schema::bytes_t out_;
};

/// ULEB128 on its own, as used in front of personal messages.
warden::schema::bytes_t encode_uleb128(uint32_t value);

}  // namespace warden::bcs
