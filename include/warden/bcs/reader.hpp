#pragma once
#include <warden/schema/primitives.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

// Strict Binary Canonical Serialization input cursor. Every read either
// consumes exactly the bytes it reports or fails without a partial value.
namespace warden::bcs {

/// Sequence lengths above this are rejected, matching the canonical limit.
inline constexpr auto kMaxSequenceLength = uint32_t{0x7FFFFFFF};

class reader final {
 public:
  explicit reader(warden::schema::bytes_view_t bytes);

  std::optional<uint8_t> read_u8();
  std::optional<uint16_t> read_u16();
  std::optional<uint32_t> read_u32();
  std::optional<uint64_t> read_u64();
  std::optional<bool> read_bool();

  /// Canonical ULEB128 with the sequence-length limit applied. Overlong
  /// encodings (trailing zero groups) are rejected.
  std::optional<uint32_t> read_uleb128();

  std::optional<warden::schema::bytes_view_t> read_fixed(std::size_t size);

  template <std::size_t N>
  std::optional<std::array<uint8_t, N>> read_array() {
    auto view = read_fixed(N);
    if (!view) {
      return std::nullopt;
    }
    auto out = std::array<uint8_t, N>{};
    std::copy(std::begin(*view), std::end(*view), std::begin(out));
    return out;
  }

  /// `vector<u8>`: length prefix followed by that many bytes.
  std::optional<warden::schema::bytes_t> read_byte_vector();

  /// UTF-8 string with a length prefix. Bytes are returned verbatim.
  std::optional<std::string> read_string();

  /// Length prefix of a sequence whose elements the caller decodes.
  std::optional<uint32_t> read_sequence_length();

  std::size_t remaining() const;
  std::size_t position() const;
  bool done() const;

 private:
  warden::schema::bytes_view_t bytes_;
  std::size_t offset_{0};
};

}  // namespace warden::bcs
