#include <warden/bcs/reader.hpp>

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <cstring>

namespace warden::bcs {

namespace {

template <typename T>
std::optional<T> read_little(reader& in) {
  auto view = in.read_fixed(sizeof(T));
  if (!view) {
    return std::nullopt;
  }
  auto value = T{};
  std::memcpy(&value, view->data(), sizeof(T));
  return boost::endian::little_to_native(value);
}

}  // namespace

reader::reader(warden::schema::bytes_view_t bytes) : bytes_{bytes} {}

std::optional<uint8_t> reader::read_u8() {
  if (remaining() < 1) {
    return std::nullopt;
  }
  return bytes_[offset_++];
}

std::optional<uint16_t> reader::read_u16() {
  return read_little<uint16_t>(*this);
}

std::optional<uint32_t> reader::read_u32() {
  return read_little<uint32_t>(*this);
}

std::optional<uint64_t> reader::read_u64() {
  return read_little<uint64_t>(*this);
}

std::optional<bool> reader::read_bool() {
  auto value = read_u8();
  if (!value) {
    return std::nullopt;
  }
  switch (*value) {
    case 0:
      return false;
    case 1:
      return true;
    default:
      return std::nullopt;
  }
}

std::optional<uint32_t> reader::read_uleb128() {
  auto start = offset_;
  auto value = uint64_t{0};
  auto shift = 0u;
  while (true) {
    auto byte = read_u8();
    if (!byte || shift > 28) {
      offset_ = start;
      return std::nullopt;
    }
    auto digit = static_cast<uint64_t>(*byte & 0x7Fu);
    value |= digit << shift;
    if ((*byte & 0x80u) == 0) {
      // A final zero group after the first byte means an overlong encoding.
      if (shift != 0 && digit == 0) {
        offset_ = start;
        return std::nullopt;
      }
      break;
    }
    shift += 7;
  }
  if (value > kMaxSequenceLength) {
    offset_ = start;
    return std::nullopt;
  }
  return static_cast<uint32_t>(value);
}

std::optional<warden::schema::bytes_view_t> reader::read_fixed(
    const std::size_t size) {
  if (remaining() < size) {
    return std::nullopt;
  }
  auto view = bytes_.subspan(offset_, size);
  offset_ += size;
  return view;
}

std::optional<warden::schema::bytes_t> reader::read_byte_vector() {
  auto start = offset_;
  auto length = read_uleb128();
  if (!length) {
    return std::nullopt;
  }
  auto view = read_fixed(*length);
  if (!view) {
    offset_ = start;
    return std::nullopt;
  }
  return warden::schema::make_bytes(*view);
}

std::optional<std::string> reader::read_string() {
  auto bytes = read_byte_vector();
  if (!bytes) {
    return std::nullopt;
  }
  return warden::schema::make_string(*bytes);
}

std::optional<uint32_t> reader::read_sequence_length() {
  auto start = offset_;
  auto length = read_uleb128();
  // Every element takes at least one byte, so a length beyond the remaining
  // input can never decode.
  if (length && *length > remaining()) {
    offset_ = start;
    return std::nullopt;
  }
  return length;
}

std::size_t reader::remaining() const {
  return bytes_.size() - offset_;
}

std::size_t reader::position() const {
  return offset_;
}

bool reader::done() const {
  return offset_ == bytes_.size();
}

}  // namespace warden::bcs
