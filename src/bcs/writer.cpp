#include <warden/bcs/writer.hpp>

#include <boost/endian/conversion.hpp>

#include <array>
#include <cstring>
#include <iterator>
#include <utility>

namespace warden::bcs {

namespace {

template <typename T>
void write_little(warden::schema::bytes_t& out, const T value) {
  auto little = boost::endian::native_to_little(value);
  auto raw = std::array<uint8_t, sizeof(T)>{};
  std::memcpy(raw.data(), &little, sizeof(T));
  out.insert(std::end(out), std::begin(raw), std::end(raw));
}

}  // namespace

void writer::write_u8(const uint8_t value) {
  out_.push_back(value);
}

void writer::write_u16(const uint16_t value) {
  write_little(out_, value);
}

void writer::write_u32(const uint32_t value) {
  write_little(out_, value);
}

void writer::write_u64(const uint64_t value) {
  write_little(out_, value);
}

void writer::write_bool(const bool value) {
  out_.push_back(value ? 1 : 0);
}

void writer::write_uleb128(uint32_t value) {
  while (value >= 0x80u) {
    out_.push_back(static_cast<uint8_t>((value & 0x7Fu) | 0x80u));
    value >>= 7u;
  }
  out_.push_back(static_cast<uint8_t>(value));
}

void writer::write_fixed(const warden::schema::bytes_view_t& bytes) {
  out_.insert(std::end(out_), std::begin(bytes), std::end(bytes));
}

void writer::write_byte_vector(const warden::schema::bytes_view_t& bytes) {
  write_uleb128(static_cast<uint32_t>(bytes.size()));
  write_fixed(bytes);
}

void writer::write_string(const std::string_view value) {
  write_byte_vector(warden::schema::make_bytes_view(value));
}

const warden::schema::bytes_t& writer::bytes() const {
  return out_;
}

warden::schema::bytes_t writer::take() {
  return std::move(out_);
}

warden::schema::bytes_t encode_uleb128(const uint32_t value) {
  auto out = writer{};
  out.write_uleb128(value);
  return out.take();
}

}  // namespace warden::bcs
