#include <warden/blake2b/hash.hpp>

namespace warden::blake2b {

warden::schema::hash32_t hash(const std::string_view& str) {
  return hash(warden::schema::make_bytes_view(str));
}

warden::schema::hash32_t hash(const warden::schema::bytes_view_t& bytes) {
  auto output = warden::schema::hash32_t{};
  crypto_generichash(output.data(), output.size(), bytes.data(), bytes.size(),
                     nullptr, 0);
  return output;
}

hasher::hasher() {
  crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES);
}

hasher& hasher::update(const warden::schema::bytes_view_t& bytes) {
  crypto_generichash_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const uint8_t byte) {
  crypto_generichash_update(&state_, &byte, 1);
  return *this;
}

warden::schema::hash32_t hasher::finalize() {
  auto output = warden::schema::hash32_t{};
  crypto_generichash_final(&state_, output.data(), output.size());
  return output;
}

}  // namespace warden::blake2b
