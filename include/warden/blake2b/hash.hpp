#pragma once
#include <warden/schema/primitives.hpp>
#include <sodium.h>

#include <cstdint>
#include <span>
#include <string_view>

// Blake2b with a 256-bit digest, the hash Sui uses for addresses and
// intent-message digests.
namespace warden::blake2b {

warden::schema::hash32_t hash(const std::string_view& str);
warden::schema::hash32_t hash(const warden::schema::bytes_view_t& bytes);

/// Streaming form for inputs assembled from several pieces.
class hasher final {
 public:
  hasher();
  hasher& update(const warden::schema::bytes_view_t& bytes);
  hasher& update(uint8_t byte);
  warden::schema::hash32_t finalize();

 private:
  crypto_generichash_state state_;
};

}  // namespace warden::blake2b
