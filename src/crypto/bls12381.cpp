#include <warden/common/critical.hpp>
#include <warden/crypto/bls12381.hpp>

#include <mutex>
#include <string_view>

namespace warden::crypto::bls12381 {

namespace {

// Standard generators in compressed form.
constexpr auto kG1GeneratorHex = std::string_view{
    "97f1d3a73197d7942695638c4fa9ac0fc3688c4f9774b905a14e3a3f171bac586c55e83ff"
    "97a1aeffb3af00adb22c6bb"};
constexpr auto kG2GeneratorHex = std::string_view{
    "93e02b6052719f607dacd3a088274f65596bd0d09920b61ab5da61bbdc7f5049334cf1121"
    "3945d57e5ac7d055d042b7e024aa2b2f08f0a91260805272dc51051c6e47ad4fa403b02b4"
    "510b647ae3d1770bac0326a805bbefd48056c8c121bdb8"};

struct generators_t final {
  g1_t g1;
  g2_t g2;
};

std::once_flag init_flag;

void configure() {
  mcl::bn::initPairing(mcl::BLS12_381);
  mcl::bn::setETHserialization(true);
  mcl::bn::setMapToMode(MCL_MAP_TO_MODE_HASH_TO_CURVE);
  if (!mcl::bn::setDstG1(kHashToG1Dst.data(), kHashToG1Dst.size())) {
    warden::common::critical("failed to configure BLS12-381 hash-to-curve");
  }
  mcl::bn::verifyOrderG1(true);
  mcl::bn::verifyOrderG2(true);
}

const generators_t& generators() {
  static const auto value = [] {
    init();
    auto out = generators_t{};
    auto g1 = warden::schema::from_hex(kG1GeneratorHex);
    auto g2 = warden::schema::from_hex(kG2GeneratorHex);
    if (out.g1.deserialize(g1.data(), g1.size()) != g1.size() ||
        out.g2.deserialize(g2.data(), g2.size()) != g2.size()) {
      warden::common::critical("failed to load BLS12-381 generators");
    }
    return out;
  }();
  return value;
}

}  // namespace

void init() {
  std::call_once(init_flag, configure);
}

const g1_t& g1_generator() {
  return generators().g1;
}

const g2_t& g2_generator() {
  return generators().g2;
}

scalar_t random_scalar() {
  init();
  auto out = scalar_t{};
  out.setByCSPRNG();
  return out;
}

std::optional<scalar_t> try_scalar_from_bytes(
    const warden::schema::bytes_view_t& bytes) {
  init();
  if (bytes.size() != kScalarSize) {
    return std::nullopt;
  }
  auto out = scalar_t{};
  if (out.deserialize(bytes.data(), bytes.size()) != bytes.size()) {
    return std::nullopt;
  }
  return out;
}

scalar_bytes_t to_bytes(const scalar_t& value) {
  auto out = scalar_bytes_t{};
  value.serialize(out.data(), out.size());
  return out;
}

std::optional<g1_t> try_g1_from_bytes(
    const warden::schema::bytes_view_t& bytes) {
  init();
  if (bytes.size() != kG1Size) {
    return std::nullopt;
  }
  auto out = g1_t{};
  if (out.deserialize(bytes.data(), bytes.size()) != bytes.size() ||
      !out.isValid()) {
    return std::nullopt;
  }
  return out;
}

std::optional<g2_t> try_g2_from_bytes(
    const warden::schema::bytes_view_t& bytes) {
  init();
  if (bytes.size() != kG2Size) {
    return std::nullopt;
  }
  auto out = g2_t{};
  if (out.deserialize(bytes.data(), bytes.size()) != bytes.size() ||
      !out.isValid()) {
    return std::nullopt;
  }
  return out;
}

g1_bytes_t to_bytes(const g1_t& point) {
  auto out = g1_bytes_t{};
  point.serialize(out.data(), out.size());
  return out;
}

g2_bytes_t to_bytes(const g2_t& point) {
  auto out = g2_bytes_t{};
  point.serialize(out.data(), out.size());
  return out;
}

warden::schema::bytes_t to_bytes(const gt_t& element) {
  // 12 base-field elements of 48 bytes each.
  auto out = warden::schema::bytes_t(12 * 48);
  auto written = element.serialize(out.data(), out.size());
  out.resize(written);
  return out;
}

g1_t hash_to_g1(const warden::schema::bytes_view_t& message) {
  init();
  auto out = g1_t{};
  mcl::bn::hashAndMapToG1(out, message.data(), message.size());
  return out;
}

g1_t mul(const g1_t& point, const scalar_t& scalar) {
  auto out = g1_t{};
  g1_t::mul(out, point, scalar);
  return out;
}

g2_t mul(const g2_t& point, const scalar_t& scalar) {
  auto out = g2_t{};
  g2_t::mul(out, point, scalar);
  return out;
}

g1_t add(const g1_t& a, const g1_t& b) {
  auto out = g1_t{};
  g1_t::add(out, a, b);
  return out;
}

g1_t sub(const g1_t& a, const g1_t& b) {
  auto out = g1_t{};
  g1_t::sub(out, a, b);
  return out;
}

gt_t pairing(const g1_t& p, const g2_t& q) {
  init();
  auto out = gt_t{};
  mcl::bn::pairing(out, p, q);
  return out;
}

}  // namespace warden::crypto::bls12381
