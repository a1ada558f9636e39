#include <warden/bcs/reader.hpp>
#include <warden/bcs/writer.hpp>
#include <warden/blake2b/hash.hpp>
#include <warden/sui/signature.hpp>

#include <algorithm>
#include <bit>
#include <iterator>

namespace warden::sui {

namespace {

constexpr auto kEd25519SignatureSize = std::size_t{1 + 64 + 32};
constexpr auto kSecpSignatureSize = std::size_t{1 + 64 + 33};

warden::schema::bytes_view_t public_key_bytes(
    const warden::crypto::signer_id_t& signer) {
  return std::visit(
      [](const auto& value) {
        return warden::schema::bytes_view_t{value.public_key.data(),
                                            value.public_key.size()};
      },
      signer);
}

std::optional<warden::crypto::signer_id_t> make_signer(
    const signature_scheme scheme, const warden::schema::bytes_view_t& bytes) {
  switch (scheme) {
    case signature_scheme::ed25519: {
      auto signer = warden::crypto::ed25519_signer_id{};
      if (bytes.size() != signer.public_key.size()) {
        return std::nullopt;
      }
      std::copy(std::begin(bytes), std::end(bytes),
                std::begin(signer.public_key));
      return signer;
    }
    case signature_scheme::secp256k1: {
      auto signer = warden::crypto::secp256k1_signer_id{};
      if (bytes.size() != signer.public_key.size()) {
        return std::nullopt;
      }
      std::copy(std::begin(bytes), std::end(bytes),
                std::begin(signer.public_key));
      return signer;
    }
    case signature_scheme::secp256r1: {
      auto signer = warden::crypto::secp256r1_signer_id{};
      if (bytes.size() != signer.public_key.size()) {
        return std::nullopt;
      }
      std::copy(std::begin(bytes), std::end(bytes),
                std::begin(signer.public_key));
      return signer;
    }
    default:
      return std::nullopt;
  }
}

std::optional<simple_signature_t> parse_simple(
    const signature_scheme scheme, const warden::schema::bytes_view_t& bytes) {
  auto expected = scheme == signature_scheme::ed25519 ? kEd25519SignatureSize
                                                      : kSecpSignatureSize;
  if (bytes.size() != expected) {
    return std::nullopt;
  }
  auto signer = make_signer(scheme, bytes.subspan(1 + 64));
  if (!signer) {
    return std::nullopt;
  }
  auto out = simple_signature_t{.signer = *signer};
  std::copy_n(bytes.data() + 1, out.signature.size(), out.signature.data());
  return out;
}

bool is_single_key_scheme(const uint32_t tag) {
  return tag <= static_cast<uint32_t>(signature_scheme::secp256r1);
}

std::optional<multisig_signature_t> parse_multisig(
    const warden::schema::bytes_view_t& bytes) {
  auto in = warden::bcs::reader{bytes.subspan(1)};
  auto out = multisig_signature_t{};

  auto signature_count = in.read_sequence_length();
  if (!signature_count) {
    return std::nullopt;
  }
  for (auto i = uint32_t{0}; i < *signature_count; ++i) {
    auto tag = in.read_uleb128();
    if (!tag || !is_single_key_scheme(*tag)) {
      return std::nullopt;
    }
    auto raw = in.read_byte_vector();
    if (!raw || raw->size() != 64) {
      return std::nullopt;
    }
    auto compressed =
        compressed_signature_t{.scheme = static_cast<signature_scheme>(*tag)};
    std::copy(std::begin(*raw), std::end(*raw),
              std::begin(compressed.signature));
    out.signatures.push_back(compressed);
  }

  auto bitmap = in.read_u16();
  if (!bitmap) {
    return std::nullopt;
  }
  out.bitmap = *bitmap;

  auto member_count = in.read_sequence_length();
  if (!member_count) {
    return std::nullopt;
  }
  for (auto i = uint32_t{0}; i < *member_count; ++i) {
    auto tag = in.read_uleb128();
    if (!tag || !is_single_key_scheme(*tag)) {
      return std::nullopt;
    }
    auto raw = in.read_byte_vector();
    auto weight = in.read_u8();
    if (!raw || !weight) {
      return std::nullopt;
    }
    auto signer = make_signer(static_cast<signature_scheme>(*tag), *raw);
    if (!signer) {
      return std::nullopt;
    }
    out.public_key.members.push_back(
        multisig_member_t{.public_key = *signer, .weight = *weight});
  }

  auto threshold = in.read_u16();
  if (!threshold || !in.done()) {
    return std::nullopt;
  }
  out.public_key.threshold = *threshold;
  return out;
}

bool same_key(const warden::crypto::signer_id_t& a,
              const warden::crypto::signer_id_t& b) {
  auto a_bytes = public_key_bytes(a);
  auto b_bytes = public_key_bytes(b);
  return a.index() == b.index() &&
         std::ranges::equal(a_bytes, b_bytes);
}

bool is_well_formed(const multisig_public_key_t& public_key) {
  const auto& members = public_key.members;
  if (members.empty() || members.size() > kMaxMultisigMembers ||
      public_key.threshold == 0) {
    return false;
  }
  auto total_weight = uint32_t{0};
  for (std::size_t i = 0; i < members.size(); ++i) {
    if (members[i].weight == 0) {
      return false;
    }
    total_weight += members[i].weight;
    for (std::size_t j = i + 1; j < members.size(); ++j) {
      if (same_key(members[i].public_key, members[j].public_key)) {
        return false;
      }
    }
  }
  return total_weight >= public_key.threshold;
}

}  // namespace

std::optional<generic_signature_t> try_parse_signature(
    const warden::schema::bytes_view_t& bytes) {
  if (bytes.empty()) {
    return std::nullopt;
  }
  auto scheme = static_cast<signature_scheme>(bytes[0]);
  switch (scheme) {
    case signature_scheme::ed25519:
    case signature_scheme::secp256k1:
    case signature_scheme::secp256r1: {
      auto simple = parse_simple(scheme, bytes);
      if (!simple) {
        return std::nullopt;
      }
      return generic_signature_t{*simple};
    }
    case signature_scheme::multisig: {
      auto multisig = parse_multisig(bytes);
      if (!multisig) {
        return std::nullopt;
      }
      return generic_signature_t{std::move(*multisig)};
    }
    case signature_scheme::zklogin:
      if (bytes.size() < 2) {
        return std::nullopt;
      }
      return generic_signature_t{
          zklogin_signature_t{.serialized = warden::schema::make_bytes(bytes)}};
    case signature_scheme::bls12381:
    case signature_scheme::passkey:
      return std::nullopt;
  }
  return std::nullopt;
}

warden::schema::bytes_t serialize(const simple_signature_t& signature) {
  auto out = warden::schema::bytes_t{};
  out.push_back(static_cast<uint8_t>(scheme_of(signature.signer)));
  out.insert(std::end(out), std::begin(signature.signature),
             std::end(signature.signature));
  auto key = public_key_bytes(signature.signer);
  out.insert(std::end(out), std::begin(key), std::end(key));
  return out;
}

warden::schema::bytes_t serialize(const multisig_signature_t& signature) {
  auto out = warden::bcs::writer{};
  out.write_u8(static_cast<uint8_t>(signature_scheme::multisig));
  out.write_uleb128(static_cast<uint32_t>(signature.signatures.size()));
  for (const auto& compressed : signature.signatures) {
    out.write_uleb128(static_cast<uint32_t>(compressed.scheme));
    out.write_byte_vector(compressed.signature);
  }
  out.write_u16(signature.bitmap);
  out.write_uleb128(
      static_cast<uint32_t>(signature.public_key.members.size()));
  for (const auto& member : signature.public_key.members) {
    out.write_uleb128(static_cast<uint32_t>(scheme_of(member.public_key)));
    out.write_byte_vector(public_key_bytes(member.public_key));
    out.write_u8(member.weight);
  }
  out.write_u16(signature.public_key.threshold);
  return out.take();
}

signature_scheme scheme_of(const warden::crypto::signer_id_t& signer) {
  return std::visit(
      overloaded{[](const warden::crypto::ed25519_signer_id&) {
                   return signature_scheme::ed25519;
                 },
                 [](const warden::crypto::secp256k1_signer_id&) {
                   return signature_scheme::secp256k1;
                 },
                 [](const warden::crypto::secp256r1_signer_id&) {
                   return signature_scheme::secp256r1;
                 }},
      signer);
}

warden::schema::address_t address_of(
    const warden::crypto::signer_id_t& signer) {
  return warden::blake2b::hasher{}
      .update(static_cast<uint8_t>(scheme_of(signer)))
      .update(public_key_bytes(signer))
      .finalize();
}

warden::schema::address_t address_of(const multisig_public_key_t& public_key) {
  auto hasher = warden::blake2b::hasher{};
  hasher.update(static_cast<uint8_t>(signature_scheme::multisig));
  hasher.update(static_cast<uint8_t>(public_key.threshold & 0xFFu));
  hasher.update(static_cast<uint8_t>((public_key.threshold >> 8u) & 0xFFu));
  for (const auto& member : public_key.members) {
    hasher.update(static_cast<uint8_t>(scheme_of(member.public_key)));
    hasher.update(public_key_bytes(member.public_key));
    hasher.update(member.weight);
  }
  return hasher.finalize();
}

warden::schema::hash32_t personal_message_digest(
    const warden::schema::bytes_view_t& message) {
  auto out = warden::bcs::writer{};
  // Intent: scope PersonalMessage, version V0, app Sui.
  out.write_u8(3);
  out.write_u8(0);
  out.write_u8(0);
  out.write_byte_vector(message);
  return warden::blake2b::hash(out.bytes());
}

std::optional<warden::schema::address_t> verify_digest(
    const simple_signature_t& signature,
    const warden::schema::hash32_t& digest) {
  if (!warden::crypto::verify_signature(digest, signature.signer,
                                        signature.signature)) {
    return std::nullopt;
  }
  return address_of(signature.signer);
}

std::optional<warden::schema::address_t> verify_digest(
    const multisig_signature_t& signature,
    const warden::schema::hash32_t& digest) {
  const auto& public_key = signature.public_key;
  if (!is_well_formed(public_key)) {
    return std::nullopt;
  }
  const auto member_count = public_key.members.size();
  if ((static_cast<uint32_t>(signature.bitmap) >> member_count) != 0) {
    return std::nullopt;
  }
  if (static_cast<std::size_t>(std::popcount(signature.bitmap)) !=
      signature.signatures.size()) {
    return std::nullopt;
  }

  auto weight = uint32_t{0};
  auto next = std::begin(signature.signatures);
  for (std::size_t i = 0; i < member_count; ++i) {
    if ((signature.bitmap & (1u << i)) == 0) {
      continue;
    }
    const auto& member = public_key.members[i];
    if (next->scheme != scheme_of(member.public_key) ||
        !warden::crypto::verify_signature(digest, member.public_key,
                                          next->signature)) {
      return std::nullopt;
    }
    weight += member.weight;
    ++next;
  }
  if (weight < public_key.threshold) {
    return std::nullopt;
  }
  return address_of(public_key);
}

}  // namespace warden::sui
