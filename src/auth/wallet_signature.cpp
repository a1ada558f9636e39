#include <warden/auth/wallet_signature.hpp>
#include <warden/sui/signature.hpp>

#include <spdlog/spdlog.h>

namespace warden::auth {

std::optional<warden::schema::error_code> verify_wallet_signature(
    const certificate_t& certificate,
    const warden::schema::object_id_t& package,
    warden::chain::chain_client& chain) {
  auto message = certificate_message(package, certificate.ttl_min,
                                     certificate.creation_time,
                                     certificate.session_vk);
  auto message_bytes = warden::schema::make_bytes_view(message);

  auto signature = warden::sui::try_parse_signature(certificate.signature);
  if (!signature) {
    spdlog::debug("certificate signature does not parse");
    return warden::schema::error_code::invalid_signature;
  }

  if (std::holds_alternative<warden::sui::zklogin_signature_t>(*signature)) {
    auto verified = chain.verify_zklogin_signature(
        message_bytes, certificate.signature, certificate.user);
    if (!verified) {
      spdlog::warn("zklogin verifier unavailable");
      return warden::schema::error_code::failure;
    }
    if (!*verified) {
      return warden::schema::error_code::invalid_signature;
    }
    return std::nullopt;
  }

  auto digest = warden::sui::personal_message_digest(message_bytes);
  auto signer = std::optional<warden::schema::address_t>{};
  if (const auto* simple =
          std::get_if<warden::sui::simple_signature_t>(&*signature)) {
    signer = warden::sui::verify_digest(*simple, digest);
  } else if (const auto* multisig =
                 std::get_if<warden::sui::multisig_signature_t>(&*signature)) {
    signer = warden::sui::verify_digest(*multisig, digest);
  }

  if (!signer || *signer != certificate.user) {
    spdlog::debug("certificate signature rejected for user {}",
                  warden::schema::to_address_string(certificate.user));
    return warden::schema::error_code::invalid_signature;
  }
  return std::nullopt;
}

}  // namespace warden::auth
