#include <warden/auth/certificate.hpp>
#include <warden/bcs/writer.hpp>

#include <spdlog/fmt/fmt.h>

#include <chrono>

namespace warden::auth {

std::string format_utc(const warden::schema::timestamp_milliseconds_t timestamp) {
  using namespace std::chrono;
  auto whole = sys_seconds{duration_cast<seconds>(milliseconds{timestamp})};
  auto day = floor<days>(whole);
  auto date = year_month_day{day};
  auto time = hh_mm_ss{whole - day};
  return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02} UTC",
                     static_cast<int>(date.year()),
                     static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()), time.hours().count(),
                     time.minutes().count(), time.seconds().count());
}

std::string certificate_message(
    const warden::schema::object_id_t& package, const uint16_t ttl_min,
    const warden::schema::timestamp_milliseconds_t creation_time,
    const warden::crypto::ed25519_public_key_t& session_vk) {
  return fmt::format(
      "Accessing keys of package {} for {} mins from {}, session key {}",
      warden::schema::to_address_string(package), ttl_min,
      format_utc(creation_time), warden::schema::to_base64(session_vk));
}

bool is_within_ttl(const certificate_t& certificate,
                   const warden::schema::timestamp_milliseconds_t now) {
  const auto ttl_ms = static_cast<uint64_t>(certificate.ttl_min) * 60'000;
  if (certificate.ttl_min > kMaxSessionTtlMinutes) {
    return false;
  }
  if (certificate.creation_time > now) {
    return false;
  }
  // Also rejects clocks earlier than one ttl after the epoch.
  return now >= ttl_ms && now - ttl_ms <= certificate.creation_time;
}

warden::schema::bytes_t request_signing_message(
    const warden::schema::bytes_view_t& ptb,
    const warden::schema::bytes_view_t& enc_key,
    const warden::schema::bytes_view_t& enc_verification_key) {
  auto out = warden::bcs::writer{};
  out.write_byte_vector(ptb);
  out.write_byte_vector(enc_key);
  out.write_byte_vector(enc_verification_key);
  return out.take();
}

bool verify_request_signature(
    const certificate_t& certificate, const warden::schema::bytes_view_t& ptb,
    const warden::schema::bytes_view_t& enc_key,
    const warden::schema::bytes_view_t& enc_verification_key,
    const warden::crypto::signature64_t& request_signature) {
  auto message = request_signing_message(ptb, enc_key, enc_verification_key);
  return warden::crypto::verify_signature(
      message,
      warden::crypto::signer_id_t{
          warden::crypto::ed25519_signer_id{.public_key =
                                                certificate.session_vk}},
      request_signature);
}

}  // namespace warden::auth
