#include <boost/program_options.hpp>
#include <sodium.h>
#include <warden/common/critical.hpp>
#include <warden/crypto/bls12381.hpp>
#include <warden/crypto/elgamal.hpp>
#include <warden/crypto/ibe.hpp>
#include <warden/sui/codec.hpp>
#include <warden/validation/valid_ptb.hpp>

#include <array>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;
namespace bls12381 = warden::crypto::bls12381;

std::string get_string(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    warden::common::critical("missing required argument --{}", name);
  }
  return vm[name].as<std::string>();
}

warden::schema::bytes_t get_binary(const po::variables_map& vm,
                                   const std::string& name) {
  auto bytes = warden::schema::try_decode_binary(get_string(vm, name));
  if (!bytes) {
    warden::common::critical("--{} must be base64 or 0x-hex", name);
  }
  return *bytes;
}

warden::schema::object_id_t get_object_id(const po::variables_map& vm,
                                          const std::string& name) {
  auto id = warden::schema::try_parse_address(get_string(vm, name));
  if (!id) {
    warden::common::critical("--{} must be an object id", name);
  }
  return *id;
}

bls12381::scalar_t get_scalar(const po::variables_map& vm,
                              const std::string& name) {
  auto scalar = bls12381::try_scalar_from_bytes(get_binary(vm, name));
  if (!scalar) {
    warden::common::critical("--{} must be a 32-byte scalar", name);
  }
  return *scalar;
}

bls12381::g1_t get_g1(const std::string& name, std::string_view encoded) {
  auto bytes = warden::schema::try_decode_binary(encoded);
  auto point = bytes ? bls12381::try_g1_from_bytes(*bytes) : std::nullopt;
  if (!point) {
    warden::common::critical("--{} must be a compressed G1 point", name);
  }
  return *point;
}

bls12381::g2_t get_g2(const po::variables_map& vm, const std::string& name) {
  auto point = bls12381::try_g2_from_bytes(get_binary(vm, name));
  if (!point) {
    warden::common::critical("--{} must be a compressed G2 point", name);
  }
  return *point;
}

// Single-identity commands use the first --identity.
warden::schema::bytes_t get_key_id(const po::variables_map& vm,
                                   const std::vector<std::string>& identities) {
  if (identities.empty()) {
    warden::common::critical("missing required argument --identity");
  }
  auto identity = warden::schema::try_decode_binary(identities.front());
  if (!identity) {
    warden::common::critical("--identity must be base64 or 0x-hex");
  }
  return warden::crypto::ibe::make_key_id(get_object_id(vm, "package"),
                                          *identity);
}

template <std::size_t N>
std::string encode_base64(const std::array<uint8_t, N>& bytes) {
  return warden::schema::to_base64(
      warden::schema::bytes_view_t{bytes.data(), bytes.size()});
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  warden_cli genkey\n"
            << "  warden_cli extract --master-key --package --identity\n"
            << "  warden_cli verify --public-key --package --identity "
               "--user-secret-key\n"
            << "  warden_cli pop --master-key --key-server-object-id\n"
            << "  warden_cli encrypt --public-key --package --identity "
               "--plaintext\n"
            << "  warden_cli decrypt --user-secret-key --package --identity "
               "--ciphertext\n"
            << "  warden_cli elgamal-genkey\n"
            << "  warden_cli elgamal-decrypt --secret-key --encrypted-key c1 "
               "c2\n"
            << "  warden_cli parse-ptb --ptb [--approve-prefix]\n"
            << "  warden_cli build-ptb --package --module --function "
               "--identity...\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"warden_cli options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "genkey|extract|verify|pop|encrypt|decrypt|elgamal-genkey|"
      "elgamal-decrypt|parse-ptb|build-ptb")(
      "master-key", po::value<std::string>(), "IBE master key")(
      "public-key", po::value<std::string>(), "IBE public key (G2)")(
      "package", po::value<std::string>(), "first package id")(
      "identity", po::value<std::vector<std::string>>()->multitoken(),
      "identity bytes, base64 or 0x-hex")(
      "user-secret-key", po::value<std::string>(), "user secret key (G1)")(
      "key-server-object-id", po::value<std::string>(),
      "key server object id")("plaintext", po::value<std::string>(),
                              "text to encrypt")(
      "ciphertext", po::value<std::string>(), "IBE ciphertext")(
      "secret-key", po::value<std::string>(), "ElGamal secret key")(
      "encrypted-key", po::value<std::vector<std::string>>()->multitoken(),
      "ElGamal ciphertext c1 c2")("ptb", po::value<std::string>(),
                                  "programmable transaction bytes")(
      "approve-prefix", po::value<std::vector<std::string>>()->multitoken(),
      "accepted approve function prefixes")(
      "module", po::value<std::string>(), "Move module")(
      "function", po::value<std::string>(), "Move function");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (sodium_init() < 0) {
    warden::common::critical("failed to initialize libsodium");
  }
  bls12381::init();

  auto identities = vm.contains("identity")
                        ? vm["identity"].as<std::vector<std::string>>()
                        : std::vector<std::string>{};

  if (command == "genkey") {
    auto keypair = warden::crypto::ibe::generate_master_keypair();
    std::cout << "master key: "
              << encode_base64(bls12381::to_bytes(keypair.master_key)) << '\n'
              << "public key: "
              << encode_base64(bls12381::to_bytes(keypair.public_key))
              << '\n';
    return 0;
  }
  if (command == "extract") {
    auto usk = warden::crypto::ibe::extract(get_scalar(vm, "master-key"),
                                            get_key_id(vm, identities));
    std::cout << encode_base64(bls12381::to_bytes(usk)) << '\n';
    return 0;
  }
  if (command == "verify") {
    auto usk = get_g1("user-secret-key", get_string(vm, "user-secret-key"));
    auto valid = warden::crypto::ibe::verify_user_secret_key(
        usk, get_key_id(vm, identities), get_g2(vm, "public-key"));
    std::cout << (valid ? "valid" : "invalid") << '\n';
    return valid ? 0 : 1;
  }
  if (command == "pop") {
    auto object_id = get_object_id(vm, "key-server-object-id");
    auto pop = warden::crypto::ibe::create_proof_of_possession(
        get_scalar(vm, "master-key"), object_id);
    std::cout << encode_base64(bls12381::to_bytes(pop)) << '\n';
    return 0;
  }
  if (command == "encrypt") {
    auto plaintext = get_string(vm, "plaintext");
    auto ciphertext = warden::crypto::ibe::encrypt(
        get_g2(vm, "public-key"), get_key_id(vm, identities),
        warden::schema::make_bytes_view(plaintext));
    if (!ciphertext) {
      warden::common::critical("encryption failed");
    }
    std::cout << warden::schema::to_base64(
                     warden::crypto::ibe::encode(*ciphertext))
              << '\n';
    return 0;
  }
  if (command == "decrypt") {
    auto ciphertext =
        warden::crypto::ibe::try_decode(get_binary(vm, "ciphertext"));
    if (!ciphertext) {
      warden::common::critical("--ciphertext is malformed");
    }
    auto usk = get_g1("user-secret-key", get_string(vm, "user-secret-key"));
    auto plaintext =
        warden::crypto::ibe::decrypt(usk, get_key_id(vm, identities), *ciphertext);
    if (!plaintext) {
      warden::common::critical("decryption failed");
    }
    std::cout << warden::schema::make_string(*plaintext) << '\n';
    return 0;
  }
  if (command == "elgamal-genkey") {
    auto keypair = warden::crypto::elgamal::generate_keypair();
    std::cout << "secret key: "
              << encode_base64(bls12381::to_bytes(keypair.secret_key)) << '\n'
              << "public key: "
              << encode_base64(bls12381::to_bytes(keypair.public_key)) << '\n'
              << "verification key: "
              << encode_base64(bls12381::to_bytes(keypair.verification_key))
              << '\n';
    return 0;
  }
  if (command == "elgamal-decrypt") {
    if (!vm.contains("encrypted-key")) {
      warden::common::critical("missing required argument --encrypted-key");
    }
    auto parts = vm["encrypted-key"].as<std::vector<std::string>>();
    if (parts.size() != 2) {
      warden::common::critical("--encrypted-key takes c1 and c2");
    }
    auto ciphertext = warden::crypto::elgamal::ciphertext_t{
        .c1 = get_g1("encrypted-key", parts[0]),
        .c2 = get_g1("encrypted-key", parts[1])};
    auto usk = warden::crypto::elgamal::decrypt(get_scalar(vm, "secret-key"),
                                                ciphertext);
    std::cout << encode_base64(bls12381::to_bytes(usk)) << '\n';
    return 0;
  }
  if (command == "parse-ptb") {
    auto prefixes =
        vm.contains("approve-prefix")
            ? vm["approve-prefix"].as<std::vector<std::string>>()
            : std::vector<std::string>{
                  std::string{warden::validation::kDefaultApprovePrefix}};
    auto ptb = warden::validation::valid_ptb::try_from(get_binary(vm, "ptb"),
                                                       prefixes);
    if (!ptb) {
      std::cout << "invalid\n";
      return 1;
    }
    std::cout << ptb->full_function() << '\n';
    for (const auto& identity : ptb->identity_arguments()) {
      std::cout << "  0x" << warden::schema::to_hex(identity) << '\n';
    }
    return 0;
  }
  if (command == "build-ptb") {
    auto decoded = std::vector<warden::schema::bytes_t>{};
    for (const auto& identity : identities) {
      auto bytes = warden::schema::try_decode_binary(identity);
      if (!bytes) {
        warden::common::critical("--identity must be base64 or 0x-hex");
      }
      decoded.push_back(std::move(*bytes));
    }
    auto ptb = warden::sui::make_approve_transaction(
        get_object_id(vm, "package"), get_string(vm, "module"),
        get_string(vm, "function"), decoded);
    std::cout << warden::schema::to_base64(
                     warden::sui::encode_programmable_transaction(ptb))
              << '\n';
    return 0;
  }
  warden::common::critical(
      "command must be genkey|extract|verify|pop|encrypt|decrypt|"
      "elgamal-genkey|elgamal-decrypt|parse-ptb|build-ptb");
}
