#pragma once

#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <optional>

// Read-only view of the chain used by the key server. Implementations never
// throw; an unreachable or malformed upstream is reported as a failure value.
namespace warden::chain {

enum class lookup_status : uint8_t { found, not_found, failed };

struct package_versions_t final {
  warden::schema::object_id_t first{};
  warden::schema::object_id_t latest{};
};

struct package_lookup_t final {
  lookup_status status{lookup_status::failed};
  package_versions_t versions;
};

enum class dry_run_status : uint8_t {
  // Effects status was "success".
  success,
  // The node executed the transaction and reported a failure status.
  denied,
  // No usable answer: transport error, RPC error or unexpected response.
  failed,
};

class chain_client {
 public:
  virtual ~chain_client() = default;

  virtual std::optional<warden::schema::timestamp_milliseconds_t>
  latest_checkpoint_timestamp() = 0;

  virtual std::optional<uint64_t> reference_gas_price() = 0;

  /// First and latest published addresses of the package lineage that
  /// `package` belongs to.
  virtual package_lookup_t resolve_package(
      const warden::schema::object_id_t& package) = 0;

  /// Simulate BCS `TransactionData` bytes.
  virtual dry_run_status dry_run(
      const warden::schema::bytes_view_t& transaction_data) = 0;

  /// Verify a zkLogin signature over a personal message. std::nullopt means
  /// the verifier could not be reached.
  virtual std::optional<bool> verify_zklogin_signature(
      const warden::schema::bytes_view_t& personal_message,
      const warden::schema::bytes_view_t& signature,
      const warden::schema::address_t& author) = 0;
};

}  // namespace warden::chain
