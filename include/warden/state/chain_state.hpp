#pragma once

#include <warden/chain/chain_client.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/primitives.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>

namespace warden::state {

/// Process-wide view of the chain maintained by background updaters. Each
/// value has exactly one writer; readers take a snapshot without locking
/// the writer out.
class chain_state final {
 public:
  /// `anchor_package` is the configured package id, used until the first
  /// refresh resolves its latest version.
  explicit chain_state(const warden::schema::object_id_t& anchor_package);

  void set_latest_checkpoint_timestamp(
      warden::schema::timestamp_milliseconds_t timestamp);
  warden::schema::timestamp_milliseconds_t latest_checkpoint_timestamp() const;

  void set_reference_gas_price(uint64_t price);
  uint64_t reference_gas_price() const;

  void set_anchor_package_latest(const warden::schema::object_id_t& package);
  warden::schema::object_id_t anchor_package_latest() const;

  /// `sui_client_not_fresh` when the last checkpoint seen is more than
  /// `allowed_staleness` older than `now`.
  std::optional<warden::schema::error_code> check_fresh(
      warden::schema::timestamp_milliseconds_t now,
      warden::schema::duration_milliseconds_t allowed_staleness) const;

 private:
  std::atomic<warden::schema::timestamp_milliseconds_t>
      latest_checkpoint_timestamp_{0};
  std::atomic<uint64_t> reference_gas_price_{0};
  std::atomic<std::shared_ptr<const warden::schema::object_id_t>>
      anchor_package_latest_;
};

/// One refresh of each value. False when the chain could not answer; the
/// previous value is kept.
bool refresh_checkpoint_timestamp(warden::chain::chain_client& chain,
                                  chain_state& state);
bool refresh_reference_gas_price(warden::chain::chain_client& chain,
                                 chain_state& state);
bool refresh_anchor_package(warden::chain::chain_client& chain,
                            chain_state& state,
                            const warden::schema::object_id_t& anchor_package);

}  // namespace warden::state
