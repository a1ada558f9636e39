#include <warden/state/chain_state.hpp>

#include <spdlog/spdlog.h>

namespace warden::state {

chain_state::chain_state(const warden::schema::object_id_t& anchor_package)
    : anchor_package_latest_{
          std::make_shared<const warden::schema::object_id_t>(anchor_package)} {
}

void chain_state::set_latest_checkpoint_timestamp(
    const warden::schema::timestamp_milliseconds_t timestamp) {
  latest_checkpoint_timestamp_.store(timestamp, std::memory_order_release);
}

warden::schema::timestamp_milliseconds_t
chain_state::latest_checkpoint_timestamp() const {
  return latest_checkpoint_timestamp_.load(std::memory_order_acquire);
}

void chain_state::set_reference_gas_price(const uint64_t price) {
  reference_gas_price_.store(price, std::memory_order_release);
}

uint64_t chain_state::reference_gas_price() const {
  return reference_gas_price_.load(std::memory_order_acquire);
}

void chain_state::set_anchor_package_latest(
    const warden::schema::object_id_t& package) {
  anchor_package_latest_.store(
      std::make_shared<const warden::schema::object_id_t>(package));
}

warden::schema::object_id_t chain_state::anchor_package_latest() const {
  return *anchor_package_latest_.load();
}

std::optional<warden::schema::error_code> chain_state::check_fresh(
    const warden::schema::timestamp_milliseconds_t now,
    const warden::schema::duration_milliseconds_t allowed_staleness) const {
  const auto latest = latest_checkpoint_timestamp();
  // A checkpoint ahead of the local clock counts as fresh.
  const auto staleness = now > latest ? now - latest : 0;
  if (staleness > allowed_staleness) {
    spdlog::warn("full node is stale, latest checkpoint is {} ms old",
                 staleness);
    return warden::schema::error_code::sui_client_not_fresh;
  }
  return std::nullopt;
}

bool refresh_checkpoint_timestamp(warden::chain::chain_client& chain,
                                  chain_state& state) {
  auto timestamp = chain.latest_checkpoint_timestamp();
  if (!timestamp) {
    return false;
  }
  state.set_latest_checkpoint_timestamp(*timestamp);
  return true;
}

bool refresh_reference_gas_price(warden::chain::chain_client& chain,
                                 chain_state& state) {
  auto price = chain.reference_gas_price();
  if (!price) {
    return false;
  }
  state.set_reference_gas_price(*price);
  return true;
}

bool refresh_anchor_package(warden::chain::chain_client& chain,
                            chain_state& state,
                            const warden::schema::object_id_t& anchor_package) {
  auto lookup = chain.resolve_package(anchor_package);
  if (lookup.status != warden::chain::lookup_status::found) {
    return false;
  }
  const auto previous = state.anchor_package_latest();
  if (previous != lookup.versions.latest) {
    spdlog::info("anchor package updated: {} -> {}",
                 warden::schema::to_address_string(previous),
                 warden::schema::to_address_string(lookup.versions.latest));
    state.set_anchor_package_latest(lookup.versions.latest);
  }
  return true;
}

}  // namespace warden::state
