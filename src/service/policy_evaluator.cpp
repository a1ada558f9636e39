#include <warden/service/policy_evaluator.hpp>
#include <warden/sui/codec.hpp>

#include <spdlog/spdlog.h>

namespace warden::service {

policy_evaluator::policy_evaluator(warden::chain::chain_client& chain,
                                   const warden::state::chain_state& state)
    : chain_{chain}, state_{state} {}

std::optional<warden::schema::error_code> policy_evaluator::evaluate(
    const warden::validation::valid_ptb& ptb,
    const warden::schema::address_t& sender) const {
  auto transaction = warden::sui::make_dry_run_transaction(
      ptb.transaction(), sender, state_.reference_gas_price());
  auto bytes = warden::sui::encode_transaction_data(transaction);

  using enum warden::chain::dry_run_status;
  switch (chain_.dry_run(bytes)) {
    case success:
      return std::nullopt;
    case denied:
      spdlog::debug("dry run of {} denied for {}", ptb.full_function(),
                    warden::schema::to_address_string(sender));
      return warden::schema::error_code::no_access;
    case failed:
    default:
      return warden::schema::error_code::failure;
  }
}

}  // namespace warden::service
