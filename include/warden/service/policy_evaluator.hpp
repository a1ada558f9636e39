#pragma once

#include <warden/chain/chain_client.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/state/chain_state.hpp>
#include <warden/validation/valid_ptb.hpp>

#include <optional>

namespace warden::service {

/// Evaluates the on-chain access predicate by dry-running the approve call
/// as the certificate's user. Anything short of a successful execution
/// denies.
class policy_evaluator final {
 public:
  policy_evaluator(warden::chain::chain_client& chain,
                   const warden::state::chain_state& state);

  /// std::nullopt when the call executes successfully, `no_access` when it
  /// aborts and `failure` when the node gives no usable answer.
  std::optional<warden::schema::error_code> evaluate(
      const warden::validation::valid_ptb& ptb,
      const warden::schema::address_t& sender) const;

 private:
  warden::chain::chain_client& chain_;
  const warden::state::chain_state& state_;
};

}  // namespace warden::service
