#pragma once
#include <warden/schema/primitives.hpp>
#include <warden/sui/transaction.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::validation {

inline constexpr auto kDefaultApprovePrefix = std::string_view{"seal_approve"};

/// A programmable transaction restricted to the access-check shape: a single
/// MoveCall to an approve-style function whose first argument is a pure
/// `vector<u8>` identity. Remaining arguments are passed to the policy as is.
class valid_ptb final {
 public:
  /// Decode and validate raw transaction bytes. Returns std::nullopt for any
  /// input that is not exactly that shape; never throws.
  static std::optional<valid_ptb> try_from(
      const warden::schema::bytes_view_t& bytes,
      const std::vector<std::string>& approve_prefixes);

  static std::optional<valid_ptb> try_from(
      warden::sui::programmable_transaction_t transaction,
      const std::vector<std::string>& approve_prefixes);

  const warden::sui::object_id_t& package() const;
  const std::string& module() const;
  const std::string& function() const;

  /// `0x<64 hex package>::<module>::<function>`.
  std::string full_function() const;

  /// Always exactly one element: the first call argument.
  const std::vector<warden::schema::bytes_t>& identity_arguments() const;

  const warden::sui::programmable_transaction_t& transaction() const;

 private:
  valid_ptb() = default;

  warden::sui::programmable_transaction_t transaction_;
  warden::sui::object_id_t package_{};
  std::string module_;
  std::string function_;
  std::vector<warden::schema::bytes_t> identities_;
};

}  // namespace warden::validation
