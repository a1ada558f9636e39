#include <warden/bcs/codec.hpp>
#include <warden/sui/codec.hpp>
#include <warden/validation/valid_ptb.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace warden::validation {

namespace {

bool has_approved_prefix(const std::string& function,
                         const std::vector<std::string>& prefixes) {
  return std::ranges::any_of(prefixes, [&](const std::string& prefix) {
    return !prefix.empty() && function.starts_with(prefix);
  });
}

// Pure input `index` holding a BCS `vector<u8>`, or nothing.
std::optional<warden::schema::bytes_t> identity_at(
    const warden::sui::programmable_transaction_t& transaction,
    const uint16_t index) {
  if (index >= transaction.inputs.size()) {
    return std::nullopt;
  }
  const auto* pure =
      std::get_if<warden::sui::pure_arg_t>(&transaction.inputs[index]);
  if (pure == nullptr) {
    return std::nullopt;
  }
  return warden::bcs::try_decode<warden::schema::bytes_t>(pure->bytes);
}

}  // namespace

std::optional<valid_ptb> valid_ptb::try_from(
    const warden::schema::bytes_view_t& bytes,
    const std::vector<std::string>& approve_prefixes) {
  auto transaction = warden::sui::try_decode_programmable_transaction(bytes);
  if (!transaction) {
    spdlog::debug("rejecting ptb: malformed bcs ({} bytes)", bytes.size());
    return std::nullopt;
  }
  return try_from(std::move(*transaction), approve_prefixes);
}

std::optional<valid_ptb> valid_ptb::try_from(
    warden::sui::programmable_transaction_t transaction,
    const std::vector<std::string>& approve_prefixes) {
  if (transaction.commands.size() != 1) {
    spdlog::debug("rejecting ptb: {} commands", transaction.commands.size());
    return std::nullopt;
  }
  const auto* call =
      std::get_if<warden::sui::move_call_t>(&transaction.commands.front());
  if (call == nullptr) {
    spdlog::debug("rejecting ptb: command is not a move call");
    return std::nullopt;
  }
  if (!has_approved_prefix(call->function, approve_prefixes)) {
    spdlog::debug("rejecting ptb: function {} is not an approve function",
                  call->function);
    return std::nullopt;
  }

  // Only the first argument names the key id. Later arguments belong to the
  // policy and may be pure byte vectors too.
  if (call->arguments.empty()) {
    spdlog::debug("rejecting ptb: approve call has no arguments");
    return std::nullopt;
  }
  const auto* input =
      std::get_if<warden::sui::input_t>(&call->arguments.front());
  if (input == nullptr) {
    spdlog::debug("rejecting ptb: first argument is not an input");
    return std::nullopt;
  }
  auto identity = identity_at(transaction, input->index);
  if (!identity) {
    spdlog::debug("rejecting ptb: first argument is not a pure vector<u8>");
    return std::nullopt;
  }

  auto out = valid_ptb{};
  out.package_ = call->package;
  out.module_ = call->module;
  out.function_ = call->function;
  out.identities_.push_back(std::move(*identity));
  out.transaction_ = std::move(transaction);
  return out;
}

const warden::sui::object_id_t& valid_ptb::package() const {
  return package_;
}

const std::string& valid_ptb::module() const {
  return module_;
}

const std::string& valid_ptb::function() const {
  return function_;
}

std::string valid_ptb::full_function() const {
  return warden::schema::to_address_string(package_) + "::" + module_ +
         "::" + function_;
}

const std::vector<warden::schema::bytes_t>& valid_ptb::identity_arguments()
    const {
  return identities_;
}

const warden::sui::programmable_transaction_t& valid_ptb::transaction() const {
  return transaction_;
}

}  // namespace warden::validation
