#include <warden/sui/codec.hpp>

#include <cctype>

namespace warden::sui {

namespace {

bool is_identifier_char(const char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool decode_identifier(warden::bcs::reader& in, std::string& out) {
  auto value = in.read_string();
  if (!value || !is_valid_identifier(*value)) {
    return false;
  }
  out = std::move(*value);
  return true;
}

bool decode_digest(warden::bcs::reader& in, digest_t& out) {
  // Digests travel as a length-prefixed byte string that must be 32 long.
  auto bytes = in.read_byte_vector();
  if (!bytes) {
    return false;
  }
  auto digest = warden::schema::try_make_hash32(*bytes);
  if (!digest) {
    return false;
  }
  out = *digest;
  return true;
}

bool decode_type_tag(warden::bcs::reader& in, type_tag_t& out,
                     std::size_t depth);

bool decode_type_tags(warden::bcs::reader& in, std::vector<type_tag_t>& out,
                      const std::size_t depth) {
  auto length = in.read_sequence_length();
  if (!length) {
    return false;
  }
  out.clear();
  out.reserve(*length);
  for (auto i = uint32_t{0}; i < *length; ++i) {
    auto element = type_tag_t{};
    if (!decode_type_tag(in, element, depth)) {
      return false;
    }
    out.push_back(std::move(element));
  }
  return true;
}

bool decode_struct_tag(warden::bcs::reader& in, struct_tag_t& out,
                       const std::size_t depth) {
  return decode(in, out.address) && decode_identifier(in, out.module) &&
         decode_identifier(in, out.name) &&
         decode_type_tags(in, out.type_params, depth + 1);
}

bool decode_type_tag(warden::bcs::reader& in, type_tag_t& out,
                     const std::size_t depth) {
  if (depth > kMaxTypeTagDepth) {
    return false;
  }
  auto tag = in.read_uleb128();
  if (!tag || *tag > static_cast<uint32_t>(type_tag_kind::u256)) {
    return false;
  }
  out.kind = static_cast<type_tag_kind>(*tag);
  out.element.clear();
  out.struct_tag.clear();
  switch (out.kind) {
    case type_tag_kind::vector: {
      auto element = type_tag_t{};
      if (!decode_type_tag(in, element, depth + 1)) {
        return false;
      }
      out.element.push_back(std::move(element));
      return true;
    }
    case type_tag_kind::struct_type: {
      auto tag_value = struct_tag_t{};
      if (!decode_struct_tag(in, tag_value, depth + 1)) {
        return false;
      }
      out.struct_tag.push_back(std::move(tag_value));
      return true;
    }
    default:
      return true;
  }
}

void encode_digest(warden::bcs::writer& out, const digest_t& digest) {
  out.write_byte_vector(
      warden::schema::bytes_view_t{digest.data(), digest.size()});
}

}  // namespace

bool is_valid_identifier(const std::string_view identifier) {
  if (identifier.empty()) {
    return false;
  }
  auto first = identifier.front();
  if (first == '_') {
    if (identifier.size() == 1) {
      return false;
    }
  } else if (std::isalpha(static_cast<unsigned char>(first)) == 0) {
    return false;
  }
  for (const auto c : identifier.substr(1)) {
    if (!is_identifier_char(c)) {
      return false;
    }
  }
  return true;
}

bool decode(warden::bcs::reader& in, object_ref_t& out) {
  return decode(in, out.object_id) && decode(in, out.version) &&
         decode_digest(in, out.digest);
}

bool decode(warden::bcs::reader& in, object_arg_t& out) {
  auto tag = in.read_uleb128();
  if (!tag) {
    return false;
  }
  switch (*tag) {
    case 0: {
      auto value = imm_or_owned_object_t{};
      if (!decode(in, value.reference)) {
        return false;
      }
      out = value;
      return true;
    }
    case 1: {
      auto value = shared_object_t{};
      if (!decode(in, value.object_id) ||
          !decode(in, value.initial_shared_version) ||
          !decode(in, value.is_mutable)) {
        return false;
      }
      out = value;
      return true;
    }
    case 2: {
      auto value = receiving_object_t{};
      if (!decode(in, value.reference)) {
        return false;
      }
      out = value;
      return true;
    }
    default:
      return false;
  }
}

bool decode(warden::bcs::reader& in, call_arg_t& out) {
  auto tag = in.read_uleb128();
  if (!tag) {
    return false;
  }
  switch (*tag) {
    case 0: {
      auto value = pure_arg_t{};
      if (!decode(in, value.bytes)) {
        return false;
      }
      out = std::move(value);
      return true;
    }
    case 1: {
      auto value = object_call_arg_t{};
      if (!decode(in, value.object)) {
        return false;
      }
      out = value;
      return true;
    }
    default:
      return false;
  }
}

bool decode(warden::bcs::reader& in, argument_t& out) {
  auto tag = in.read_uleb128();
  if (!tag) {
    return false;
  }
  switch (*tag) {
    case 0:
      out = gas_coin_t{};
      return true;
    case 1: {
      auto value = input_t{};
      if (!decode(in, value.index)) {
        return false;
      }
      out = value;
      return true;
    }
    case 2: {
      auto value = result_t{};
      if (!decode(in, value.index)) {
        return false;
      }
      out = value;
      return true;
    }
    case 3: {
      auto value = nested_result_t{};
      if (!decode(in, value.index) || !decode(in, value.result_index)) {
        return false;
      }
      out = value;
      return true;
    }
    default:
      return false;
  }
}

bool decode(warden::bcs::reader& in, type_tag_t& out) {
  return decode_type_tag(in, out, 0);
}

bool decode(warden::bcs::reader& in, struct_tag_t& out) {
  return decode_struct_tag(in, out, 0);
}

bool decode(warden::bcs::reader& in, command_t& out) {
  auto tag = in.read_uleb128();
  if (!tag) {
    return false;
  }
  switch (*tag) {
    case 0: {
      auto value = move_call_t{};
      if (!decode(in, value.package) || !decode_identifier(in, value.module) ||
          !decode_identifier(in, value.function) ||
          !decode_type_tags(in, value.type_arguments, 0) ||
          !decode(in, value.arguments)) {
        return false;
      }
      out = std::move(value);
      return true;
    }
    case 1: {
      auto value = transfer_objects_t{};
      if (!decode(in, value.objects) || !decode(in, value.address)) {
        return false;
      }
      out = std::move(value);
      return true;
    }
    case 2: {
      auto value = split_coins_t{};
      if (!decode(in, value.coin) || !decode(in, value.amounts)) {
        return false;
      }
      out = std::move(value);
      return true;
    }
    case 3: {
      auto value = merge_coins_t{};
      if (!decode(in, value.destination) || !decode(in, value.sources)) {
        return false;
      }
      out = std::move(value);
      return true;
    }
    case 4: {
      auto value = publish_t{};
      if (!decode(in, value.modules) || !decode(in, value.dependencies)) {
        return false;
      }
      out = std::move(value);
      return true;
    }
    case 5: {
      auto value = make_move_vec_t{};
      if (!decode(in, value.type) || !decode(in, value.elements)) {
        return false;
      }
      out = std::move(value);
      return true;
    }
    case 6: {
      auto value = upgrade_t{};
      if (!decode(in, value.modules) || !decode(in, value.dependencies) ||
          !decode(in, value.package) || !decode(in, value.ticket)) {
        return false;
      }
      out = std::move(value);
      return true;
    }
    default:
      return false;
  }
}

bool decode(warden::bcs::reader& in, programmable_transaction_t& out) {
  return decode(in, out.inputs) && decode(in, out.commands);
}

bool decode(warden::bcs::reader& in, gas_data_t& out) {
  return decode(in, out.payment) && decode(in, out.owner) &&
         decode(in, out.price) && decode(in, out.budget);
}

bool decode(warden::bcs::reader& in, transaction_data_t& out) {
  // TransactionData::V1, then TransactionKind::ProgrammableTransaction.
  auto version = in.read_uleb128();
  auto kind = in.read_uleb128();
  if (!version || *version != 0 || !kind || *kind != 0) {
    return false;
  }
  if (!decode(in, out.kind) || !decode(in, out.sender) ||
      !decode(in, out.gas_data)) {
    return false;
  }
  auto expiration = in.read_uleb128();
  if (!expiration) {
    return false;
  }
  switch (*expiration) {
    case 0:
      out.expiration_epoch.reset();
      return true;
    case 1: {
      auto epoch = uint64_t{};
      if (!decode(in, epoch)) {
        return false;
      }
      out.expiration_epoch = epoch;
      return true;
    }
    default:
      return false;
  }
}

void encode(warden::bcs::writer& out, const object_ref_t& value) {
  encode(out, value.object_id);
  encode(out, value.version);
  encode_digest(out, value.digest);
}

void encode(warden::bcs::writer& out, const object_arg_t& value) {
  out.write_uleb128(static_cast<uint32_t>(value.index()));
  std::visit(overloaded{[&](const imm_or_owned_object_t& object) {
                          encode(out, object.reference);
                        },
                        [&](const shared_object_t& object) {
                          encode(out, object.object_id);
                          encode(out, object.initial_shared_version);
                          encode(out, object.is_mutable);
                        },
                        [&](const receiving_object_t& object) {
                          encode(out, object.reference);
                        }},
             value);
}

void encode(warden::bcs::writer& out, const call_arg_t& value) {
  out.write_uleb128(static_cast<uint32_t>(value.index()));
  std::visit(
      overloaded{[&](const pure_arg_t& pure) { encode(out, pure.bytes); },
                 [&](const object_call_arg_t& object) {
                   encode(out, object.object);
                 }},
      value);
}

void encode(warden::bcs::writer& out, const argument_t& value) {
  out.write_uleb128(static_cast<uint32_t>(value.index()));
  std::visit(overloaded{[](const gas_coin_t&) {},
                        [&](const input_t& input) { encode(out, input.index); },
                        [&](const result_t& result) {
                          encode(out, result.index);
                        },
                        [&](const nested_result_t& nested) {
                          encode(out, nested.index);
                          encode(out, nested.result_index);
                        }},
             value);
}

void encode(warden::bcs::writer& out, const type_tag_t& value) {
  out.write_uleb128(static_cast<uint32_t>(value.kind));
  if (value.kind == type_tag_kind::vector && !value.element.empty()) {
    encode(out, value.element.front());
  } else if (value.kind == type_tag_kind::struct_type &&
             !value.struct_tag.empty()) {
    encode(out, value.struct_tag.front());
  }
}

void encode(warden::bcs::writer& out, const struct_tag_t& value) {
  encode(out, value.address);
  encode(out, value.module);
  encode(out, value.name);
  encode(out, value.type_params);
}

void encode(warden::bcs::writer& out, const command_t& value) {
  out.write_uleb128(static_cast<uint32_t>(value.index()));
  std::visit(overloaded{[&](const move_call_t& call) {
                          encode(out, call.package);
                          encode(out, call.module);
                          encode(out, call.function);
                          encode(out, call.type_arguments);
                          encode(out, call.arguments);
                        },
                        [&](const transfer_objects_t& transfer) {
                          encode(out, transfer.objects);
                          encode(out, transfer.address);
                        },
                        [&](const split_coins_t& split) {
                          encode(out, split.coin);
                          encode(out, split.amounts);
                        },
                        [&](const merge_coins_t& merge) {
                          encode(out, merge.destination);
                          encode(out, merge.sources);
                        },
                        [&](const publish_t& publish) {
                          encode(out, publish.modules);
                          encode(out, publish.dependencies);
                        },
                        [&](const make_move_vec_t& make) {
                          encode(out, make.type);
                          encode(out, make.elements);
                        },
                        [&](const upgrade_t& upgrade) {
                          encode(out, upgrade.modules);
                          encode(out, upgrade.dependencies);
                          encode(out, upgrade.package);
                          encode(out, upgrade.ticket);
                        }},
             value);
}

void encode(warden::bcs::writer& out, const programmable_transaction_t& value) {
  encode(out, value.inputs);
  encode(out, value.commands);
}

void encode(warden::bcs::writer& out, const gas_data_t& value) {
  encode(out, value.payment);
  encode(out, value.owner);
  encode(out, value.price);
  encode(out, value.budget);
}

void encode(warden::bcs::writer& out, const transaction_data_t& value) {
  out.write_uleb128(0);
  out.write_uleb128(0);
  encode(out, value.kind);
  encode(out, value.sender);
  encode(out, value.gas_data);
  if (value.expiration_epoch) {
    out.write_uleb128(1);
    encode(out, *value.expiration_epoch);
  } else {
    out.write_uleb128(0);
  }
}

std::optional<programmable_transaction_t> try_decode_programmable_transaction(
    const warden::schema::bytes_view_t& bytes) {
  return warden::bcs::try_decode<programmable_transaction_t>(bytes);
}

warden::schema::bytes_t encode_programmable_transaction(
    const programmable_transaction_t& value) {
  return warden::bcs::encode(value);
}

warden::schema::bytes_t encode_transaction_data(
    const transaction_data_t& value) {
  return warden::bcs::encode(value);
}

transaction_data_t make_dry_run_transaction(programmable_transaction_t ptb,
                                            const address_t& sender,
                                            const uint64_t gas_price) {
  return transaction_data_t{
      .kind = std::move(ptb),
      .sender = sender,
      .gas_data = gas_data_t{.payment = {},
                             .owner = sender,
                             .price = gas_price,
                             .budget = kGasBudget},
      .expiration_epoch = std::nullopt};
}

programmable_transaction_t make_approve_transaction(
    const object_id_t& package, std::string module, std::string function,
    const std::vector<warden::schema::bytes_t>& identities) {
  auto ptb = programmable_transaction_t{};
  auto call = move_call_t{.package = package,
                          .module = std::move(module),
                          .function = std::move(function)};
  for (const auto& identity : identities) {
    call.arguments.emplace_back(
        input_t{.index = static_cast<uint16_t>(ptb.inputs.size())});
    ptb.inputs.emplace_back(pure_arg_t{.bytes = warden::bcs::encode(identity)});
  }
  ptb.commands.emplace_back(std::move(call));
  return ptb;
}

}  // namespace warden::sui
