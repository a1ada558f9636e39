#include <warden/chain/rpc_client.hpp>

#include <google/protobuf/util/json_util.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cmath>
#include <exception>
#include <utility>

namespace warden::chain {

namespace {

constexpr auto kLatestPackageQuery = std::string_view{
    "query ($address: SuiAddress!) { latestPackage(address: $address) { "
    "address packageAtVersion(version: 1) { address } } }"};

constexpr auto kVerifyZkloginQuery = std::string_view{
    "query ($bytes: Base64!, $signature: Base64!, $author: SuiAddress!) { "
    "verifyZkloginSignature(bytes: $bytes, signature: $signature, "
    "intentScope: PERSONAL_MESSAGE, author: $author) { success errors } }"};

bool holds(const google::protobuf::Value& value,
        const google::protobuf::Value::KindCase kind) {
  return value.kind_case() == kind;
}

google::protobuf::Value string_value(std::string value) {
  auto out = google::protobuf::Value{};
  out.set_string_value(std::move(value));
  return out;
}

std::optional<warden::schema::object_id_t> address_at(
    const google::protobuf::Struct& object,
    std::initializer_list<std::string_view> path) {
  const auto* value = json::find(object, path);
  if (value == nullptr || !holds(*value, google::protobuf::Value::kStringValue)) {
    return std::nullopt;
  }
  return warden::schema::try_parse_address(value->string_value());
}

}  // namespace

namespace json {

const google::protobuf::Value* find(
    const google::protobuf::Struct& object,
    std::initializer_list<std::string_view> path) {
  const auto* current = &object;
  const google::protobuf::Value* value = nullptr;
  for (const auto key : path) {
    if (current == nullptr) {
      return nullptr;
    }
    auto it = current->fields().find(std::string{key});
    if (it == current->fields().end()) {
      return nullptr;
    }
    value = &it->second;
    current = holds(*value, google::protobuf::Value::kStructValue)
                  ? &value->struct_value()
                  : nullptr;
  }
  return value;
}

std::optional<uint64_t> try_u64(const google::protobuf::Value& value) {
  if (holds(value, google::protobuf::Value::kStringValue)) {
    const auto& text = value.string_value();
    auto out = uint64_t{};
    auto [end, error] =
        std::from_chars(text.data(), text.data() + text.size(), out);
    if (error != std::errc{} || end != text.data() + text.size()) {
      return std::nullopt;
    }
    return out;
  }
  if (holds(value, google::protobuf::Value::kNumberValue)) {
    const auto number = value.number_value();
    // Doubles are exact up to 2^53.
    if (number < 0 || number > 9007199254740992.0 ||
        std::floor(number) != number) {
      return std::nullopt;
    }
    return static_cast<uint64_t>(number);
  }
  return std::nullopt;
}

}  // namespace json

rpc_client::rpc_client(warden::http::url_t node_url,
                       warden::http::url_t graphql_url,
                       warden::http::client& http)
    : node_url_{std::move(node_url)},
      graphql_url_{std::move(graphql_url)},
      http_{http} {}

std::optional<google::protobuf::Struct> rpc_client::post_json(
    const warden::http::url_t& url, const google::protobuf::Struct& body) {
  auto payload = std::string{};
  if (!google::protobuf::util::MessageToJsonString(body, &payload).ok()) {
    spdlog::error("failed to serialize request to {}", url.host);
    return std::nullopt;
  }

  auto response = std::optional<warden::http::client_response_t>{};
  try {
    response = http_.post(url, std::move(payload));
  } catch (const std::exception& e) {
    spdlog::warn("request to {} threw: {}", url.host, e.what());
    return std::nullopt;
  }
  if (!response) {
    return std::nullopt;
  }
  if (response->status / 100 != 2) {
    spdlog::warn("{} answered with status {}", url.host, response->status);
    return std::nullopt;
  }

  auto parsed = google::protobuf::Struct{};
  auto status =
      google::protobuf::util::JsonStringToMessage(response->body, &parsed);
  if (!status.ok()) {
    spdlog::warn("malformed response from {}: {}", url.host,
                 status.ToString());
    return std::nullopt;
  }
  return parsed;
}

std::optional<google::protobuf::Value> rpc_client::call(
    const std::string_view method, google::protobuf::ListValue params) {
  auto body = google::protobuf::Struct{};
  auto& fields = *body.mutable_fields();
  fields["jsonrpc"] = string_value("2.0");
  fields["id"].set_number_value(1);
  fields["method"] = string_value(std::string{method});
  *fields["params"].mutable_list_value() = std::move(params);

  auto response = post_json(node_url_, body);
  if (!response) {
    return std::nullopt;
  }
  if (const auto* error = json::find(*response, {"error", "message"})) {
    spdlog::warn("{} failed: {}", method, error->string_value());
    return std::nullopt;
  }
  const auto* result = json::find(*response, {"result"});
  if (result == nullptr) {
    spdlog::warn("{} returned no result", method);
    return std::nullopt;
  }
  return *result;
}

std::optional<google::protobuf::Struct> rpc_client::query(
    const std::string_view document, google::protobuf::Struct variables) {
  auto body = google::protobuf::Struct{};
  auto& fields = *body.mutable_fields();
  fields["query"] = string_value(std::string{document});
  *fields["variables"].mutable_struct_value() = std::move(variables);

  auto response = post_json(graphql_url_, body);
  if (!response) {
    return std::nullopt;
  }
  if (const auto* errors = json::find(*response, {"errors"});
      errors != nullptr && holds(*errors, google::protobuf::Value::kListValue) &&
      errors->list_value().values_size() > 0) {
    const auto* message =
        holds(errors->list_value().values(0),
              google::protobuf::Value::kStructValue)
            ? json::find(errors->list_value().values(0).struct_value(),
                         {"message"})
            : nullptr;
    spdlog::warn("graphql query failed: {}",
                 message != nullptr ? message->string_value() : "unknown");
    return std::nullopt;
  }
  const auto* data = json::find(*response, {"data"});
  if (data == nullptr || !holds(*data, google::protobuf::Value::kStructValue)) {
    spdlog::warn("graphql response carries no data");
    return std::nullopt;
  }
  return data->struct_value();
}

std::optional<warden::schema::timestamp_milliseconds_t>
rpc_client::latest_checkpoint_timestamp() {
  auto sequence =
      call("sui_getLatestCheckpointSequenceNumber", google::protobuf::ListValue{});
  if (!sequence || !json::try_u64(*sequence)) {
    return std::nullopt;
  }

  auto params = google::protobuf::ListValue{};
  *params.add_values() = string_value(
      std::to_string(*json::try_u64(*sequence)));
  auto checkpoint = call("sui_getCheckpoint", std::move(params));
  if (!checkpoint || !holds(*checkpoint, google::protobuf::Value::kStructValue)) {
    return std::nullopt;
  }
  const auto* timestamp = json::find(checkpoint->struct_value(), {"timestampMs"});
  if (timestamp == nullptr) {
    return std::nullopt;
  }
  return json::try_u64(*timestamp);
}

std::optional<uint64_t> rpc_client::reference_gas_price() {
  auto price =
      call("suix_getReferenceGasPrice", google::protobuf::ListValue{});
  if (!price) {
    return std::nullopt;
  }
  return json::try_u64(*price);
}

package_lookup_t rpc_client::resolve_package(
    const warden::schema::object_id_t& package) {
  auto variables = google::protobuf::Struct{};
  (*variables.mutable_fields())["address"] =
      string_value(warden::schema::to_address_string(package));
  auto data = query(kLatestPackageQuery, std::move(variables));
  if (!data) {
    return package_lookup_t{.status = lookup_status::failed};
  }

  const auto* latest_package = json::find(*data, {"latestPackage"});
  if (latest_package == nullptr || holds(*latest_package, google::protobuf::Value::kNullValue)) {
    return package_lookup_t{.status = lookup_status::not_found};
  }
  auto latest = address_at(*data, {"latestPackage", "address"});
  auto first =
      address_at(*data, {"latestPackage", "packageAtVersion", "address"});
  if (!latest || !first) {
    spdlog::warn("unexpected latestPackage shape for {}",
                 warden::schema::to_address_string(package));
    return package_lookup_t{.status = lookup_status::failed};
  }
  return package_lookup_t{
      .status = lookup_status::found,
      .versions = package_versions_t{.first = *first, .latest = *latest}};
}

dry_run_status rpc_client::dry_run(
    const warden::schema::bytes_view_t& transaction_data) {
  auto params = google::protobuf::ListValue{};
  *params.add_values() = string_value(warden::schema::to_base64(transaction_data));
  auto result = call("sui_dryRunTransactionBlock", std::move(params));
  if (!result || !holds(*result, google::protobuf::Value::kStructValue)) {
    return dry_run_status::failed;
  }
  const auto* status =
      json::find(result->struct_value(), {"effects", "status", "status"});
  if (status == nullptr || !holds(*status, google::protobuf::Value::kStringValue)) {
    spdlog::warn("dry run response carries no effects status");
    return dry_run_status::failed;
  }
  if (status->string_value() == "success") {
    return dry_run_status::success;
  }
  if (const auto* error =
          json::find(result->struct_value(), {"effects", "status", "error"})) {
    spdlog::debug("dry run denied: {}", error->string_value());
  }
  return dry_run_status::denied;
}

std::optional<bool> rpc_client::verify_zklogin_signature(
    const warden::schema::bytes_view_t& personal_message,
    const warden::schema::bytes_view_t& signature,
    const warden::schema::address_t& author) {
  auto variables = google::protobuf::Struct{};
  auto& fields = *variables.mutable_fields();
  fields["bytes"] = string_value(warden::schema::to_base64(personal_message));
  fields["signature"] = string_value(warden::schema::to_base64(signature));
  fields["author"] = string_value(warden::schema::to_address_string(author));

  auto data = query(kVerifyZkloginQuery, std::move(variables));
  if (!data) {
    return std::nullopt;
  }
  const auto* success = json::find(*data, {"verifyZkloginSignature", "success"});
  if (success == nullptr || !holds(*success, google::protobuf::Value::kBoolValue)) {
    return std::nullopt;
  }
  return success->bool_value();
}

}  // namespace warden::chain
