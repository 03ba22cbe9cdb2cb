#include "mcpshim/protocol/json_rpc.hpp"

#include <limits>
#include <utility>

namespace mcpshim {
namespace {
constexpr std::string_view kJsonRpcVersion{"2.0"};

bool is_valid_params_type(const Json& node) {
    const bool is_object = node.is_object();
    const bool is_array = node.is_array();
    return (is_object == true) || (is_array == true);
}

// Null and absent ids are handled by the caller; this only accepts real ids.
JsonResult<JsonRpcId> parse_id_field(const Json& id_node) {
    if (id_node.is_number_unsigned() == true) {
        const auto unsigned_id = id_node.get<std::uint64_t>();
        if (unsigned_id > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return JsonRpcId::unsigned_integer(unsigned_id);
        }
        return JsonRpcId::integer(static_cast<std::int64_t>(unsigned_id));
    }
    if (id_node.is_number_integer() == true) {
        return JsonRpcId::integer(id_node.get<std::int64_t>());
    }
    if (id_node.is_number_float() == true) {
        return JsonRpcId::number(id_node.get<double>());
    }
    if (id_node.is_string() == true) {
        return JsonRpcId::string(id_node.get<std::string>());
    }

    return tl::unexpected(JsonError{
        JsonError::Code::InvalidId,
        "id must be a number, a string or null"});
}
}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcId JsonRpcId::null() {
    return JsonRpcId{nullptr};
}

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::unsigned_integer(std::uint64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::number(double value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

bool JsonRpcId::is_null() const noexcept {
    return std::holds_alternative<std::nullptr_t>(value);
}

Json JsonRpcId::to_json() const {
    Json node;
    std::visit(
        [&](const auto& id_value) {
            node = id_value;
        },
        value);
    return node;
}

std::string JsonRpcId::to_string() const {
    return to_json().dump();
}

JsonRpcId extract_id(const Json& payload) {
    if ((payload.is_object() == false) || (payload.contains("id") == false)) {
        return JsonRpcId::null();
    }
    auto parsed = parse_id_field(payload.at("id"));
    if (parsed.has_value() == false) {
        return JsonRpcId::null();
    }
    return *parsed;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::optional<JsonRpcId> id,
                               std::optional<Json> params,
                               Json payload)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)),
      payload_(std::move(payload)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const std::optional<JsonRpcId>& JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

const Json& JsonRpcRequest::payload() const noexcept {
    return payload_;
}

bool JsonRpcRequest::has_id() const noexcept {
    return id_.has_value() && (id_->is_null() == false);
}

bool JsonRpcRequest::is_notification_method() const noexcept {
    return method_.starts_with(kNotificationPrefix);
}

JsonResult<JsonRpcRequest> JsonRpcRequest::from_json(Json payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::NotAnObject,
            payload.is_array() ? "batch requests are not supported"
                               : "request must be a JSON object"});
    }

    const bool has_version_field = payload.contains("jsonrpc");
    if (has_version_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing jsonrpc version field"});
    }

    const Json& version_node = payload.at("jsonrpc");
    const bool version_is_string = version_node.is_string();
    if ((version_is_string == false) || (version_node.get<std::string>() != kJsonRpcVersion)) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidVersion,
            "jsonrpc must equal \"2.0\""});
    }

    const bool has_method_field = payload.contains("method");
    if (has_method_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing method field"});
    }

    const Json& method_node = payload.at("method");
    const bool method_is_string = method_node.is_string();
    if (method_is_string == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidMethod,
            "method must be a string"});
    }

    std::optional<JsonRpcId> parsed_id;
    const bool has_id_field = payload.contains("id");
    if (has_id_field == true) {
        const Json& id_node = payload.at("id");
        if (id_node.is_null() == true) {
            parsed_id = JsonRpcId::null();
        } else {
            auto id_result = parse_id_field(id_node);
            if (id_result.has_value() == false) {
                return tl::unexpected(id_result.error());
            }
            parsed_id = std::move(*id_result);
        }
    }

    std::optional<Json> parsed_params;
    const bool has_params_field = payload.contains("params");
    if (has_params_field == true) {
        const Json& params_node = payload.at("params");
        const bool params_are_valid = is_valid_params_type(params_node);
        if (params_are_valid == false) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidParams,
                "params must be an object or array"});
        }
        parsed_params = params_node;
    }

    std::string method = method_node.get<std::string>();
    return JsonRpcRequest(
        std::move(method),
        std::move(parsed_id),
        std::move(parsed_params),
        std::move(payload));
}

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcError::to_json() const {
    Json payload;
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

Json make_result_response(const JsonRpcId& id, Json result) {
    Json response = Json::object();
    response["jsonrpc"] = std::string(kJsonRpcVersion);
    response["id"] = id.to_json();
    response["result"] = std::move(result);
    return response;
}

Json make_error_response(const JsonRpcId& id, const JsonRpcError& error) {
    Json response = Json::object();
    response["jsonrpc"] = std::string(kJsonRpcVersion);
    response["id"] = id.to_json();
    response["error"] = error.to_json();
    return response;
}

}  // namespace mcpshim
