#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <tl/expected.hpp>

namespace mcpshim {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Error codes written back to the client
// ─────────────────────────────────────────────────────────────────────────────
// -32700..-32600 are reserved by JSON-RPC 2.0; -32000..-32099 is the
// implementation-defined server error range.

namespace error_code {
inline constexpr std::int64_t kParseError      = -32700;
inline constexpr std::int64_t kInvalidRequest  = -32600;
inline constexpr std::int64_t kMethodNotFound  = -32601;
inline constexpr std::int64_t kRequestFailed   = -32602;
inline constexpr std::int64_t kInternalError   = -32603;
inline constexpr std::int64_t kServerError     = -32000;
inline constexpr std::int64_t kConnectionError = -32001;
inline constexpr std::int64_t kAuthError       = -32003;
inline constexpr std::int64_t kAuthLimits      = -32004;
inline constexpr std::int64_t kRateLimited     = -32005;
}  // namespace error_code

inline constexpr std::string_view kNotificationPrefix{"notifications/"};

struct JsonError {
    enum class Code {
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidParams,
        InvalidMethod,
        NotAnObject
    };

    Code code{Code::NotAnObject};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────
// Echoed back untouched in the response. Null is a legal value: it is what a
// parse error response carries. Integers above INT64_MAX stay unsigned and
// fractional ids stay floating point so they serialize exactly as received.

struct JsonRpcId {
    std::variant<std::nullptr_t, std::int64_t, std::uint64_t, double, std::string> value{nullptr};

    static JsonRpcId null();
    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId unsigned_integer(std::uint64_t v);
    static JsonRpcId number(double v);
    static JsonRpcId string(std::string v);

    [[nodiscard]] bool is_null() const noexcept;
    [[nodiscard]] Json to_json() const;
    [[nodiscard]] std::string to_string() const;

    bool operator==(const JsonRpcId&) const = default;
};

// Best-effort id recovery from a payload that failed request validation.
[[nodiscard]] JsonRpcId extract_id(const Json& payload);

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────
// One inbound message. Keeps the original payload so forwarding sends exactly
// what the client wrote, including members this type does not model.

class JsonRpcRequest {
public:
    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const std::optional<JsonRpcId>& id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;
    [[nodiscard]] const Json& payload() const noexcept;

    // False when the id member is absent or null.
    [[nodiscard]] bool has_id() const noexcept;

    // `notifications/*` method: never answered, whatever the id.
    [[nodiscard]] bool is_notification_method() const noexcept;

    static JsonResult<JsonRpcRequest> from_json(Json payload);

private:
    JsonRpcRequest(std::string method,
                   std::optional<JsonRpcId> id,
                   std::optional<Json> params,
                   Json payload);

    std::string method_;
    std::optional<JsonRpcId> id_;
    std::optional<Json> params_;
    Json payload_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
};

[[nodiscard]] Json make_result_response(const JsonRpcId& id, Json result);
[[nodiscard]] Json make_error_response(const JsonRpcId& id, const JsonRpcError& error);

}  // namespace mcpshim
