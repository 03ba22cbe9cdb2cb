#ifndef MCPSHIM_RELAY_ERROR_CLASSIFIER_HPP
#define MCPSHIM_RELAY_ERROR_CLASSIFIER_HPP

#include "mcpshim/protocol/json_rpc.hpp"
#include "mcpshim/relay/forward_error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcpshim {

// ─────────────────────────────────────────────────────────────────────────────
// ErrorKind
// ─────────────────────────────────────────────────────────────────────────────
// Selects the remediation text shown to a person. The JSON-RPC code is chosen
// independently and never derived from the kind.

enum class ErrorKind {
    Connection,
    AuthExpired,
    AuthInvalid,
    AuthLimits,
    Auth,
    Server,
    Unknown
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Connection:  return "Connection";
        case ErrorKind::AuthExpired: return "AuthExpired";
        case ErrorKind::AuthInvalid: return "AuthInvalid";
        case ErrorKind::AuthLimits:  return "AuthLimits";
        case ErrorKind::Auth:        return "Auth";
        case ErrorKind::Server:      return "Server";
        case ErrorKind::Unknown:     return "Unknown";
    }
    return "Unknown";
}

// Credential or quota problems. These are never papered over.
[[nodiscard]] constexpr bool is_auth_kind(ErrorKind kind) noexcept {
    return (kind == ErrorKind::AuthExpired) ||
           (kind == ErrorKind::AuthInvalid) ||
           (kind == ErrorKind::AuthLimits) ||
           (kind == ErrorKind::Auth);
}

// What a person should do about it.
[[nodiscard]] std::string_view remediation(ErrorKind kind) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Upstream error payloads
// ─────────────────────────────────────────────────────────────────────────────
// Servers answer failures with either {"message": ...} or a JSON-RPC style
// {"error": {"code": ..., "message": ...}}. Anything else yields nothing.

struct UpstreamDetail {
    std::optional<std::string> message;
    std::optional<std::int64_t> rpc_code;
};

[[nodiscard]] UpstreamDetail parse_upstream_detail(std::string_view body);

// ─────────────────────────────────────────────────────────────────────────────
// ClassifiedError
// ─────────────────────────────────────────────────────────────────────────────

struct ClassifiedError {
    std::int64_t code{error_code::kInternalError};
    std::string message;
    ErrorKind kind{ErrorKind::Unknown};

    // Expected condition (method not found). Must not produce a diagnostic.
    bool silent{false};

    std::optional<int> http_status;

    // Raw upstream text (response body or transport message) for diagnostics.
    std::string detail;

    [[nodiscard]] JsonRpcError to_rpc_error() const {
        return JsonRpcError{code, message, std::nullopt};
    }
};

/// Maps a forwarding failure to the error written back to the client.
/// Rules are checked in order; the first match wins:
///   1. no response                          → Connection,  -32001
///   2. 401/403 + "expired"                  → AuthExpired, -32003
///   3. 401/403/429 + "limit"/"quota"        → AuthLimits,  -32004
///   4. 401/403                              → AuthInvalid or Auth, -32003
///   5. 429                                  → rate limited, -32005
///   6. >= 500                               → Server,      -32000
///   7. 404 or upstream code -32601          → method not found, -32601, silent
///   8. other status                         → request failed, -32602
///   9. unusable 2xx response / local fault  → internal,    -32603
[[nodiscard]] ClassifiedError classify(const ForwardFailure& failure);

/// `tools/list` answers an empty tool list instead of an error when the server
/// is unreachable, failing (5xx), unintelligible or lacks the method. Auth,
/// rate-limit and rejected-request failures stay errors.
[[nodiscard]] bool degrades_to_empty_tool_list(std::string_view method,
                                               const ClassifiedError& error) noexcept;

}  // namespace mcpshim

#endif  // MCPSHIM_RELAY_ERROR_CLASSIFIER_HPP
