#include "mcpshim/relay/error_classifier.hpp"

#include "mcpshim/json/fast_json.hpp"
#include "mcpshim/protocol/mcp_types.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace mcpshim {

namespace {

std::string lowercase(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool mentions_any(std::string_view lowered, std::initializer_list<std::string_view> words) {
    return std::any_of(words.begin(), words.end(), [lowered](std::string_view w) {
        return lowered.find(w) != std::string_view::npos;
    });
}

bool is_auth_status(int status) noexcept {
    return (status == 401) || (status == 403);
}

ClassifiedError make(std::int64_t code, std::string message, ErrorKind kind,
                     const ForwardFailure& failure, bool silent = false) {
    ClassifiedError out;
    out.code = code;
    out.message = std::move(message);
    out.kind = kind;
    out.silent = silent;
    out.http_status = failure.http_status;
    out.detail = failure.body.empty() ? failure.message : failure.body;
    return out;
}

ClassifiedError classify_status(const ForwardFailure& failure) {
    const int status = failure.http_status.value_or(0);
    const UpstreamDetail upstream = parse_upstream_detail(failure.body);

    // Keyword checks fall back to the raw body when it carries no message.
    const std::string haystack = lowercase(upstream.message.value_or(failure.body));
    const std::string shown = upstream.message.value_or("");

    if (is_auth_status(status) && mentions_any(haystack, {"expired"})) {
        return make(error_code::kAuthError,
                    std::format("Authentication failed: {}", shown.empty() ? "Token expired" : shown),
                    ErrorKind::AuthExpired, failure);
    }

    if ((is_auth_status(status) || status == 429) && mentions_any(haystack, {"limit", "quota"})) {
        return make(error_code::kAuthLimits,
                    std::format("Usage limit reached: {}", shown.empty() ? "Quota exceeded" : shown),
                    ErrorKind::AuthLimits, failure);
    }

    if (is_auth_status(status)) {
        const bool recognized =
            (upstream.message.has_value()) &&
            mentions_any(haystack, {"invalid", "token", "unauthorized", "forbidden",
                                    "credential", "revoked", "denied"});
        return make(error_code::kAuthError,
                    std::format("Authentication failed: {}", shown.empty() ? "Invalid token" : shown),
                    recognized ? ErrorKind::AuthInvalid : ErrorKind::Auth, failure);
    }

    if (status == 429) {
        return make(error_code::kRateLimited,
                    "Rate limit exceeded. Please try again later.",
                    ErrorKind::Unknown, failure);
    }

    if (status >= 500) {
        return make(error_code::kServerError,
                    std::format("Server error ({}): {}", status,
                                shown.empty() ? "Internal server error" : shown),
                    ErrorKind::Server, failure);
    }

    if ((status == 404) || (upstream.rpc_code == error_code::kMethodNotFound)) {
        return make(error_code::kMethodNotFound, "Method not found",
                    ErrorKind::Unknown, failure, true);
    }

    return make(error_code::kRequestFailed,
                std::format("Error ({}): {}", status,
                            shown.empty() ? std::format("Request failed with status code {}", status)
                                          : shown),
                ErrorKind::Unknown, failure);
}

}  // namespace

std::string_view remediation(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Connection:
            return "Check your network connection and that the server is running.";
        case ErrorKind::AuthExpired:
            return "Your token has expired. Generate a new one and restart.";
        case ErrorKind::AuthInvalid:
            return "Your token was rejected. Check that it was copied correctly.";
        case ErrorKind::AuthLimits:
            return "Your account has reached its usage limits.";
        case ErrorKind::Auth:
            return "Authentication failed. Check your token.";
        case ErrorKind::Server:
            return "The server reported an internal error. Try again later.";
        case ErrorKind::Unknown:
            return "An unexpected error occurred.";
    }
    return "An unexpected error occurred.";
}

UpstreamDetail parse_upstream_detail(std::string_view body) {
    UpstreamDetail detail;
    if (body.empty()) {
        return detail;
    }

    auto parsed = fast_parse(body);
    if (!parsed || !parsed->is_object()) {
        return detail;
    }
    const Json& doc = *parsed;

    if (doc.contains("message") && doc["message"].is_string()) {
        detail.message = doc["message"].get<std::string>();
    }
    if (doc.contains("code") && doc["code"].is_number_integer()) {
        detail.rpc_code = doc["code"].get<std::int64_t>();
    }

    if (doc.contains("error")) {
        const Json& err = doc["error"];
        if (err.is_object()) {
            if (!detail.message && err.contains("message") && err["message"].is_string()) {
                detail.message = err["message"].get<std::string>();
            }
            if (err.contains("code") && err["code"].is_number_integer()) {
                detail.rpc_code = err["code"].get<std::int64_t>();
            }
        } else if (err.is_string() && !detail.message) {
            detail.message = err.get<std::string>();
        }
    }

    return detail;
}

ClassifiedError classify(const ForwardFailure& failure) {
    switch (failure.kind) {
        case ForwardFailure::Kind::NoResponse:
            return make(error_code::kConnectionError,
                        "Server unreachable. Check your network connection and that the server is running.",
                        ErrorKind::Connection, failure);

        case ForwardFailure::Kind::HttpStatus:
            return classify_status(failure);

        case ForwardFailure::Kind::Malformed:
            break;
    }

    return make(error_code::kInternalError,
                failure.message.empty() ? "Internal error" : failure.message,
                ErrorKind::Unknown, failure);
}

bool degrades_to_empty_tool_list(std::string_view method, const ClassifiedError& error) noexcept {
    if (method != TOOLS_LIST_METHOD) {
        return false;
    }
    const bool unavailable = (error.kind == ErrorKind::Connection) || (error.kind == ErrorKind::Server);
    const bool undecodable = (error.code == error_code::kInternalError);
    return unavailable || undecodable || error.silent;
}

}  // namespace mcpshim
