#ifndef MCPSHIM_RELAY_FORWARD_ERROR_HPP
#define MCPSHIM_RELAY_FORWARD_ERROR_HPP

#include "mcpshim/transport/http_client.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <optional>
#include <string>

namespace mcpshim {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// ForwardFailure
// ─────────────────────────────────────────────────────────────────────────────
// Everything that can go wrong with one forwarded request, as raw facts.
// Turning these into a JSON-RPC error is the classifier's job.

struct ForwardFailure {
    enum class Kind {
        NoResponse,  // Never got an HTTP response (refused, DNS, TLS, timeout)
        HttpStatus,  // Got a non-2xx response
        Malformed    // Got a 2xx response we could not use, or the call itself was invalid
    };

    Kind kind{Kind::Malformed};
    std::string message;
    std::optional<int> http_status;
    std::string body;
    std::optional<HttpClientError::Code> transport_code;

    static ForwardFailure no_response(const HttpClientError& err) {
        return {Kind::NoResponse, err.message, std::nullopt, {}, err.code};
    }

    static ForwardFailure http_error(int status, std::string response_body) {
        return {
            Kind::HttpStatus,
            "HTTP " + std::to_string(status),
            status,
            std::move(response_body),
            std::nullopt
        };
    }

    static ForwardFailure malformed(std::string msg) {
        return {Kind::Malformed, std::move(msg), std::nullopt, {}, std::nullopt};
    }
};

// The remote JSON-RPC response, parsed but otherwise untouched.
using ForwardResult = tl::expected<Json, ForwardFailure>;

}  // namespace mcpshim

#endif  // MCPSHIM_RELAY_FORWARD_ERROR_HPP
