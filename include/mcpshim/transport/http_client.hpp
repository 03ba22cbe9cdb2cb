#pragma once

#include "mcpshim/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace mcpshim {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────
// Failures where no HTTP response was received at all. A response with any
// status code, including 4xx and 5xx, is a successful HttpClientResponse.

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        Cancelled,
        InvalidRequest,
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError cancelled() {
        return {Code::Cancelled, "Request cancelled"};
    }
    static HttpClientError invalid_request(const std::string& msg) {
        return {Code::InvalidRequest, msg};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

[[nodiscard]] constexpr std::string_view to_string(HttpClientError::Code code) noexcept {
    switch (code) {
        case HttpClientError::Code::ConnectionFailed: return "ConnectionFailed";
        case HttpClientError::Code::Timeout:          return "Timeout";
        case HttpClientError::Code::SslError:         return "SslError";
        case HttpClientError::Code::Cancelled:        return "Cancelled";
        case HttpClientError::Code::InvalidRequest:   return "InvalidRequest";
        case HttpClientError::Code::Unknown:          return "Unknown";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Response
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    std::string body;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// Blocking HTTP calls. The forwarder runs each call on its own worker thread,
// so implementations must accept concurrent get()/post() calls once
// configured. Configuration setters are not synchronized and must only be
// called before the first request.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Scheme, host and optional port, e.g. "https://api.easymcp.net"
    virtual void set_base_url(const std::string& url) = 0;

    // Sent with every request; per-call headers win on conflict.
    virtual void set_default_headers(const HeaderMap& headers) = 0;

    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    // Total time allowed for one request/response exchange.
    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_verify_ssl(bool verify) = 0;

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> get(
        const std::string& path,
        const HeaderMap& headers = {}
    ) = 0;

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers = {}
    ) = 0;

    // Refuse new requests. Requests already on the wire run to completion.
    virtual void cancel() = 0;
};

// Default implementation (cpr / libcurl).
std::unique_ptr<IHttpClient> make_http_client();

}  // namespace mcpshim
