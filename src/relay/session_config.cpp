#include "mcpshim/relay/session_config.hpp"

#include <algorithm>
#include <cctype>

namespace mcpshim {

namespace {

constexpr std::string_view kDevBaseUrl{"http://localhost:3000"};
constexpr std::string_view kProdBaseUrl{"https://api.easymcp.net"};

std::string lowercase(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

}  // namespace

std::string_view base_url_for(Environment env) noexcept {
    switch (env) {
        case Environment::Dev:  return kDevBaseUrl;
        case Environment::Prod: return kProdBaseUrl;
    }
    return kProdBaseUrl;
}

std::optional<Environment> parse_environment(std::string_view name) {
    const std::string lower = lowercase(name);
    if ((lower == "dev") || (lower == "development")) {
        return Environment::Dev;
    }
    if ((lower == "prod") || (lower == "production")) {
        return Environment::Prod;
    }
    return std::nullopt;
}

std::string mask_token(std::string_view token) {
    constexpr std::size_t kVisible = 3;
    std::string masked(token.substr(0, std::min(kVisible, token.size())));
    if (token.size() > kVisible) {
        masked.append(token.size() - kVisible, '*');
    }
    return masked;
}

SessionConfig SessionConfig::for_environment(Environment env, std::string token) {
    SessionConfig config;
    config.server_url = std::string(base_url_for(env));
    config.token = std::move(token);
    return config;
}

SessionConfig& SessionConfig::with_server_url(std::string url) {
    server_url = std::move(url);
    return *this;
}

SessionConfig& SessionConfig::with_debug(bool enabled) {
    debug = enabled;
    return *this;
}

SessionConfig& SessionConfig::with_request_timeout(std::chrono::milliseconds timeout) {
    request_timeout = timeout;
    return *this;
}

SessionConfig& SessionConfig::with_verify_tls(bool verify) {
    verify_tls = verify;
    return *this;
}

SessionConfig& SessionConfig::with_signal_handling(bool enabled) {
    handle_signals = enabled;
    return *this;
}

UrlComponents SessionConfig::server() const {
    auto parsed = parse_url(server_url);
    if (parsed.has_value() == false) {
        throw ConfigError("Invalid server URL: '" + server_url + "' (expected http:// or https://)");
    }
    return *parsed;
}

void SessionConfig::validate() const {
    const bool token_blank = std::all_of(token.begin(), token.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
    if (token_blank) {
        throw ConfigError("Authentication token is required");
    }

    // Header injection guard: the token goes verbatim into a header line.
    const bool token_has_control = std::any_of(token.begin(), token.end(),
        [](unsigned char c) { return (c < 0x20) || (c == 0x7F); });
    if (token_has_control) {
        throw ConfigError("Authentication token contains control characters");
    }

    (void)server();

    if (endpoint_path.empty()) {
        throw ConfigError("Endpoint path must not be empty");
    }

    const auto zero = std::chrono::milliseconds::zero();
    if (request_timeout <= zero) {
        throw ConfigError("Request timeout must be positive");
    }
    if (connect_timeout <= zero) {
        throw ConfigError("Connect timeout must be positive");
    }
    if (probe_timeout <= zero) {
        throw ConfigError("Probe timeout must be positive");
    }
    if (debug && (heartbeat_interval <= zero)) {
        throw ConfigError("Heartbeat interval must be positive");
    }
}

}  // namespace mcpshim
