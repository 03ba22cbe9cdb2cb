#ifndef MCPSHIM_RELAY_SESSION_CONFIG_HPP
#define MCPSHIM_RELAY_SESSION_CONFIG_HPP

#include "mcpshim/transport/http_types.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mcpshim {

// ─────────────────────────────────────────────────────────────────────────────
// ConfigError
// ─────────────────────────────────────────────────────────────────────────────
// The only failure that leaves the core as an exception: the session cannot be
// built, so there is nothing to answer requests with.

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ─────────────────────────────────────────────────────────────────────────────
// Environment table
// ─────────────────────────────────────────────────────────────────────────────

enum class Environment {
    Dev,
    Prod
};

[[nodiscard]] constexpr std::string_view to_string(Environment env) noexcept {
    switch (env) {
        case Environment::Dev:  return "dev";
        case Environment::Prod: return "prod";
    }
    return "unknown";
}

[[nodiscard]] std::string_view base_url_for(Environment env) noexcept;

// "dev" / "development" / "prod" / "production", case-insensitive.
[[nodiscard]] std::optional<Environment> parse_environment(std::string_view name);

// First three characters kept, every other character replaced by '*'.
[[nodiscard]] std::string mask_token(std::string_view token);

// ─────────────────────────────────────────────────────────────────────────────
// SessionConfig
// ─────────────────────────────────────────────────────────────────────────────
// Built by the CLI, validated once, then shared read-only by every component
// of the relay for the lifetime of the process.

struct SessionConfig {
    // Base URL of the hosted server; the endpoint path is appended to its path.
    std::string server_url{std::string(base_url_for(Environment::Prod))};

    // Sent as "Authorization: Bearer <token>". Required.
    std::string token;

    // Enables debug diagnostics, heartbeats and the startup connectivity probe.
    bool debug{false};

    std::string endpoint_path{"/json-rpc"};

    std::chrono::milliseconds request_timeout{30'000};
    std::chrono::milliseconds connect_timeout{10'000};
    std::chrono::milliseconds probe_timeout{5'000};
    std::chrono::milliseconds heartbeat_interval{30'000};

    bool verify_tls{true};

    // Install SIGINT/SIGTERM handlers that start a graceful drain.
    bool handle_signals{true};

    [[nodiscard]] static SessionConfig for_environment(Environment env, std::string token);

    SessionConfig& with_server_url(std::string url);
    SessionConfig& with_debug(bool enabled);
    SessionConfig& with_request_timeout(std::chrono::milliseconds timeout);
    SessionConfig& with_verify_tls(bool verify);
    SessionConfig& with_signal_handling(bool enabled);

    // Throws ConfigError naming the first problem found.
    void validate() const;

    // Parsed server_url. Throws ConfigError when it is not an http(s) URL.
    [[nodiscard]] UrlComponents server() const;
};

}  // namespace mcpshim

#endif  // MCPSHIM_RELAY_SESSION_CONFIG_HPP
