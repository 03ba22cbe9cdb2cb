// ─────────────────────────────────────────────────────────────────────────────
// mcpshim - stdio to HTTP bridge for hosted MCP servers
// ─────────────────────────────────────────────────────────────────────────────
// Launched by an MCP host as a local stdio server. Reads JSON-RPC 2.0 from
// stdin, answers the handshake itself and forwards everything else to the
// hosted server's /json-rpc endpoint.
//
// Usage:
//   mcpshim --token <token>
//   mcpshim --token <token> --env dev --debug
//   MCPSHIM_TOKEN=<token> mcpshim --server https://mcp.example.com
//
// stdout carries only JSON-RPC responses. Everything else goes to stderr.

#include <cxxopts.hpp>

#include "mcpshim/log/spdlog_logger.hpp"
#include "mcpshim/relay/local_handler.hpp"
#include "mcpshim/relay/relay_session.hpp"
#include "mcpshim/relay/session_config.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

using namespace mcpshim;

namespace {

constexpr const char* kTokenEnvVar = "MCPSHIM_TOKEN";

void print_error(const std::string& msg) {
    std::cerr << "mcpshim: " << msg << "\n";
}

std::string get_env(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

SessionConfig build_config(const cxxopts::ParseResult& result) {
    const std::string env_name = result["env"].as<std::string>();
    const auto env = parse_environment(env_name);
    if (!env) {
        throw ConfigError("Unknown environment '" + env_name + "' (expected dev or prod)");
    }

    std::string token = result.count("token")
        ? result["token"].as<std::string>()
        : get_env(kTokenEnvVar);
    if (token.empty()) {
        throw ConfigError(std::string("Token is required (--token or ") + kTokenEnvVar + ")");
    }

    auto config = SessionConfig::for_environment(*env, std::move(token));
    if (result.count("server")) {
        config.with_server_url(result["server"].as<std::string>());
    }

    const int timeout_seconds = result["timeout"].as<int>();
    if (timeout_seconds <= 0) {
        throw ConfigError("--timeout must be a positive number of seconds");
    }

    config.with_debug(result.count("debug") > 0)
          .with_request_timeout(std::chrono::seconds(timeout_seconds))
          .with_verify_tls(result.count("insecure") == 0);

    config.validate();
    return config;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcpshim", "Bridge a stdio MCP client to a hosted MCP server");

    options.add_options()
        ("t,token", "Access token (or use MCPSHIM_TOKEN env var)", cxxopts::value<std::string>())
        ("e,env", "Environment: dev or prod", cxxopts::value<std::string>()->default_value("prod"))
        ("s,server", "Server base URL (overrides --env)", cxxopts::value<std::string>())
        ("timeout", "Per-request timeout in seconds", cxxopts::value<int>()->default_value("30"))
        ("d,debug", "Enable debug diagnostics on stderr")
        ("log-file", "Also write diagnostics to this file", cxxopts::value<std::string>())
        ("insecure", "Do not verify TLS certificates")
        ("version", "Print version")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }
        if (result.count("version")) {
            std::cout << SHIM_NAME << " " << SHIM_VERSION << "\n";
            return 0;
        }

        const SessionConfig config = build_config(result);

        const std::optional<std::string> log_file = result.count("log-file")
            ? std::optional<std::string>(result["log-file"].as<std::string>())
            : std::nullopt;
        set_logger(make_diagnostics_logger(config.debug ? LogLevel::Debug : LogLevel::Warn, log_file));

        // A host that closes our stdout must not kill us mid-drain.
        std::signal(SIGPIPE, SIG_IGN);

        std::cerr << SHIM_NAME << " " << SHIM_VERSION
                  << " -> " << config.server_url
                  << " (token " << mask_token(config.token) << ")"
                  << (config.debug ? " [debug]" : "") << "\n";

        int exit_code = 0;
        {
            // Destroyed before the logger goes: the session joins its threads.
            RelaySession session(config);
            exit_code = session.run();
        }

        get_logger().info("Shutdown complete");
        set_logger(nullptr);
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const ConfigError& e) {
        print_error(e.what());
        return 1;
    } catch (const std::exception& e) {
        print_error(std::string("fatal: ") + e.what());
        return 1;
    }
}
