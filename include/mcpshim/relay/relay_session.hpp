#ifndef MCPSHIM_RELAY_RELAY_SESSION_HPP
#define MCPSHIM_RELAY_RELAY_SESSION_HPP

// ═══════════════════════════════════════════════════════════════════════════
// RelaySession
// ═══════════════════════════════════════════════════════════════════════════
// The bridge itself. Owns everything a running shim needs: the event loop,
// the stdio transport, the forwarder and its HTTP client, the lifecycle
// timers and signal handlers. Nothing is process-global.
//
// Usage:
//   auto config = SessionConfig::for_environment(Environment::Prod, token);
//   RelaySession session(std::move(config));   // throws ConfigError
//   return session.run();                      // returns when stdin closes
//
// Lines are read and dispatched strictly in arrival order. Local answers are
// written before the next line is read; forwarded requests run concurrently
// and their responses are written as they complete, so output order follows
// completion order. Every request with an id gets exactly one response line.

#include "mcpshim/async/async_transport.hpp"
#include "mcpshim/protocol/json_rpc.hpp"
#include "mcpshim/relay/connectivity_probe.hpp"
#include "mcpshim/relay/error_classifier.hpp"
#include "mcpshim/relay/forwarder.hpp"
#include "mcpshim/relay/lifecycle.hpp"
#include "mcpshim/relay/local_handler.hpp"
#include "mcpshim/relay/session_config.hpp"
#include "mcpshim/transport/http_client.hpp"

#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace mcpshim {

struct RelayStats {
    std::size_t lines_read{0};
    std::size_t answered_locally{0};
    std::size_t forwarded{0};
    std::size_t failed{0};
    std::size_t degraded{0};
    std::size_t responses_written{0};
};

class RelaySession {
public:
    using TransportFactory =
        std::function<std::unique_ptr<async::IAsyncTransport>(asio::any_io_executor)>;

    /// stdin/stdout and the libcurl client. Adds a connectivity probe in debug mode.
    explicit RelaySession(SessionConfig config);

    /// Injected transport and HTTP clients. The probe runs only in debug mode
    /// and only when a probe client is supplied.
    RelaySession(SessionConfig config,
                 TransportFactory make_transport,
                 std::unique_ptr<IHttpClient> http_client,
                 std::unique_ptr<IHttpClient> probe_client = nullptr);

    ~RelaySession();

    RelaySession(const RelaySession&) = delete;
    RelaySession& operator=(const RelaySession&) = delete;

    /// Runs until Stopped. Returns the process exit status. Call once.
    int run();

    /// Starts a graceful drain. Safe to call from any thread.
    void request_shutdown();

    [[nodiscard]] const SessionConfig& config() const noexcept { return config_; }
    [[nodiscard]] LifecycleState state() const noexcept { return lifecycle_.state(); }
    [[nodiscard]] const RelayStats& stats() const noexcept { return stats_; }
    [[nodiscard]] const Lifecycle& lifecycle() const noexcept { return lifecycle_; }

private:
    asio::awaitable<void> relay_loop();
    asio::awaitable<void> handle_line(std::string line);
    asio::awaitable<void> forward_request(JsonRpcRequest request);
    asio::awaitable<void> write_response(Json response);

    void spawn_forward(JsonRpcRequest request);
    void report_failure(const std::string& method, const ClassifiedError& error) const;

    SessionConfig config_;

    // Declared first so it outlives everything that posts to it.
    asio::io_context io_;

    std::unique_ptr<async::IAsyncTransport> transport_;
    Forwarder forwarder_;
    std::unique_ptr<ConnectivityProbe> probe_;
    LocalHandler local_;
    Lifecycle lifecycle_;

    RelayStats stats_;
    int exit_code_{0};
};

}  // namespace mcpshim

#endif  // MCPSHIM_RELAY_RELAY_SESSION_HPP
