#ifndef MCPSHIM_RELAY_FORWARDER_HPP
#define MCPSHIM_RELAY_FORWARDER_HPP

// ═══════════════════════════════════════════════════════════════════════════
// Forwarder
// ═══════════════════════════════════════════════════════════════════════════
// Sends one JSON-RPC message to the hosted server as an HTTP POST and hands
// back the server's JSON-RPC response, or the raw facts of what went wrong.
//
// Usage:
//   Forwarder forwarder(config, make_http_client());
//   auto result = co_await forwarder.async_forward(request.payload());
//   if (!result) {
//       auto error = classify(result.error());
//   }
//
// Every call runs the blocking HTTP exchange on its own worker thread, so
// there is no bound on concurrent outbound calls and a slow call never holds
// up the one reading stdin. The result is delivered back on the awaiting
// coroutine's executor.

#include "mcpshim/relay/forward_error.hpp"
#include "mcpshim/relay/session_config.hpp"
#include "mcpshim/transport/http_client.hpp"

#include <asio/awaitable.hpp>

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace mcpshim {

class Forwarder {
public:
    // Configures the client from the session: origin, bearer token, timeouts
    // and TLS verification. Throws ConfigError for an unusable server URL.
    Forwarder(const SessionConfig& config, std::unique_ptr<IHttpClient> client);

    // Refuses new calls and waits for worker threads still on the wire.
    ~Forwarder();

    Forwarder(const Forwarder&) = delete;
    Forwarder& operator=(const Forwarder&) = delete;

    /// Blocking exchange on the calling thread. Exceptions raised while
    /// sending or decoding come back as Malformed failures.
    [[nodiscard]] ForwardResult forward(const Json& message);

    /// Same exchange on a worker thread; resumes on the caller's executor.
    asio::awaitable<ForwardResult> async_forward(Json message);

    /// Refuse calls not yet on the wire.
    void cancel();

    [[nodiscard]] std::size_t active_workers() const;

    [[nodiscard]] const std::string& endpoint() const noexcept { return endpoint_; }

private:
    // Holds one worker slot for the lifetime of a worker thread.
    class WorkerSlot {
    public:
        explicit WorkerSlot(Forwarder& owner) : owner_(owner) {}
        ~WorkerSlot() { owner_.finish_worker(); }

        WorkerSlot(const WorkerSlot&) = delete;
        WorkerSlot& operator=(const WorkerSlot&) = delete;

    private:
        Forwarder& owner_;
    };

    ForwardResult exchange(const Json& message);

    void begin_worker();
    void finish_worker();

    std::unique_ptr<IHttpClient> client_;
    std::string endpoint_;

    mutable std::mutex workers_mutex_;
    std::condition_variable workers_idle_;
    std::size_t active_workers_{0};
};

}  // namespace mcpshim

#endif  // MCPSHIM_RELAY_FORWARDER_HPP
