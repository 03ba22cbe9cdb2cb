#ifndef MCPSHIM_RELAY_LIFECYCLE_HPP
#define MCPSHIM_RELAY_LIFECYCLE_HPP

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════
// Running → Draining → Stopped, driven from the session's io thread.
//
//   Running   input is read and dispatched; heartbeats in debug mode
//   Draining  input ended or a signal arrived; no new lines, in-flight
//             forwarded calls finish or fail on their own
//   Stopped   nothing in flight; timer and signal handlers released
//
// Every unit of asynchronous work (the read loop and each forwarded call)
// registers with task_started()/task_finished(); Stopped is entered when the
// session is draining and the count reaches zero. All members must be called
// on the executor passed at construction.

#include "mcpshim/relay/session_config.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mcpshim {

enum class LifecycleState {
    Running,
    Draining,
    Stopped
};

[[nodiscard]] constexpr std::string_view to_string(LifecycleState state) noexcept {
    switch (state) {
        case LifecycleState::Running:  return "Running";
        case LifecycleState::Draining: return "Draining";
        case LifecycleState::Stopped:  return "Stopped";
    }
    return "Unknown";
}

class Lifecycle {
public:
    using Handler = std::function<void()>;

    Lifecycle(asio::any_io_executor executor, const SessionConfig& config);

    Lifecycle(const Lifecycle&) = delete;
    Lifecycle& operator=(const Lifecycle&) = delete;

    /// Arms the heartbeat (debug only) and the SIGINT/SIGTERM handlers.
    void start();

    /// Called once when Draining is entered, e.g. to stop reading input.
    void on_drain(Handler handler) { on_drain_ = std::move(handler); }

    /// Called once when Stopped is entered.
    void on_stop(Handler handler) { on_stop_ = std::move(handler); }

    /// Running → Draining. Later calls are ignored.
    void begin_drain(std::string_view reason);

    void task_started() noexcept { ++in_flight_; }
    void task_finished();

    [[nodiscard]] LifecycleState state() const noexcept { return state_; }
    [[nodiscard]] bool accepting() const noexcept { return state_ == LifecycleState::Running; }
    [[nodiscard]] std::size_t in_flight() const noexcept { return in_flight_; }
    [[nodiscard]] std::size_t heartbeats() const noexcept { return heartbeats_; }
    [[nodiscard]] const std::string& drain_reason() const noexcept { return drain_reason_; }

private:
    asio::awaitable<void> heartbeat_loop();
    void arm_signals();
    void maybe_stop();

    asio::any_io_executor executor_;
    bool debug_;
    std::chrono::milliseconds heartbeat_interval_;
    bool handle_signals_;

    asio::steady_timer heartbeat_timer_;
    std::optional<asio::signal_set> signals_;

    LifecycleState state_{LifecycleState::Running};
    std::size_t in_flight_{0};
    std::size_t heartbeats_{0};
    std::string drain_reason_;
    bool started_{false};

    Handler on_drain_;
    Handler on_stop_;
};

}  // namespace mcpshim

#endif  // MCPSHIM_RELAY_LIFECYCLE_HPP
