#include "mcpshim/relay/lifecycle.hpp"

#include "mcpshim/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

#include <csignal>
#include <format>

namespace mcpshim {

Lifecycle::Lifecycle(asio::any_io_executor executor, const SessionConfig& config)
    : executor_(std::move(executor))
    , debug_(config.debug)
    , heartbeat_interval_(config.heartbeat_interval)
    , handle_signals_(config.handle_signals)
    , heartbeat_timer_(executor_)
{}

void Lifecycle::start() {
    if (started_) {
        return;
    }
    started_ = true;

    if (handle_signals_) {
        arm_signals();
    }
    if (debug_) {
        asio::co_spawn(executor_, heartbeat_loop(), asio::detached);
    }
}

void Lifecycle::begin_drain(std::string_view reason) {
    if (state_ != LifecycleState::Running) {
        return;
    }
    state_ = LifecycleState::Draining;
    drain_reason_ = std::string(reason);
    MCPSHIM_LOG_DEBUG(std::format("Draining ({}), {} task(s) in flight", drain_reason_, in_flight_));

    if (on_drain_) {
        on_drain_();
    }
    maybe_stop();
}

void Lifecycle::task_finished() {
    if (in_flight_ > 0) {
        --in_flight_;
    }
    maybe_stop();
}

void Lifecycle::maybe_stop() {
    if ((state_ != LifecycleState::Draining) || (in_flight_ > 0)) {
        return;
    }
    state_ = LifecycleState::Stopped;

    heartbeat_timer_.cancel();
    if (signals_) {
        asio::error_code ignored;
        signals_->cancel(ignored);
        signals_->clear(ignored);
    }

    MCPSHIM_LOG_DEBUG("Stopped");
    if (on_stop_) {
        on_stop_();
    }
}

void Lifecycle::arm_signals() {
    signals_.emplace(executor_, SIGINT, SIGTERM);
    signals_->async_wait([this](const asio::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        MCPSHIM_LOG_INFO(std::format("Received signal {}, shutting down", signal_number));
        begin_drain(signal_number == SIGINT ? "interrupt" : "terminate");
    });
}

asio::awaitable<void> Lifecycle::heartbeat_loop() {
    while (state_ != LifecycleState::Stopped) {
        heartbeat_timer_.expires_after(heartbeat_interval_);

        asio::error_code ec;
        co_await heartbeat_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec || (state_ == LifecycleState::Stopped)) {
            co_return;
        }

        ++heartbeats_;
        MCPSHIM_LOG_DEBUG(std::format("Heartbeat: {}, {} task(s) in flight",
                                      to_string(state_), in_flight_));
    }
}

}  // namespace mcpshim
