#ifndef MCPSHIM_TESTS_MOCKS_MOCK_LINE_TRANSPORT_HPP
#define MCPSHIM_TESTS_MOCKS_MOCK_LINE_TRANSPORT_HPP

#include "mcpshim/async/async_transport.hpp"

#include <asio/redirect_error.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace mcpshim::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockLineTransport - scripted stdin, captured stdout
// ─────────────────────────────────────────────────────────────────────────────
// Hands out the scripted records in order, then reports end of stream. With
// hold_open() it instead waits for push_line() or stop(), like a client that
// keeps its pipe open. Must be used from the executor it was built with.

class MockLineTransport final : public async::IAsyncTransport {
public:
    explicit MockLineTransport(asio::any_io_executor executor)
        : executor_(std::move(executor))
        , idle_timer_(executor_)
    {}

    // ─────────────────────────────────────────────────────────────────────────
    // Test Setup
    // ─────────────────────────────────────────────────────────────────────────

    void add_line(std::string line) {
        input_.push_back(TransportResult<std::string>{std::move(line)});
    }

    void add_lines(const std::vector<std::string>& lines) {
        for (const auto& line : lines) {
            add_line(line);
        }
    }

    void add_read_error(TransportError::Category category, std::string message) {
        input_.push_back(tl::unexpected(TransportError{category, std::move(message)}));
    }

    // Adds a record while the session is running and wakes a pending read.
    void push_line(std::string line) {
        add_line(std::move(line));
        idle_timer_.cancel();
    }

    void hold_open(bool enabled = true) { hold_open_ = enabled; }
    void fail_start(bool enabled = true) { fail_start_ = enabled; }
    void fail_writes(bool enabled = true) { fail_writes_ = enabled; }

    // ─────────────────────────────────────────────────────────────────────────
    // Test Verification
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::vector<Json>& written() const noexcept { return output_; }
    [[nodiscard]] bool stopped() const noexcept { return stopped_; }
    [[nodiscard]] std::size_t failed_writes() const noexcept { return failed_writes_; }

    // ─────────────────────────────────────────────────────────────────────────
    // IAsyncTransport Implementation
    // ─────────────────────────────────────────────────────────────────────────

    asio::any_io_executor get_executor() override { return executor_; }

    asio::awaitable<TransportResult<void>> async_start() override {
        if (fail_start_) {
            co_return tl::unexpected(TransportError{
                TransportError::Category::Network, "cannot open descriptors"});
        }
        running_ = true;
        co_return TransportResult<void>{};
    }

    void stop() override {
        stopped_ = true;
        running_ = false;
        idle_timer_.cancel();
    }

    asio::awaitable<TransportResult<void>> async_send(Json message) override {
        if (fail_writes_) {
            ++failed_writes_;
            co_return tl::unexpected(TransportError{
                TransportError::Category::Network, "broken pipe"});
        }
        output_.push_back(std::move(message));
        co_return TransportResult<void>{};
    }

    asio::awaitable<TransportResult<std::string>> async_receive() override {
        while (true) {
            if (running_ == false) {
                co_return tl::unexpected(TransportError{
                    TransportError::Category::Closed, "transport stopped"});
            }
            if (input_.empty() == false) {
                auto next = std::move(input_.front());
                input_.pop_front();
                co_return next;
            }
            if (hold_open_ == false) {
                co_return tl::unexpected(TransportError{
                    TransportError::Category::Closed, "end of stream"});
            }

            idle_timer_.expires_at(asio::steady_timer::time_point::max());
            asio::error_code ec;
            co_await idle_timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }
    }

    bool is_running() const override { return running_; }

private:
    asio::any_io_executor executor_;
    asio::steady_timer idle_timer_;

    std::deque<TransportResult<std::string>> input_;
    std::vector<Json> output_;

    bool running_{false};
    bool stopped_{false};
    bool hold_open_{false};
    bool fail_start_{false};
    bool fail_writes_{false};
    std::size_t failed_writes_{0};
};

}  // namespace mcpshim::testing

#endif  // MCPSHIM_TESTS_MOCKS_MOCK_LINE_TRANSPORT_HPP
