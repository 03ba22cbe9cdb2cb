#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

#include "mcpshim/transport/stdio_transport.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

using json = nlohmann::json;
using namespace mcpshim;
using namespace std::chrono_literals;

// ─────────────────────────────────────────────────────────────────────────────
// Pipe fixture
// ─────────────────────────────────────────────────────────────────────────────
// stdin and stdout stand-ins backed by real POSIX pipes.

class PipePair {
public:
    PipePair() {
        REQUIRE(::pipe(input_) == 0);
        REQUIRE(::pipe(output_) == 0);
    }

    ~PipePair() {
        for (int fd : {input_[0], input_[1], output_[0], output_[1]}) {
            if (fd >= 0) {
                ::close(fd);
            }
        }
    }

    PipePair(const PipePair&) = delete;
    PipePair& operator=(const PipePair&) = delete;

    StdioTransportConfig config(std::size_t max_line = 4 << 20) const {
        StdioTransportConfig cfg;
        cfg.input_fd = input_[0];
        cfg.output_fd = output_[1];
        cfg.max_line_length = max_line;
        return cfg;
    }

    void feed(const std::string& data) {
        REQUIRE(::write(input_[1], data.data(), data.size()) == static_cast<ssize_t>(data.size()));
    }

    void close_input() {
        ::close(input_[1]);
        input_[1] = -1;
    }

    // Everything written so far, without blocking.
    std::string drain_output() {
        const int flags = ::fcntl(output_[0], F_GETFL);
        ::fcntl(output_[0], F_SETFL, flags | O_NONBLOCK);
        std::string out;
        char buf[4096];
        while (true) {
            const ssize_t n = ::read(output_[0], buf, sizeof(buf));
            if (n <= 0) {
                break;
            }
            out.append(buf, static_cast<std::size_t>(n));
        }
        return out;
    }

private:
    int input_[2]{-1, -1};
    int output_[2]{-1, -1};
};

namespace {

// Reads records until the transport reports anything but a record.
std::vector<TransportResult<std::string>> read_all(asio::io_context& io, StdioTransport& transport) {
    std::vector<TransportResult<std::string>> results;
    asio::co_spawn(io, [&]() -> asio::awaitable<void> {
        auto started = co_await transport.async_start();
        REQUIRE(started.has_value());
        while (true) {
            auto next = co_await transport.async_receive();
            const bool done = !next && (next.error().category == TransportError::Category::Closed);
            results.push_back(std::move(next));
            if (done) {
                break;
            }
        }
    }, asio::detached);
    io.run();
    return results;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Input framing
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("StdioTransport splits newline-delimited records", "[stdio][transport]") {
    PipePair pipes;
    pipes.feed("{\"id\":1}\n{\"id\":2}\r\n\n{\"id\":3}");
    pipes.close_input();

    asio::io_context io;
    StdioTransport transport(io.get_executor(), pipes.config());
    auto results = read_all(io, transport);

    REQUIRE(results.size() == 5);
    REQUIRE(*results[0] == "{\"id\":1}");
    REQUIRE(*results[1] == "{\"id\":2}");
    REQUIRE(*results[2] == "");
    REQUIRE(*results[3] == "{\"id\":3}");
    REQUIRE(results[4].error().category == TransportError::Category::Closed);
}

TEST_CASE("StdioTransport reports oversized records and resynchronizes", "[stdio][transport]") {
    PipePair pipes;
    pipes.feed(std::string(64, 'x') + "\n{\"ok\":true}\n");
    pipes.close_input();

    asio::io_context io;
    StdioTransport transport(io.get_executor(), pipes.config(16));
    auto results = read_all(io, transport);

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].error().category == TransportError::Category::Protocol);
    REQUIRE(*results[1] == "{\"ok\":true}");
    REQUIRE(results[2].error().category == TransportError::Category::Closed);
}

TEST_CASE("StdioTransport handles records split across reads", "[stdio][transport]") {
    PipePair pipes;

    asio::io_context io;
    StdioTransport transport(io.get_executor(), pipes.config());

    std::vector<std::string> lines;
    asio::co_spawn(io, [&]() -> asio::awaitable<void> {
        co_await transport.async_start();
        while (true) {
            auto next = co_await transport.async_receive();
            if (!next) {
                break;
            }
            lines.push_back(*next);
        }
    }, asio::detached);

    asio::steady_timer timer(io);
    asio::co_spawn(io, [&]() -> asio::awaitable<void> {
        pipes.feed("{\"method\":\"to");
        timer.expires_after(20ms);
        co_await timer.async_wait(asio::use_awaitable);
        pipes.feed("ols/list\"}\n");
        pipes.close_input();
    }, asio::detached);

    io.run();

    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0] == "{\"method\":\"tools/list\"}");
}

// ─────────────────────────────────────────────────────────────────────────────
// Output and shutdown
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("StdioTransport writes one JSON document per line", "[stdio][transport]") {
    PipePair pipes;

    asio::io_context io;
    StdioTransport transport(io.get_executor(), pipes.config());

    asio::co_spawn(io, [&]() -> asio::awaitable<void> {
        co_await transport.async_start();
        auto first = co_await transport.async_send(json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", json::object()}});
        auto second = co_await transport.async_send(json{{"jsonrpc", "2.0"}, {"id", 2}, {"result", "line\nbreak"}});
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        transport.stop();
    }, asio::detached);
    io.run();

    const std::string out = pipes.drain_output();
    const auto newline = out.find('\n');
    REQUIRE(newline != std::string::npos);
    REQUIRE(json::parse(out.substr(0, newline))["id"] == 1);
    REQUIRE(json::parse(out.substr(newline + 1))["result"] == "line\nbreak");
    REQUIRE(out.back() == '\n');
}

TEST_CASE("StdioTransport stop() ends a pending read", "[stdio][transport]") {
    PipePair pipes;

    asio::io_context io;
    StdioTransport transport(io.get_executor(), pipes.config());

    std::optional<TransportResult<std::string>> received;
    asio::co_spawn(io, [&]() -> asio::awaitable<void> {
        co_await transport.async_start();
        received = co_await transport.async_receive();
    }, asio::detached);

    asio::steady_timer timer(io);
    timer.expires_after(20ms);
    timer.async_wait([&](const asio::error_code&) {
        transport.stop();
    });

    io.run();

    REQUIRE(received.has_value());
    REQUIRE_FALSE(received->has_value());
    REQUIRE(received->error().category == TransportError::Category::Closed);
    REQUIRE_FALSE(transport.is_running());
}

TEST_CASE("StdioTransport keeps writing after input stops", "[stdio][transport]") {
    PipePair pipes;

    asio::io_context io;
    StdioTransport transport(io.get_executor(), pipes.config());

    asio::co_spawn(io, [&]() -> asio::awaitable<void> {
        co_await transport.async_start();
        transport.stop();
        auto sent = co_await transport.async_send(json{{"jsonrpc", "2.0"}, {"id", 9}, {"result", 1}});
        REQUIRE(sent.has_value());
    }, asio::detached);
    io.run();

    REQUIRE(json::parse(pipes.drain_output())["id"] == 9);
}
