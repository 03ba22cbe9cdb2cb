#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Async Line Transport Interface
// ═══════════════════════════════════════════════════════════════════════════
// The client-facing side of the bridge: one newline-delimited record in, one
// JSON document out. Records are handed over raw so the relay can answer a
// malformed line with a parse-error response instead of losing it.

#include "mcpshim/transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <memory>
#include <string>

namespace mcpshim::async {

class IAsyncTransport {
public:
    virtual ~IAsyncTransport() = default;

    [[nodiscard]] virtual asio::any_io_executor get_executor() = 0;

    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_start() = 0;

    /// Stop reading. A pending async_receive() completes with Category::Closed.
    virtual void stop() = 0;

    /// Write one JSON document followed by '\n'. Writes never interleave.
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_send(Json message) = 0;

    /// Next record without its line terminator. Category::Closed at end of stream.
    [[nodiscard]] virtual asio::awaitable<TransportResult<std::string>> async_receive() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;
};

}  // namespace mcpshim::async
