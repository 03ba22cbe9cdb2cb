#pragma once

// Platform check
#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "StdioTransport is only available on POSIX-compatible systems"
#endif

#include "mcpshim/async/async_transport.hpp"

#include <asio/posix/stream_descriptor.hpp>

#include <atomic>
#include <memory>
#include <string>

#include <unistd.h>

namespace mcpshim {

struct StdioTransportConfig {
    int input_fd{STDIN_FILENO};
    int output_fd{STDOUT_FILENO};

    /// Longer records are reported as Category::Protocol and skipped.
    std::size_t max_line_length{4 << 20};  // 4 MiB

    /// Duplicate the descriptors so closing the transport never closes fd 0/1.
    bool duplicate_descriptors{true};
};

// ─────────────────────────────────────────────────────────────────────────────
// StdioTransport
// ─────────────────────────────────────────────────────────────────────────────
// Newline-delimited JSON over two POSIX descriptors, driven by asio so a read
// can be cancelled on shutdown instead of blocking a thread in getline().
//
// All members must be used from the executor passed at construction.

class StdioTransport final : public async::IAsyncTransport {
public:
    StdioTransport(asio::any_io_executor executor, StdioTransportConfig config = {});
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    void stop() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(Json message) override;
    [[nodiscard]] asio::awaitable<TransportResult<std::string>> async_receive() override;
    [[nodiscard]] bool is_running() const override;

    [[nodiscard]] const StdioTransportConfig& config() const noexcept;

private:
    TransportResult<std::string> take_line();

    StdioTransportConfig config_;
    asio::any_io_executor executor_;

    std::unique_ptr<asio::posix::stream_descriptor> input_;
    std::unique_ptr<asio::posix::stream_descriptor> output_;

    // Bytes read past the last returned newline.
    std::string read_buffer_;
    bool input_eof_{false};

    // Set after an oversized record; input is dropped up to the next newline.
    bool discarding_{false};

    std::atomic<bool> running_{false};
};

}  // namespace mcpshim
