#include "mcpshim/transport/stdio_transport.hpp"
#include "mcpshim/log/logger.hpp"

#include <asio/buffer.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace mcpshim {

namespace {

TransportError make_error(TransportError::Category cat, std::string msg) {
    return TransportError{cat, std::move(msg)};
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

StdioTransport::StdioTransport(asio::any_io_executor executor, StdioTransportConfig config)
    : config_(config)
    , executor_(std::move(executor))
{
    read_buffer_.reserve(4096);
}

StdioTransport::~StdioTransport() {
    stop();
    if (output_ && output_->is_open()) {
        asio::error_code ec;
        output_->close(ec);
    }
}

asio::any_io_executor StdioTransport::get_executor() {
    return executor_;
}

const StdioTransportConfig& StdioTransport::config() const noexcept {
    return config_;
}

bool StdioTransport::is_running() const {
    return running_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<TransportResult<void>> StdioTransport::async_start() {
    if (running_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "Transport already running"));
    }

    int input_fd = config_.input_fd;
    int output_fd = config_.output_fd;
    if (config_.duplicate_descriptors) {
        input_fd = ::dup(config_.input_fd);
        if (input_fd < 0) {
            co_return tl::unexpected(make_error(
                TransportError::Category::Network,
                std::string("dup(input) failed: ") + std::strerror(errno)));
        }
        output_fd = ::dup(config_.output_fd);
        if (output_fd < 0) {
            const int saved_errno = errno;
            ::close(input_fd);
            co_return tl::unexpected(make_error(
                TransportError::Category::Network,
                std::string("dup(output) failed: ") + std::strerror(saved_errno)));
        }
    }

    input_ = std::make_unique<asio::posix::stream_descriptor>(executor_, input_fd);
    output_ = std::make_unique<asio::posix::stream_descriptor>(executor_, output_fd);
    input_eof_ = false;
    discarding_ = false;
    read_buffer_.clear();

    running_ = true;
    MCPSHIM_LOG_DEBUG("StdioTransport started");
    co_return TransportResult<void>{};
}

void StdioTransport::stop() {
    if (running_.exchange(false) == false) {
        return;
    }

    // Closing the input cancels a pending read. The output stays open so
    // responses for requests already in flight can still be delivered.
    if (input_ && input_->is_open()) {
        asio::error_code ec;
        input_->close(ec);
    }
    MCPSHIM_LOG_DEBUG("StdioTransport input closed");
}

// ═══════════════════════════════════════════════════════════════════════════
// Output
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<TransportResult<void>> StdioTransport::async_send(Json message) {
    if ((output_ == nullptr) || (output_->is_open() == false)) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Closed,
            "output is not open"));
    }

    std::string data = message.dump(-1, ' ', false, Json::error_handler_t::replace);
    data.push_back('\n');

    // One synchronous write per record: the relay runs on a single thread, so
    // records can never interleave on the descriptor.
    asio::error_code ec;
    asio::write(*output_, asio::buffer(data), ec);
    if (ec) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "write failed: " + ec.message()));
    }

    co_return TransportResult<void>{};
}

// ═══════════════════════════════════════════════════════════════════════════
// Input
// ═══════════════════════════════════════════════════════════════════════════

TransportResult<std::string> StdioTransport::take_line() {
    while (true) {
        const auto newline = read_buffer_.find('\n');
        if (newline == std::string::npos) {
            break;
        }

        std::string line = read_buffer_.substr(0, newline);
        read_buffer_.erase(0, newline + 1);

        if (discarding_) {
            discarding_ = false;
            continue;
        }

        if (line.size() > config_.max_line_length) {
            return tl::unexpected(make_error(
                TransportError::Category::Protocol,
                "record exceeds " + std::to_string(config_.max_line_length) + " bytes"));
        }

        if ((line.empty() == false) && (line.back() == '\r')) {
            line.pop_back();
        }
        return line;
    }

    return tl::unexpected(make_error(TransportError::Category::Closed, "no complete line"));
}

asio::awaitable<TransportResult<std::string>> StdioTransport::async_receive() {
    std::array<char, 4096> chunk{};

    while (true) {
        if (running_ == false) {
            co_return tl::unexpected(make_error(
                TransportError::Category::Closed,
                "transport stopped"));
        }

        auto line = take_line();
        if (line || (line.error().category == TransportError::Category::Protocol)) {
            co_return line;
        }

        if (input_eof_) {
            // A final record without a trailing newline still counts.
            const bool has_tail = (read_buffer_.empty() == false) && (discarding_ == false);
            if (has_tail) {
                std::string tail = std::move(read_buffer_);
                read_buffer_.clear();
                if ((tail.empty() == false) && (tail.back() == '\r')) {
                    tail.pop_back();
                }
                co_return tail;
            }
            co_return tl::unexpected(make_error(
                TransportError::Category::Closed,
                "end of stream"));
        }

        if (read_buffer_.size() > config_.max_line_length) {
            read_buffer_.clear();
            discarding_ = true;
            co_return tl::unexpected(make_error(
                TransportError::Category::Protocol,
                "record exceeds " + std::to_string(config_.max_line_length) + " bytes"));
        }
        if (discarding_) {
            read_buffer_.clear();
        }

        try {
            const std::size_t n = co_await input_->async_read_some(
                asio::buffer(chunk),
                asio::use_awaitable);
            read_buffer_.append(chunk.data(), n);
        } catch (const std::system_error& e) {
            if (e.code() == asio::error::eof) {
                input_eof_ = true;
                continue;
            }
            const bool aborted = (e.code() == asio::error::operation_aborted);
            if (aborted || (running_ == false)) {
                co_return tl::unexpected(make_error(
                    TransportError::Category::Closed,
                    "transport stopped"));
            }
            co_return tl::unexpected(make_error(
                TransportError::Category::Network,
                "read failed: " + std::string(e.what())));
        }
    }
}

}  // namespace mcpshim
