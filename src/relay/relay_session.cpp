#include "mcpshim/relay/relay_session.hpp"

#include "mcpshim/json/fast_json.hpp"
#include "mcpshim/log/logger.hpp"
#include "mcpshim/protocol/mcp_types.hpp"
#include "mcpshim/transport/stdio_transport.hpp"

#include <asio/co_spawn.hpp>
#include <asio/post.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <format>

namespace mcpshim {

namespace {

SessionConfig validated(SessionConfig config) {
    config.validate();
    return config;
}

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

void log_aborted(std::string_view what, std::exception_ptr error) {
    if (!error) {
        return;
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        MCPSHIM_LOG_ERROR(std::format("{} aborted: {}", what, e.what()));
    }
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

RelaySession::RelaySession(SessionConfig config)
    : RelaySession(
          std::move(config),
          [](asio::any_io_executor executor) -> std::unique_ptr<async::IAsyncTransport> {
              return std::make_unique<StdioTransport>(std::move(executor));
          },
          make_http_client(),
          make_http_client())
{}

RelaySession::RelaySession(SessionConfig config,
                           TransportFactory make_transport,
                           std::unique_ptr<IHttpClient> http_client,
                           std::unique_ptr<IHttpClient> probe_client)
    : config_(validated(std::move(config)))
    , transport_(make_transport ? make_transport(io_.get_executor()) : nullptr)
    , forwarder_(config_, std::move(http_client))
    , lifecycle_(io_.get_executor(), config_)
{
    if (!transport_) {
        throw ConfigError("transport is required");
    }
    if (config_.debug && probe_client) {
        probe_ = std::make_unique<ConnectivityProbe>(config_, std::move(probe_client));
    }
}

RelaySession::~RelaySession() = default;

// ═══════════════════════════════════════════════════════════════════════════
// Running
// ═══════════════════════════════════════════════════════════════════════════

int RelaySession::run() {
    lifecycle_.on_drain([this] {
        transport_->stop();
    });
    lifecycle_.on_stop([this] {
        forwarder_.cancel();
    });
    lifecycle_.start();

    if (probe_) {
        probe_->start();
    }

    MCPSHIM_LOG_DEBUG(std::format("Relaying to {}{}", config_.server_url, forwarder_.endpoint()));

    lifecycle_.task_started();
    asio::co_spawn(io_, relay_loop(), [this](std::exception_ptr error) {
        if (error) {
            exit_code_ = 1;
            log_aborted("Relay loop", error);
            lifecycle_.begin_drain("internal error");
        }
        lifecycle_.task_finished();
    });

    io_.run();

    MCPSHIM_LOG_DEBUG(std::format(
        "Session ended ({}): {} line(s), {} local, {} forwarded, {} failed, {} degraded",
        lifecycle_.drain_reason(), stats_.lines_read, stats_.answered_locally,
        stats_.forwarded, stats_.failed, stats_.degraded));
    return exit_code_;
}

void RelaySession::request_shutdown() {
    asio::post(io_, [this] {
        lifecycle_.begin_drain("shutdown requested");
    });
}

asio::awaitable<void> RelaySession::relay_loop() {
    auto started = co_await transport_->async_start();
    if (!started) {
        MCPSHIM_LOG_ERROR(std::format("Cannot open stdio: {}", started.error().message));
        exit_code_ = 1;
        lifecycle_.begin_drain("transport failed");
        co_return;
    }

    while (lifecycle_.accepting()) {
        auto line = co_await transport_->async_receive();

        if (!line) {
            const TransportError& err = line.error();
            if (err.category == TransportError::Category::Protocol) {
                // Oversized record: answered like any other unparseable line.
                co_await write_response(make_error_response(
                    JsonRpcId::null(),
                    JsonRpcError{error_code::kParseError, "Parse error: " + err.message, std::nullopt}));
                continue;
            }
            if (err.category == TransportError::Category::Network) {
                MCPSHIM_LOG_ERROR(std::format("Input failed: {}", err.message));
                lifecycle_.begin_drain("input error");
                break;
            }
            lifecycle_.begin_drain("end of input");
            break;
        }

        if (lifecycle_.accepting() == false) {
            break;
        }
        co_await handle_line(std::move(*line));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Dispatch
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> RelaySession::handle_line(std::string line) {
    if (is_blank(line)) {
        co_return;
    }
    ++stats_.lines_read;

    auto parsed = fast_parse(line);
    if (!parsed) {
        MCPSHIM_LOG_DEBUG(std::format("Unparseable line: {}", parsed.error().message));
        co_await write_response(make_error_response(
            JsonRpcId::null(),
            JsonRpcError{error_code::kParseError, "Parse error: " + parsed.error().message, std::nullopt}));
        co_return;
    }

    const JsonRpcId fallback_id = extract_id(*parsed);
    auto request = JsonRpcRequest::from_json(std::move(*parsed));
    if (!request) {
        co_await write_response(make_error_response(
            fallback_id,
            JsonRpcError{error_code::kInvalidRequest, "Invalid Request: " + request.error().message, std::nullopt}));
        co_return;
    }

    MCPSHIM_LOG_TRACE(std::format("Received {}", request->method()));

    if (LocalHandler::handles(*request)) {
        ++stats_.answered_locally;
        auto response = local_.handle(*request);
        if (response) {
            co_await write_response(std::move(*response));
        }
        co_return;
    }

    spawn_forward(std::move(*request));
}

void RelaySession::spawn_forward(JsonRpcRequest request) {
    ++stats_.forwarded;
    lifecycle_.task_started();
    asio::co_spawn(io_, forward_request(std::move(request)), [this](std::exception_ptr error) {
        log_aborted("Forwarded request", error);
        lifecycle_.task_finished();
    });
}

asio::awaitable<void> RelaySession::forward_request(JsonRpcRequest request) {
    ForwardResult result = co_await forwarder_.async_forward(request.payload());

    // Forwarded without an id: the outcome is only ever logged.
    if (request.has_id() == false) {
        if (!result) {
            ++stats_.failed;
            report_failure(request.method(), classify(result.error()));
        }
        co_return;
    }
    const JsonRpcId id = *request.id();

    if (result) {
        co_await write_response(std::move(*result));
        co_return;
    }

    const ClassifiedError error = classify(result.error());
    ++stats_.failed;

    if (degrades_to_empty_tool_list(request.method(), error)) {
        ++stats_.degraded;
        if (error.silent == false) {
            MCPSHIM_LOG_WARN(std::format("{} unavailable, answering with no tools: {}",
                                         request.method(), error.message));
        }
        co_await write_response(make_result_response(id, empty_tools_list()));
        co_return;
    }

    report_failure(request.method(), error);
    co_await write_response(make_error_response(id, error.to_rpc_error()));
}

asio::awaitable<void> RelaySession::write_response(Json response) {
    auto sent = co_await transport_->async_send(std::move(response));
    if (!sent) {
        MCPSHIM_LOG_ERROR(std::format("Failed to write response: {}", sent.error().message));
        lifecycle_.begin_drain("output closed");
        co_return;
    }
    ++stats_.responses_written;
}

void RelaySession::report_failure(const std::string& method, const ClassifiedError& error) const {
    if (error.silent) {
        return;
    }
    if (error.detail.empty()) {
        MCPSHIM_LOG_WARN(std::format("{} failed [{}]: {}", method, to_string(error.kind), error.message));
        return;
    }
    MCPSHIM_LOG_WARN(std::format("{} failed [{}]: {} (upstream: {})",
                                 method, to_string(error.kind), error.message, error.detail));
}

}  // namespace mcpshim
