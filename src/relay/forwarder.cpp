#include "mcpshim/relay/forwarder.hpp"

#include "mcpshim/json/fast_json.hpp"
#include "mcpshim/log/logger.hpp"

#include <asio/experimental/concurrent_channel.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <format>
#include <system_error>
#include <thread>

namespace mcpshim {

namespace {

constexpr const char* kContentType = "application/json";
constexpr const char* kUserAgent = "mcpshim/1.0.0";

using ResultChannel = asio::experimental::concurrent_channel<
    void(asio::error_code, ForwardResult)>;

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string method_of(const Json& message) {
    if (message.is_object() && message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "<unknown>";
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

Forwarder::Forwarder(const SessionConfig& config, std::unique_ptr<IHttpClient> client)
    : client_(std::move(client))
{
    if (!client_) {
        throw ConfigError("HTTP client is required");
    }

    const UrlComponents server = config.server();
    endpoint_ = server.join_path(config.endpoint_path);

    client_->set_base_url(server.origin());
    client_->set_default_headers({
        {"Authorization", "Bearer " + config.token},
        {"Accept", kContentType},
        {"User-Agent", kUserAgent}
    });
    client_->set_connect_timeout(config.connect_timeout);
    client_->set_read_timeout(config.request_timeout);
    client_->set_verify_ssl(config.verify_tls);
}

Forwarder::~Forwarder() {
    cancel();
    std::unique_lock<std::mutex> lock(workers_mutex_);
    workers_idle_.wait(lock, [this] { return active_workers_ == 0; });
}

// ═══════════════════════════════════════════════════════════════════════════
// Forwarding
// ═══════════════════════════════════════════════════════════════════════════

ForwardResult Forwarder::forward(const Json& message) {
    try {
        return exchange(message);
    } catch (const std::exception& e) {
        MCPSHIM_LOG_DEBUG(std::format("Exchange for {} threw: {}", method_of(message), e.what()));
        return tl::unexpected(ForwardFailure::malformed(e.what()));
    }
}

ForwardResult Forwarder::exchange(const Json& message) {
    const std::string body = message.dump();

    MCPSHIM_LOG_DEBUG(std::format("Forwarding {} to {}", method_of(message), endpoint_));

    auto response = client_->post(endpoint_, body, kContentType);
    if (!response) {
        const HttpClientError& err = response.error();
        if (err.code == HttpClientError::Code::InvalidRequest) {
            return tl::unexpected(ForwardFailure::malformed(err.message));
        }
        return tl::unexpected(ForwardFailure::no_response(err));
    }

    if (response->is_success() == false) {
        return tl::unexpected(ForwardFailure::http_error(
            response->status_code, std::move(response->body)));
    }

    if (is_blank(response->body)) {
        return tl::unexpected(ForwardFailure::malformed("Server returned empty response"));
    }

    auto parsed = fast_parse(response->body);
    if (!parsed) {
        return tl::unexpected(ForwardFailure::malformed(
            "Invalid JSON in server response: " + parsed.error().message));
    }

    MCPSHIM_LOG_DEBUG(std::format("Response for {} ({} bytes)", method_of(message), response->body.size()));
    return std::move(*parsed);
}

asio::awaitable<ForwardResult> Forwarder::async_forward(Json message) {
    auto executor = co_await asio::this_coro::executor;
    auto channel = std::make_shared<ResultChannel>(executor, 1);

    begin_worker();
    try {
        std::thread([this, channel, message = std::move(message)]() {
            WorkerSlot slot(*this);
            channel->try_send(asio::error_code{}, forward(message));
        }).detach();
    } catch (const std::system_error& e) {
        finish_worker();
        co_return tl::unexpected(ForwardFailure::malformed(
            std::string("Failed to start request: ") + e.what()));
    }

    try {
        co_return co_await channel->async_receive(asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(ForwardFailure::malformed(e.what()));
    }
}

void Forwarder::cancel() {
    client_->cancel();
}

std::size_t Forwarder::active_workers() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return active_workers_;
}

void Forwarder::begin_worker() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    ++active_workers_;
}

void Forwarder::finish_worker() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    --active_workers_;
    workers_idle_.notify_all();
}

}  // namespace mcpshim
