#include <catch2/catch_test_macros.hpp>

#include "mcpshim/relay/forwarder.hpp"
#include "mocks/mock_http_client.hpp"
#include "mocks/test_logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/use_future.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace mcpshim;
using mcpshim::testing::MockHttpClient;
using mcpshim::testing::header_value;
using mcpshim::testing::ScopedTestLogger;
using namespace std::chrono_literals;

namespace {

SessionConfig test_config() {
    return SessionConfig::for_environment(Environment::Dev, "tok_secret")
        .with_request_timeout(7s);
}

const Json kToolsList = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}};

// A worker releases its slot just after handing over the result.
bool wait_for_idle(const Forwarder& forwarder) {
    for (int i = 0; (i < 200) && (forwarder.active_workers() != 0); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    return forwarder.active_workers() == 0;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Client setup
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Forwarder configures the client from the session", "[forwarder]") {
    auto client = std::make_unique<MockHttpClient>();
    auto* mock = client.get();

    auto config = test_config().with_verify_tls(false);
    config.with_server_url("https://mcp.example.com/tenant");
    Forwarder forwarder(config, std::move(client));

    REQUIRE(mock->base_url() == "https://mcp.example.com");
    REQUIRE(forwarder.endpoint() == "/tenant/json-rpc");
    REQUIRE(header_value(mock->default_headers(), "authorization") == "Bearer tok_secret");
    REQUIRE(mock->read_timeout() == 7s);
    REQUIRE(mock->connect_timeout() == 10s);
    REQUIRE_FALSE(mock->verify_ssl());
}

TEST_CASE("Forwarder requires a client", "[forwarder]") {
    REQUIRE_THROWS_AS(Forwarder(test_config(), nullptr), ConfigError);
}

// ─────────────────────────────────────────────────────────────────────────────
// Blocking exchange
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Forwarder posts the message verbatim as JSON", "[forwarder]") {
    auto client = std::make_unique<MockHttpClient>();
    auto* mock = client.get();
    mock->queue_json_response(200, R"({"jsonrpc":"2.0","id":1,"result":{"tools":[{"name":"echo"}]}})");

    Forwarder forwarder(test_config(), std::move(client));
    auto result = forwarder.forward(kToolsList);

    REQUIRE(result.has_value());
    REQUIRE((*result)["result"]["tools"][0]["name"] == "echo");

    auto sent = mock->last_request();
    REQUIRE(sent.has_value());
    REQUIRE(sent->method == "POST");
    REQUIRE(sent->path == "/json-rpc");
    REQUIRE(sent->content_type == "application/json");
    REQUIRE(Json::parse(sent->body) == kToolsList);
}

TEST_CASE("Forwarder reports transport failures as no response", "[forwarder]") {
    auto client = std::make_unique<MockHttpClient>();
    client->queue_timeout("Operation timed out after 30000 ms");

    Forwarder forwarder(test_config(), std::move(client));
    auto result = forwarder.forward(kToolsList);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ForwardFailure::Kind::NoResponse);
    REQUIRE(result.error().transport_code == HttpClientError::Code::Timeout);
    REQUIRE(result.error().message == "Operation timed out after 30000 ms");
}

TEST_CASE("Forwarder keeps status and body of non-2xx responses", "[forwarder]") {
    auto client = std::make_unique<MockHttpClient>();
    client->queue_json_response(401, R"({"message":"Token expired"})");

    Forwarder forwarder(test_config(), std::move(client));
    auto result = forwarder.forward(kToolsList);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ForwardFailure::Kind::HttpStatus);
    REQUIRE(result.error().http_status == 401);
    REQUIRE(result.error().body == R"({"message":"Token expired"})");
}

TEST_CASE("Forwarder rejects empty and unparseable success bodies", "[forwarder]") {
    auto client = std::make_unique<MockHttpClient>();
    client->queue_response(200, "");
    client->queue_response(200, "  \n");
    client->queue_response(200, "<html>ok</html>");

    Forwarder forwarder(test_config(), std::move(client));

    auto empty = forwarder.forward(kToolsList);
    REQUIRE(empty.error().kind == ForwardFailure::Kind::Malformed);
    REQUIRE(empty.error().message == "Server returned empty response");

    auto blank = forwarder.forward(kToolsList);
    REQUIRE(blank.error().message == "Server returned empty response");

    auto html = forwarder.forward(kToolsList);
    REQUIRE(html.error().kind == ForwardFailure::Kind::Malformed);
    REQUIRE(html.error().message.find("Invalid JSON in server response") == 0);
}

TEST_CASE("Forwarder never logs failures itself", "[forwarder][log]") {
    ScopedTestLogger logger(LogLevel::Trace);
    auto client = std::make_unique<MockHttpClient>();
    client->queue_response(404, "Not Found");

    Forwarder forwarder(test_config(), std::move(client));
    auto result = forwarder.forward(kToolsList);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(logger->count_at_least(LogLevel::Info) == 0);
    REQUIRE_FALSE(logger->contains("404"));
}

TEST_CASE("Cancelled forwarder refuses new calls", "[forwarder]") {
    auto client = std::make_unique<MockHttpClient>();
    auto* mock = client.get();

    Forwarder forwarder(test_config(), std::move(client));
    forwarder.cancel();

    REQUIRE(mock->was_cancelled());
    auto result = forwarder.forward(kToolsList);
    REQUIRE(result.error().kind == ForwardFailure::Kind::NoResponse);
    REQUIRE(result.error().transport_code == HttpClientError::Code::Cancelled);
}

TEST_CASE("Exceptions from the client become malformed failures", "[forwarder][error]") {
    auto client = std::make_unique<MockHttpClient>();
    client->set_response_handler(
        [](const std::string&, const std::string&, const std::string&) -> HttpClientResult<HttpClientResponse> {
            throw std::runtime_error("boom");
        });
    Forwarder forwarder(test_config(), std::move(client));

    auto result = forwarder.forward(kToolsList);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ForwardFailure::Kind::Malformed);
    REQUIRE(result.error().message == "boom");
}

// ─────────────────────────────────────────────────────────────────────────────
// Coroutine exchange
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("async_forward completes on the caller's executor", "[forwarder][async]") {
    asio::io_context io;
    auto client = std::make_unique<MockHttpClient>();
    client->queue_json_response(200, R"({"jsonrpc":"2.0","id":1,"result":{}})");
    Forwarder forwarder(test_config(), std::move(client));

    const auto io_thread = std::this_thread::get_id();
    std::thread::id resumed_on;

    auto future = asio::co_spawn(io, [&]() -> asio::awaitable<ForwardResult> {
        auto result = co_await forwarder.async_forward(kToolsList);
        resumed_on = std::this_thread::get_id();
        co_return result;
    }, asio::use_future);

    io.run();

    auto result = future.get();
    REQUIRE(result.has_value());
    REQUIRE((*result)["id"] == 1);
    REQUIRE(resumed_on == io_thread);
    REQUIRE(wait_for_idle(forwarder));
}

TEST_CASE("async_forward runs calls concurrently", "[forwarder][async]") {
    asio::io_context io;
    auto client = std::make_unique<MockHttpClient>();

    std::atomic<int> concurrent{0};
    std::atomic<int> peak{0};
    client->set_response_handler([&](const std::string&, const std::string&, const std::string& body) {
        const int now = ++concurrent;
        int expected = peak.load();
        while ((now > expected) && !peak.compare_exchange_weak(expected, now)) {
        }
        std::this_thread::sleep_for(100ms);
        --concurrent;
        const Json request = Json::parse(body);
        return HttpClientResult<HttpClientResponse>(HttpClientResponse{
            200, {}, Json{{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", Json::object()}}.dump()});
    });
    Forwarder forwarder(test_config(), std::move(client));

    std::vector<Json> ids;
    for (int i = 0; i < 4; ++i) {
        asio::co_spawn(io, [&, i]() -> asio::awaitable<void> {
            auto result = co_await forwarder.async_forward(
                Json{{"jsonrpc", "2.0"}, {"id", i}, {"method", "tools/call"}});
            REQUIRE(result.has_value());
            ids.push_back((*result)["id"]);
        }, asio::detached);
    }

    io.run();

    REQUIRE(ids.size() == 4);
    REQUIRE(peak.load() > 1);
}

TEST_CASE("async_forward survives a throwing client and frees its worker", "[forwarder][async][error]") {
    asio::io_context io;
    auto client = std::make_unique<MockHttpClient>();
    client->set_response_handler(
        [](const std::string&, const std::string&, const std::string&) -> HttpClientResult<HttpClientResponse> {
            throw std::runtime_error("boom");
        });
    Forwarder forwarder(test_config(), std::move(client));

    auto future = asio::co_spawn(io, forwarder.async_forward(kToolsList), asio::use_future);
    io.run();

    auto result = future.get();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().message == "boom");
    REQUIRE(wait_for_idle(forwarder));
}
