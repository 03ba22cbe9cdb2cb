#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "mcpshim/protocol/json_rpc.hpp"

using json = nlohmann::json;
using namespace mcpshim;

// ─────────────────────────────────────────────────────────────────────────────
// Request parsing
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("JsonRpcRequest parses method, id and params", "[json-rpc][request]") {
    json payload = {
        {"jsonrpc", "2.0"},
        {"method", "tools/call"},
        {"id", "req-001"},
        {"params", json::object({{"name", "echo"}})}
    };

    auto parsed = JsonRpcRequest::from_json(payload);
    REQUIRE(parsed.has_value());

    const auto& req = parsed.value();
    REQUIRE(req.method() == "tools/call");
    REQUIRE(req.has_id());
    REQUIRE(std::get<std::string>(req.id()->value) == "req-001");
    REQUIRE(req.params()->at("name") == "echo");
    REQUIRE(req.payload() == payload);
    REQUIRE_FALSE(req.is_notification_method());
}

TEST_CASE("JsonRpcRequest keeps integer ids integral", "[json-rpc][request]") {
    auto parsed = JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"method", "ping"}, {"id", 42}});
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed->id() == JsonRpcId::integer(42));
    REQUIRE(parsed->id()->to_json().is_number_integer());
}

TEST_CASE("JsonRpcRequest keeps ids beyond int64 and fractional ids exact", "[json-rpc][request]") {
    auto big = JsonRpcRequest::from_json(
        json::parse(R"({"jsonrpc":"2.0","id":9223372036854775808,"method":"ping"})"));
    REQUIRE(big.has_value());
    REQUIRE(*big->id() == JsonRpcId::unsigned_integer(9223372036854775808ULL));
    REQUIRE(big->id()->to_string() == "9223372036854775808");

    auto small = JsonRpcRequest::from_json(json::parse(R"({"jsonrpc":"2.0","id":7,"method":"ping"})"));
    REQUIRE(small.has_value());
    REQUIRE(*small->id() == JsonRpcId::integer(7));

    auto fractional = JsonRpcRequest::from_json(json::parse(R"({"jsonrpc":"2.0","id":1.5,"method":"ping"})"));
    REQUIRE(fractional.has_value());
    REQUIRE(*fractional->id() == JsonRpcId::number(1.5));
    REQUIRE(make_result_response(*fractional->id(), json::object())["id"] == 1.5);
}

TEST_CASE("JsonRpcRequest without id or with null id has no id", "[json-rpc][notification]") {
    auto absent = JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"method", "tools/list"}});
    REQUIRE(absent.has_value());
    REQUIRE_FALSE(absent->has_id());
    REQUIRE_FALSE(absent->is_notification_method());

    auto null_id = JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"method", "tools/list"}, {"id", nullptr}});
    REQUIRE(null_id.has_value());
    REQUIRE_FALSE(null_id->has_id());
}

TEST_CASE("notifications/ methods are recognised even with an id", "[json-rpc][notification]") {
    auto parsed = JsonRpcRequest::from_json(
        {{"jsonrpc", "2.0"}, {"method", "notifications/progress"}, {"id", 3}});
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->has_id());
    REQUIRE(parsed->is_notification_method());
}

TEST_CASE("JsonRpcRequest parsing surfaces detailed errors", "[json-rpc][request][error]") {
    SECTION("wrong version") {
        auto r = JsonRpcRequest::from_json({{"jsonrpc", "1.0"}, {"method", "tools/list"}, {"id", 1}});
        REQUIRE(r.error().code == JsonError::Code::InvalidVersion);
    }
    SECTION("missing version") {
        auto r = JsonRpcRequest::from_json({{"method", "tools/list"}, {"id", 1}});
        REQUIRE(r.error().code == JsonError::Code::MissingField);
    }
    SECTION("missing method") {
        auto r = JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"id", 2}});
        REQUIRE(r.error().code == JsonError::Code::MissingField);
    }
    SECTION("method is not a string") {
        auto r = JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"id", 2}, {"method", 5}});
        REQUIRE(r.error().code == JsonError::Code::InvalidMethod);
    }
    SECTION("object id") {
        auto r = JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"id", {{"n", 1}}}, {"method", "x"}});
        REQUIRE(r.error().code == JsonError::Code::InvalidId);
    }
    SECTION("boolean id") {
        auto r = JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"id", true}, {"method", "x"}});
        REQUIRE(r.error().code == JsonError::Code::InvalidId);
    }
    SECTION("scalar params") {
        auto r = JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "x"}, {"params", 7}});
        REQUIRE(r.error().code == JsonError::Code::InvalidParams);
    }
    SECTION("batch array") {
        auto r = JsonRpcRequest::from_json(json::array({{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "x"}}}));
        REQUIRE(r.error().code == JsonError::Code::NotAnObject);
        REQUIRE(r.error().message.find("batch") != std::string::npos);
    }
}

TEST_CASE("extract_id recovers usable ids from invalid requests", "[json-rpc][request]") {
    REQUIRE(extract_id({{"jsonrpc", "1.0"}, {"id", 9}}) == JsonRpcId::integer(9));
    REQUIRE(extract_id({{"id", "abc"}}) == JsonRpcId::string("abc"));
    REQUIRE(extract_id({{"id", 2.25}}) == JsonRpcId::number(2.25));
    REQUIRE(extract_id({{"id", json::array()}}).is_null());
    REQUIRE(extract_id(json::array()).is_null());
    REQUIRE(extract_id(json("text")).is_null());
}

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("make_result_response echoes the id", "[json-rpc][response]") {
    auto response = make_result_response(JsonRpcId::string("a-1"), json{{"tools", json::array()}});

    REQUIRE(response["jsonrpc"] == "2.0");
    REQUIRE(response["id"] == "a-1");
    REQUIRE(response["result"]["tools"].empty());
    REQUIRE_FALSE(response.contains("error"));
}

TEST_CASE("make_error_response carries code, message and optional data", "[json-rpc][response]") {
    auto plain = make_error_response(JsonRpcId::null(),
                                     JsonRpcError{error_code::kParseError, "Parse error: bad", std::nullopt});
    REQUIRE(plain["id"].is_null());
    REQUIRE(plain["error"]["code"] == -32700);
    REQUIRE(plain["error"]["message"] == "Parse error: bad");
    REQUIRE_FALSE(plain["error"].contains("data"));
    REQUIRE_FALSE(plain.contains("result"));

    auto with_data = make_error_response(JsonRpcId::integer(4),
                                         JsonRpcError{error_code::kServerError, "boom", json{{"status", 500}}});
    REQUIRE(with_data["id"] == 4);
    REQUIRE(with_data["error"]["data"]["status"] == 500);
}
