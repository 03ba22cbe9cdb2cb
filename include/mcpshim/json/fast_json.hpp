#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Fast JSON parsing (simdjson → nlohmann::json)
// ─────────────────────────────────────────────────────────────────────────────
// Every stdin line and every HTTP response body passes through here. simdjson
// does the validation and parsing; the result is materialized as
// nlohmann::json, which the rest of the code manipulates and serializes.
//
//   auto parsed = mcpshim::fast_parse(line);
//   if (!parsed) {
//       // parsed.error().message is the parser's own description
//   }

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace mcpshim {

struct JsonParseError {
    std::string message;

    JsonParseError() = default;
    explicit JsonParseError(std::string msg)
        : message(std::move(msg))
    {}
};

using ParseResult = tl::expected<nlohmann::json, JsonParseError>;

struct FastJsonConfig {
    // Nesting limit; deeper documents are rejected instead of recursing further.
    std::size_t max_depth{64};
};

class FastJsonParser {
public:
    FastJsonParser() = default;
    explicit FastJsonParser(FastJsonConfig config) : config_(config) {}

    // Each instance owns its parser buffers; do not share one across threads.
    [[nodiscard]] ParseResult parse(std::string_view json_str);

    [[nodiscard]] const FastJsonConfig& config() const noexcept { return config_; }

private:
    simdjson::ondemand::parser parser_;
    FastJsonConfig config_;

    [[nodiscard]] ParseResult convert(simdjson::ondemand::value value, std::size_t depth);
    [[nodiscard]] ParseResult convert_object(simdjson::ondemand::object obj, std::size_t depth);
    [[nodiscard]] ParseResult convert_array(simdjson::ondemand::array arr, std::size_t depth);
};

// Thread-local parser. Forwarder worker threads and the relay thread each get their own.
[[nodiscard]] ParseResult fast_parse(std::string_view json_str);

}  // namespace mcpshim
