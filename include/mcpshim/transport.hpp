#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared by the stdio side of the bridge. The HTTP side reports through
// HttpClientError (transport/http_client.hpp).

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include <tl/expected.hpp>

namespace mcpshim {

using Json = nlohmann::json;

/// Error type for stream operations
struct TransportError {
    enum class Category {
        Closed,    // End of stream or transport stopped
        Network,   // Read/write failure on the descriptor
        Protocol   // Record violates framing (e.g. line too long)
    };

    Category category{};
    std::string message;
};

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace mcpshim
