#ifndef MCPSHIM_RELAY_LOCAL_HANDLER_HPP
#define MCPSHIM_RELAY_LOCAL_HANDLER_HPP

#include "mcpshim/protocol/json_rpc.hpp"
#include "mcpshim/protocol/mcp_types.hpp"

#include <optional>
#include <string>

namespace mcpshim {

inline constexpr const char* SHIM_NAME = "mcpshim";
inline constexpr const char* SHIM_VERSION = "1.0.0";

// Name announced to clients in `serverInfo`.
inline constexpr const char* SERVER_INFO_NAME = "easymcp-shim";

// ─────────────────────────────────────────────────────────────────────────────
// LocalHandler
// ─────────────────────────────────────────────────────────────────────────────
// Answers what the shim can answer without the network: the `initialize`
// handshake and every `notifications/*` message. Holds no state between calls.

class LocalHandler {
public:
    LocalHandler();
    explicit LocalHandler(Implementation server_info);

    // `initialize` or a `notifications/*` method.
    [[nodiscard]] static bool handles(const JsonRpcRequest& request) noexcept;

    // The response line for a locally handled request, or nullopt when the
    // request is a notification and nothing may be written.
    [[nodiscard]] std::optional<Json> handle(const JsonRpcRequest& request) const;

    [[nodiscard]] InitializeResult handle_initialize(const std::optional<Json>& params) const;

    void handle_notification(const JsonRpcRequest& request) const;

    // The client's version when supported, otherwise the baseline version.
    [[nodiscard]] static std::string negotiate_protocol_version(
        const std::optional<std::string>& requested);

    [[nodiscard]] const Implementation& server_info() const noexcept { return server_info_; }

private:
    Implementation server_info_;
};

}  // namespace mcpshim

#endif  // MCPSHIM_RELAY_LOCAL_HANDLER_HPP
