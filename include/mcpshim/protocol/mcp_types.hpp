#ifndef MCPSHIM_PROTOCOL_MCP_TYPES_HPP
#define MCPSHIM_PROTOCOL_MCP_TYPES_HPP

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace mcpshim {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// MCP Protocol Versions
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

// Newest first. A client asking for one of these gets it echoed back.
inline constexpr std::array<std::string_view, 3> SUPPORTED_PROTOCOL_VERSIONS{
    "2025-06-18",
    "2025-03-26",
    "2024-11-05"
};

[[nodiscard]] inline bool is_supported_protocol_version(std::string_view version) {
    for (const auto supported : SUPPORTED_PROTOCOL_VERSIONS) {
        if (supported == version) {
            return true;
        }
    }
    return false;
}

// ═══════════════════════════════════════════════════════════════════════════
// Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities
// ═══════════════════════════════════════════════════════════════════════════
// Only what the shim announces on behalf of the hosted server.

struct ServerCapabilities {
    struct Tools {
        bool list_changed = false;
    };

    std::optional<Tools> tools;

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (tools) {
            j["tools"] = {{"listChanged", tools->list_changed}};
        }
        return j;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeParams {
    std::optional<std::string> protocol_version;

    static InitializeParams from_json(const std::optional<Json>& params) {
        InitializeParams result;
        const bool has_object = params.has_value() && params->is_object();
        if (has_object == false) {
            return result;
        }
        const auto it = params->find("protocolVersion");
        if ((it != params->end()) && it->is_string()) {
            result.protocol_version = it->get<std::string>();
        }
        return result;
    }
};

struct InitializeResult {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    ServerCapabilities capabilities;
    Implementation server_info;

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities.to_json()},
            {"serverInfo", server_info.to_json()}
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr std::string_view TOOLS_LIST_METHOD{"tools/list"};
inline constexpr std::string_view INITIALIZE_METHOD{"initialize"};

// Result of `tools/list` with no tools and no pagination cursor.
[[nodiscard]] inline Json empty_tools_list() {
    return {{"tools", Json::array()}};
}

}  // namespace mcpshim

#endif  // MCPSHIM_PROTOCOL_MCP_TYPES_HPP
