#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mcpshim {

// ─────────────────────────────────────────────────────────────────────────────
// Headers
// ─────────────────────────────────────────────────────────────────────────────

using HeaderMap = std::unordered_map<std::string, std::string>;

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────
// The configured server URL split into the origin handed to the HTTP client
// and the path prefix the RPC endpoint is appended to.

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;     // "api.easymcp.net"
    std::uint16_t port{0};
    std::string path;     // "/" when the URL has no path

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    [[nodiscard]] std::string origin() const {
        const bool default_port =
            (is_secure() && port == 443) || ((is_secure() == false) && port == 80);
        // IPv6 hosts come back from ada already bracketed.
        if (default_port) {
            return scheme + "://" + host;
        }
        return scheme + "://" + host + ":" + std::to_string(port);
    }

    // `path` joined with `endpoint`, with exactly one slash between them.
    [[nodiscard]] std::string join_path(std::string_view endpoint) const {
        std::string base = path;
        while ((base.empty() == false) && (base.back() == '/')) {
            base.pop_back();
        }
        std::string suffix(endpoint);
        if ((suffix.empty() == false) && (suffix.front() != '/')) {
            suffix.insert(suffix.begin(), '/');
        }
        const std::string joined = base + suffix;
        return joined.empty() ? std::string("/") : joined;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// URL Parsing (ada-url)
// ─────────────────────────────────────────────────────────────────────────────
// Returns nullopt for anything that is not an absolute http(s) URL with a host.
// Query strings and fragments are dropped.

std::optional<UrlComponents> parse_url(const std::string& url);

}  // namespace mcpshim
