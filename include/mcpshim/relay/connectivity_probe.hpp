#ifndef MCPSHIM_RELAY_CONNECTIVITY_PROBE_HPP
#define MCPSHIM_RELAY_CONNECTIVITY_PROBE_HPP

#include "mcpshim/relay/error_classifier.hpp"
#include "mcpshim/relay/session_config.hpp"
#include "mcpshim/transport/http_client.hpp"

#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace mcpshim {

// ─────────────────────────────────────────────────────────────────────────────
// ConnectivityProbe
// ─────────────────────────────────────────────────────────────────────────────
// One GET against the server root at startup, diagnostics only. The outcome
// is logged and otherwise ignored: the relay starts either way.

enum class ProbeOutcome {
    Reachable,
    Unreachable,
    AuthRejected,
    UnexpectedStatus
};

[[nodiscard]] constexpr std::string_view to_string(ProbeOutcome outcome) noexcept {
    switch (outcome) {
        case ProbeOutcome::Reachable:        return "Reachable";
        case ProbeOutcome::Unreachable:      return "Unreachable";
        case ProbeOutcome::AuthRejected:     return "AuthRejected";
        case ProbeOutcome::UnexpectedStatus: return "UnexpectedStatus";
    }
    return "Unknown";
}

struct ProbeReport {
    ProbeOutcome outcome{ProbeOutcome::Unreachable};
    std::optional<int> http_status;
    std::optional<ClassifiedError> error;
};

class ConnectivityProbe {
public:
    ConnectivityProbe(const SessionConfig& config, std::unique_ptr<IHttpClient> client);

    // Joins the background probe if one was started.
    ~ConnectivityProbe();

    ConnectivityProbe(const ConnectivityProbe&) = delete;
    ConnectivityProbe& operator=(const ConnectivityProbe&) = delete;

    /// Runs the probe on the calling thread and logs the outcome.
    ProbeReport run();

    /// Runs the probe on a background thread. At most once.
    void start();

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::unique_ptr<IHttpClient> client_;
    std::string path_;
    std::thread worker_;
};

}  // namespace mcpshim

#endif  // MCPSHIM_RELAY_CONNECTIVITY_PROBE_HPP
