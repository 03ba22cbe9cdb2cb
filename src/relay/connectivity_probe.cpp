#include "mcpshim/relay/connectivity_probe.hpp"

#include "mcpshim/log/logger.hpp"

#include <format>

namespace mcpshim {

ConnectivityProbe::ConnectivityProbe(const SessionConfig& config,
                                     std::unique_ptr<IHttpClient> client)
    : client_(std::move(client))
{
    if (!client_) {
        throw ConfigError("HTTP client is required");
    }

    const UrlComponents server = config.server();
    path_ = server.join_path("/");

    client_->set_base_url(server.origin());
    client_->set_default_headers({{"Authorization", "Bearer " + config.token}});
    client_->set_connect_timeout(config.probe_timeout);
    client_->set_read_timeout(config.probe_timeout);
    client_->set_verify_ssl(config.verify_tls);
}

ConnectivityProbe::~ConnectivityProbe() {
    client_->cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ConnectivityProbe::start() {
    if (worker_.joinable()) {
        return;
    }
    worker_ = std::thread([this] {
        static_cast<void>(run());
    });
}

ProbeReport ConnectivityProbe::run() {
    ProbeReport report;

    auto response = client_->get(path_);
    if (!response) {
        report.outcome = ProbeOutcome::Unreachable;
        report.error = classify(ForwardFailure::no_response(response.error()));
        MCPSHIM_LOG_WARN(std::format("Connectivity check failed: {} ({})",
                                     report.error->message, response.error().message));
        return report;
    }

    report.http_status = response->status_code;
    const int status = response->status_code;

    if ((status == 401) || (status == 403)) {
        report.outcome = ProbeOutcome::AuthRejected;
        report.error = classify(ForwardFailure::http_error(status, response->body));
        MCPSHIM_LOG_WARN(std::format("Connectivity check: {} {}",
                                     report.error->message, remediation(report.error->kind)));
        return report;
    }

    if (status >= 400) {
        report.outcome = ProbeOutcome::UnexpectedStatus;
        report.error = classify(ForwardFailure::http_error(status, response->body));
        if (status >= 500) {
            MCPSHIM_LOG_WARN(std::format("Connectivity check: {}", report.error->message));
        } else {
            MCPSHIM_LOG_WARN(std::format("Connectivity check: server returned status {}", status));
        }
        return report;
    }

    report.outcome = ProbeOutcome::Reachable;
    MCPSHIM_LOG_DEBUG(std::format("Server reachable (HTTP {})", status));
    return report;
}

}  // namespace mcpshim
