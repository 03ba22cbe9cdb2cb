#include "mcpshim/relay/local_handler.hpp"

#include "mcpshim/log/logger.hpp"

#include <format>

namespace mcpshim {

LocalHandler::LocalHandler()
    : server_info_{SERVER_INFO_NAME, SHIM_VERSION}
{}

LocalHandler::LocalHandler(Implementation server_info)
    : server_info_(std::move(server_info))
{}

bool LocalHandler::handles(const JsonRpcRequest& request) noexcept {
    return (request.method() == INITIALIZE_METHOD) || request.is_notification_method();
}

std::optional<Json> LocalHandler::handle(const JsonRpcRequest& request) const {
    if (request.is_notification_method()) {
        handle_notification(request);
        return std::nullopt;
    }

    InitializeResult result = handle_initialize(request.params());

    // `initialize` sent without an id is still a notification.
    if (request.has_id() == false) {
        return std::nullopt;
    }
    return make_result_response(*request.id(), result.to_json());
}

InitializeResult LocalHandler::handle_initialize(const std::optional<Json>& params) const {
    const InitializeParams init = InitializeParams::from_json(params);

    InitializeResult result;
    result.protocol_version = negotiate_protocol_version(init.protocol_version);
    result.capabilities.tools = ServerCapabilities::Tools{false};
    result.server_info = server_info_;

    MCPSHIM_LOG_DEBUG(std::format("Initialize: requested {}, answered {}",
                                  init.protocol_version.value_or("<none>"),
                                  result.protocol_version));
    return result;
}

void LocalHandler::handle_notification(const JsonRpcRequest& request) const {
    MCPSHIM_LOG_DEBUG(std::format("Notification: {}", request.method()));
}

std::string LocalHandler::negotiate_protocol_version(const std::optional<std::string>& requested) {
    if (requested && is_supported_protocol_version(*requested)) {
        return *requested;
    }
    return MCP_PROTOCOL_VERSION;
}

}  // namespace mcpshim
