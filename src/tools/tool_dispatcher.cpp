#include "tools/tool_dispatcher.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace bridge::tools {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

ToolDispatcher::ToolDispatcher(ToolRegistry registry,
                               std::shared_ptr<backend::BackendClient> backend)
    : registry_(std::move(registry)), backend_(std::move(backend)) {}

protocol::Outcome ToolDispatcher::dispatch(const protocol::ToolRequest& request) const {
    const ToolEntry* entry = registry_.find(request.tool);
    if (entry == nullptr) {
        LOG_WARN("Unknown tool: " + request.tool);
        return BridgeError{ErrorCategory::UnknownTool, "Unknown tool: " + request.tool,
                           "unknown_tool"};
    }

    switch (entry->action) {
        case ToolAction::Forward: {
            if (!backend_) {
                return BridgeError{ErrorCategory::Internal,
                                   "No backend configured for " + request.tool,
                                   "backend_missing"};
            }
            LOG_INFO("Forwarding " + request.tool + " to " + entry->forward_path);
            auto outcome = backend_->post(entry->forward_path, request.arguments);
            if (core::errors::is_error(outcome)) {
                const auto& err = core::errors::get_error(outcome);
                LOG_WARN("Backend call for " + request.tool + " failed [" + err.code + "]: " +
                         err.message + (err.hint.empty() ? "" : " Hint: " + err.hint));
            }
            return outcome;
        }
        case ToolAction::NotImplemented:
            LOG_INFO(request.tool + " not implemented");
            return BridgeError{ErrorCategory::NotImplemented,
                               request.tool + " not implemented", "not_implemented"};
    }

    return BridgeError{ErrorCategory::Internal,
                       "Unhandled action for tool " + request.tool, "unhandled_action"};
}

}  // namespace bridge::tools
