#pragma once

#include <memory>
#include "backend/backend_client.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_registry.hpp"

namespace bridge::tools {

// Routes a decoded request to exactly one of: forward to the backend,
// "<tool> not implemented", or "Unknown tool: <name>". No retries here.
class ToolDispatcher {
public:
    ToolDispatcher(ToolRegistry registry, std::shared_ptr<backend::BackendClient> backend);

    protocol::Outcome dispatch(const protocol::ToolRequest& request) const;

private:
    ToolRegistry registry_;
    std::shared_ptr<backend::BackendClient> backend_;
};

}  // namespace bridge::tools
