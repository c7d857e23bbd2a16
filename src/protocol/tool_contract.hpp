#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace bridge::protocol {

    // How the controller asks the bridge to run a tool.
    // Built once per input line by the decoder and never modified afterwards.
    struct ToolRequest {
        std::string tool;            // e.g., "execute_task", "capture_screenshot"
        nlohmann::json arguments;    // Always a JSON object
    };

    // Exactly one Outcome is produced per request line: the result value on
    // success, or the BridgeError describing why it failed.
    using Outcome = core::errors::Result<nlohmann::json>;

} // namespace bridge::protocol
