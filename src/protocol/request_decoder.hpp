#pragma once

#include <string>
#include "core/errors/bridge_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace bridge::protocol {

// Parses one raw input line into a ToolRequest. Never throws: every
// malformed line comes back as a Decode error.
core::errors::Result<ToolRequest> decode_request(const std::string& line);

}  // namespace bridge::protocol
