#include "protocol/request_decoder.hpp"

#include <algorithm>
#include <cctype>

namespace bridge::protocol {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](const unsigned char c) {
        return std::isspace(c) != 0;
    });
}

}  // namespace

core::errors::Result<ToolRequest> decode_request(const std::string& line) {
    if (is_blank(line)) {
        return BridgeError{ErrorCategory::Decode, "Empty request line", "empty_line",
                           "Send one JSON object per line."};
    }

    json parsed;
    try {
        parsed = json::parse(line);
    } catch (const json::exception& ex) {
        // parse_error for bad syntax, out_of_range for numbers that overflow a double.
        return BridgeError{ErrorCategory::Decode, std::string("Invalid JSON: ") + ex.what(),
                           "invalid_json"};
    }

    if (!parsed.is_object()) {
        return BridgeError{ErrorCategory::Decode, "Request must be a JSON object",
                           "invalid_request"};
    }

    const auto tool_it = parsed.find("tool");
    if (tool_it == parsed.end() || !tool_it->is_string() ||
        tool_it->get_ref<const std::string&>().empty()) {
        return BridgeError{ErrorCategory::Decode, "Missing tool field", "missing_tool",
                           "Expected {\"tool\": \"<name>\", \"arguments\": {...}}"};
    }

    ToolRequest request{tool_it->get<std::string>(), json::object()};

    const auto args_it = parsed.find("arguments");
    if (args_it != parsed.end()) {
        if (!args_it->is_object()) {
            return BridgeError{ErrorCategory::Decode, "arguments must be an object",
                               "invalid_arguments"};
        }
        request.arguments = *args_it;
    }

    return request;
}

}  // namespace bridge::protocol
