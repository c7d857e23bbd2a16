#include "tools/tool_registry.hpp"

#include <algorithm>
#include <utility>

namespace bridge::tools {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

core::errors::Result<ToolRegistry> ToolRegistry::create(std::vector<ToolEntry> entries) {
    ToolRegistry registry;
    for (auto& entry : entries) {
        if (entry.name.empty()) {
            return BridgeError{ErrorCategory::Input, "Tool name cannot be empty.",
                               "invalid_tool_name"};
        }
        if (entry.action == ToolAction::Forward &&
            (entry.forward_path.empty() || entry.forward_path.front() != '/')) {
            return BridgeError{ErrorCategory::Input,
                               "Forwarding tool " + entry.name +
                                   " needs a path starting with '/'",
                               "invalid_forward_path"};
        }
        if (registry.entries_.find(entry.name) != registry.entries_.end()) {
            return BridgeError{ErrorCategory::Input,
                               "Duplicate tool name: " + entry.name,
                               "duplicate_tool"};
        }
        std::string name = entry.name;
        registry.entries_.emplace(std::move(name), std::move(entry));
    }
    return registry;
}

const ToolEntry* ToolRegistry::find(const std::string& name) const {
    const auto it = entries_.find(name);
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<ToolEntry> ToolRegistry::entries() const {
    std::vector<ToolEntry> sorted;
    sorted.reserve(entries_.size());
    for (const auto& [_, entry] : entries_) {
        sorted.push_back(entry);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const ToolEntry& lhs, const ToolEntry& rhs) { return lhs.name < rhs.name; });
    return sorted;
}

std::size_t ToolRegistry::size() const {
    return entries_.size();
}

std::vector<ToolEntry> default_tool_entries() {
    return {
        {"execute_task", ToolAction::Forward, "/execute",
         "Run a natural-language task through the backend automation service"},
        {"capture_screenshot", ToolAction::NotImplemented, "",
         "Capture a screenshot of the current screen"},
        {"compare_images", ToolAction::NotImplemented, "",
         "Compare two screenshots for visual changes"},
    };
}

std::vector<ToolEntry> with_forward_routes(std::vector<ToolEntry> entries,
                                           const std::vector<protocol::ForwardRoute>& routes) {
    for (const auto& route : routes) {
        auto it = std::find_if(entries.begin(), entries.end(),
                               [&route](const ToolEntry& entry) { return entry.name == route.tool; });
        if (it != entries.end()) {
            it->action = ToolAction::Forward;
            it->forward_path = route.path;
            continue;
        }
        entries.push_back(ToolEntry{route.tool, ToolAction::Forward, route.path, ""});
    }
    return entries;
}

std::string to_string(const ToolAction action) {
    switch (action) {
        case ToolAction::Forward:
            return "forward";
        case ToolAction::NotImplemented:
            return "not_implemented";
        default:
            return "unknown";
    }
}

}  // namespace bridge::tools
