#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/bridge_errors.hpp"
#include "protocol/bridge_options.hpp"

namespace bridge::tools {

enum class ToolAction {
    Forward,
    NotImplemented
};

struct ToolEntry {
    std::string name;
    ToolAction action = ToolAction::NotImplemented;
    std::string forward_path;  // Only meaningful for ToolAction::Forward
    std::string description;
};

// Immutable name -> action table. Built once at startup; lookups are
// exact and case-sensitive.
class ToolRegistry {
public:
    static core::errors::Result<ToolRegistry> create(std::vector<ToolEntry> entries);

    const ToolEntry* find(const std::string& name) const;

    // Entries sorted by name, for listing.
    std::vector<ToolEntry> entries() const;

    std::size_t size() const;

private:
    ToolRegistry() = default;

    std::unordered_map<std::string, ToolEntry> entries_;
};

std::vector<ToolEntry> default_tool_entries();

// Applies --route overrides: an existing name becomes a forwarding tool,
// an unknown name is appended.
std::vector<ToolEntry> with_forward_routes(std::vector<ToolEntry> entries,
                                           const std::vector<protocol::ForwardRoute>& routes);

std::string to_string(ToolAction action);

}  // namespace bridge::tools
