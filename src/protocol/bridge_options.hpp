#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bridge::protocol {

    // A forwarding route supplied on the command line: --route name=/path
    struct ForwardRoute {
        std::string tool;
        std::string path;
    };

    // Validated startup configuration for one bridge session
    struct BridgeOptions {
        std::string backend_url = "http://127.0.0.1:5000";
        std::uint32_t timeout_ms = 30000;
        std::uint32_t connect_timeout_ms = 2000;
        std::size_t max_in_flight = 4;
        std::filesystem::path audit_log = "wayland_bridge_audit.jsonl";
        std::optional<std::filesystem::path> log_file;
        std::vector<ForwardRoute> routes;
        bool verbose = false;
        bool list_tools = false;
        bool show_help = false;
    };

} // namespace bridge::protocol
