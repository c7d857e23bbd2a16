#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace bridge::app::cli {

    using namespace bridge::core::errors;
    using bridge::protocol::BridgeOptions;
    using bridge::protocol::ForwardRoute;

    namespace {

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> backend_url;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> connect_timeout_ms;
        std::optional<std::string> max_in_flight;
        std::optional<std::string> audit_log;
        std::optional<std::string> log_file;
        std::vector<std::string> routes;
        bool verbose = false;
        bool list_tools = false;
        bool help = false;
    };

    // Exception-free integer parsing with inclusive bounds
    Result<std::uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                        std::uint32_t min, std::uint32_t max) {
        std::uint32_t value = 0;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (text.empty() || ec != std::errc() || ptr != end) {
            return BridgeError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer",
                               "Provide a positive integer."};
        }
        if (value < min || value > max) {
            return BridgeError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                               "Must be between " + std::to_string(min) + " and " +
                                   std::to_string(max) + "."};
        }
        return value;
    }

    Result<ForwardRoute> parse_route(const std::string& text) {
        const auto eq = text.find('=');
        if (eq == std::string::npos || eq == 0) {
            return BridgeError{ErrorCategory::Input, "Invalid --route: " + text, "invalid_route",
                               "Use --route <tool>=/<path>"};
        }
        ForwardRoute route{text.substr(0, eq), text.substr(eq + 1)};
        if (route.path.empty() || route.path.front() != '/') {
            return BridgeError{ErrorCategory::Input, "Route path must start with '/': " + text,
                               "invalid_route", "Use --route <tool>=/<path>"};
        }
        return route;
    }

    } // namespace

    std::string usage() {
        return "Usage: wayland_bridge [--backend-url URL] [--timeout-ms N] [--connect-timeout-ms N]\n"
               "                      [--max-in-flight N] [--audit-log PATH] [--log-file PATH]\n"
               "                      [--route TOOL=/PATH]... [--verbose] [--list-tools] [--help]\n"
               "Reads one JSON request per line on stdin and writes one JSON response per line on stdout.";
    }

    Result<BridgeOptions> parse_and_validate(int argc, char* argv[]) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Start at 1 to skip program name
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            auto take_value = [&](std::optional<std::string>& slot) -> bool {
                if (i + 1 >= args.size()) return false;
                slot = args[++i];
                return true;
            };

            if (args[i] == "--backend-url") {
                if (!take_value(raw.backend_url)) return BridgeError{ErrorCategory::Input, "Missing value for --backend-url", "missing_value"};
            } else if (args[i] == "--timeout-ms") {
                if (!take_value(raw.timeout_ms)) return BridgeError{ErrorCategory::Input, "Missing value for --timeout-ms", "missing_value"};
            } else if (args[i] == "--connect-timeout-ms") {
                if (!take_value(raw.connect_timeout_ms)) return BridgeError{ErrorCategory::Input, "Missing value for --connect-timeout-ms", "missing_value"};
            } else if (args[i] == "--max-in-flight") {
                if (!take_value(raw.max_in_flight)) return BridgeError{ErrorCategory::Input, "Missing value for --max-in-flight", "missing_value"};
            } else if (args[i] == "--audit-log") {
                if (!take_value(raw.audit_log)) return BridgeError{ErrorCategory::Input, "Missing value for --audit-log", "missing_value"};
            } else if (args[i] == "--log-file") {
                if (!take_value(raw.log_file)) return BridgeError{ErrorCategory::Input, "Missing value for --log-file", "missing_value"};
            } else if (args[i] == "--route") {
                if (i + 1 < args.size()) raw.routes.push_back(args[++i]);
                else return BridgeError{ErrorCategory::Input, "Missing value for --route", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else if (args[i] == "--list-tools") {
                raw.list_tools = true;
            } else if (args[i] == "--help" || args[i] == "-h") {
                raw.help = true;
            } else {
                return BridgeError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", usage()};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        BridgeOptions options;
        options.verbose = raw.verbose;
        options.list_tools = raw.list_tools;
        options.show_help = raw.help;

        if (raw.backend_url) {
            std::string url = raw.backend_url.value();
            if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
                return BridgeError{ErrorCategory::Input, "Backend URL must start with http:// or https://", "invalid_url",
                                   "Example: --backend-url http://127.0.0.1:5000"};
            }
            while (!url.empty() && url.back() == '/') {
                url.pop_back();
            }
            options.backend_url = url;
        }

        if (raw.timeout_ms) {
            auto parsed = parse_bounded("--timeout-ms", raw.timeout_ms.value(), 1, 600000);
            if (is_error(parsed)) return get_error(parsed);
            options.timeout_ms = get_value(parsed);
        }
        if (raw.connect_timeout_ms) {
            auto parsed = parse_bounded("--connect-timeout-ms", raw.connect_timeout_ms.value(), 1, 600000);
            if (is_error(parsed)) return get_error(parsed);
            options.connect_timeout_ms = get_value(parsed);
        }
        if (raw.max_in_flight) {
            auto parsed = parse_bounded("--max-in-flight", raw.max_in_flight.value(), 1, 64);
            if (is_error(parsed)) return get_error(parsed);
            options.max_in_flight = get_value(parsed);
        }

        if (raw.audit_log) {
            if (raw.audit_log->empty()) {
                return BridgeError{ErrorCategory::Input, "--audit-log cannot be empty", "invalid_path"};
            }
            options.audit_log = std::filesystem::path(raw.audit_log.value());
        }
        if (raw.log_file) {
            if (raw.log_file->empty()) {
                return BridgeError{ErrorCategory::Input, "--log-file cannot be empty", "invalid_path"};
            }
            options.log_file = std::filesystem::path(raw.log_file.value());
        }

        for (const auto& text : raw.routes) {
            auto route = parse_route(text);
            if (is_error(route)) return get_error(route);
            options.routes.push_back(get_value(route));
        }

        return options;
    }

} // namespace bridge::app::cli
