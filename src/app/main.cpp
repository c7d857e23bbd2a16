#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "backend/backend_client.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "runtime/bridge_session.hpp"
#include "session/audit_log.hpp"
#include "session/response_writer.hpp"
#include "tools/tool_dispatcher.hpp"
#include "tools/tool_registry.hpp"

int main(int argc, char* argv[]) {
    // 1. Generate a unique Session ID and register it with the Global Logger
    const std::string session_id = bridge::core::config::generate_session_id();
    bridge::core::logging::Logger::get().set_session_id(session_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = bridge::app::cli::parse_and_validate(argc, argv);
    if (bridge::core::errors::is_error(parsed)) {
        const auto& err = bridge::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = bridge::core::errors::get_value(parsed);

    if (options.show_help) {
        std::cerr << bridge::app::cli::usage() << std::endl;
        return 0;
    }

    if (options.verbose) {
        bridge::core::logging::Logger::get().set_min_level(bridge::core::logging::LogLevel::DEBUG);
    }
    if (options.log_file.has_value() &&
        !bridge::core::logging::Logger::get().set_log_file(options.log_file.value())) {
        LOG_WARN("Unable to open log file " + options.log_file->string() +
                 "; logging to stderr only");
    }

    // 3. Build the static tool registry
    auto registry = bridge::tools::ToolRegistry::create(bridge::tools::with_forward_routes(
        bridge::tools::default_tool_entries(), options.routes));
    if (bridge::core::errors::is_error(registry)) {
        const auto& err = bridge::core::errors::get_error(registry);
        LOG_ERROR("Invalid tool registry [" + err.code + "]: " + err.message);
        return 2;
    }
    const auto& tool_registry = bridge::core::errors::get_value(registry);

    if (options.list_tools) {
        for (const auto& entry : tool_registry.entries()) {
            nlohmann::json line;
            line["name"] = entry.name;
            line["action"] = bridge::tools::to_string(entry.action);
            if (entry.action == bridge::tools::ToolAction::Forward) {
                line["endpoint"] = options.backend_url + entry.forward_path;
            }
            line["description"] = entry.description;
            std::cout << line.dump() << '\n';
        }
        std::cout.flush();
        return 0;
    }

    // 4. Wire the pipeline
    bridge::backend::CurlGlobalScope curl_scope;
    if (!curl_scope.ok()) {
        LOG_ERROR("Failed to initialise libcurl");
        return 3;
    }
    // A vanished caller must surface as a write error, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    bridge::backend::BackendConfig backend_config;
    backend_config.base_url = options.backend_url;
    backend_config.timeout_ms = options.timeout_ms;
    backend_config.connect_timeout_ms = options.connect_timeout_ms;

    auto dispatcher = std::make_shared<const bridge::tools::ToolDispatcher>(
        tool_registry, std::make_shared<bridge::backend::CurlBackendClient>(backend_config));
    auto audit = std::make_shared<bridge::session::AuditLog>(options.audit_log, session_id);
    auto writer = std::make_shared<bridge::session::ResponseWriter>(std::cout, audit);
    bridge::runtime::BridgeSession session(dispatcher, writer, options.max_in_flight);

    LOG_INFO("Bridge ready: backend=" + options.backend_url + " tools=" +
             std::to_string(tool_registry.size()) + " audit=" + options.audit_log.string());

    // 5. Serve until EOF or until the caller goes away
    auto result = session.run(std::cin);
    if (bridge::core::errors::is_error(result)) {
        const auto& err = bridge::core::errors::get_error(result);
        LOG_ERROR("Session ended [" + err.code + "]: " + err.message);
        return 1;
    }

    const auto& stats = bridge::core::errors::get_value(result);
    LOG_INFO("Session finished: lines_in=" + std::to_string(stats.lines_in) +
             " lines_out=" + std::to_string(stats.lines_out) +
             " failures=" + std::to_string(stats.failures));
    return 0;
}
