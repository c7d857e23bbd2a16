#include "session/audit_log.hpp"

#include <chrono>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace bridge::session {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

}  // namespace

AuditLog::AuditLog(std::filesystem::path log_path, std::string session_id)
    : log_path_(std::move(log_path)), session_id_(std::move(session_id)) {}

core::errors::Result<std::filesystem::path> AuditLog::append(
    const std::string& input_line, const std::string& output_line) {
    AuditRecord record;
    record.ts_unix_ms = now_unix_ms();
    record.session_id = session_id_;
    record.input = input_line;
    record.output = output_line;
    return append(record);
}

core::errors::Result<std::filesystem::path> AuditLog::append(const AuditRecord& record) {
    if (log_path_.empty()) {
        return BridgeError{ErrorCategory::Input, "Audit log path cannot be empty.",
                           "invalid_audit_path"};
    }

    json event;
    event["ts_unix_ms"] = record.ts_unix_ms;
    event["session_id"] = record.session_id;
    event["input"] = record.input;
    event["output"] = record.output;
    // Raw input may hold invalid UTF-8; it is recorded with replacement characters.
    const std::string line = event.dump(-1, ' ', false, json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    const auto parent = log_path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return BridgeError{ErrorCategory::Internal,
                               "Unable to create audit directory: " + parent.string(),
                               "audit_dir_create_failed"};
        }
    }

    std::ofstream out(log_path_, std::ios::app);
    if (!out.is_open()) {
        return BridgeError{ErrorCategory::Internal,
                           "Unable to open audit log: " + log_path_.string(),
                           "audit_open_failed"};
    }

    out << line << "\n";
    out.flush();
    if (!out.good()) {
        return BridgeError{ErrorCategory::Internal,
                           "Unable to write audit record: " + log_path_.string(),
                           "audit_write_failed"};
    }

    return log_path_;
}

}  // namespace bridge::session
