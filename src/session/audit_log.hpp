#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include "core/errors/bridge_errors.hpp"

namespace bridge::session {

struct AuditRecord {
    std::int64_t ts_unix_ms = 0;
    std::string session_id;
    std::string input;
    std::string output;
};

// Append-only JSONL file pairing each input line with its output line.
// Appends are serialized; nothing is ever read back or rewritten.
class AuditLog {
public:
    AuditLog(std::filesystem::path log_path, std::string session_id);

    core::errors::Result<std::filesystem::path> append(const std::string& input_line,
                                                       const std::string& output_line);

    core::errors::Result<std::filesystem::path> append(const AuditRecord& record);

private:
    std::filesystem::path log_path_;
    std::string session_id_;
    std::mutex mutex_;
};

}  // namespace bridge::session
