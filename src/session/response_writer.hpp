#pragma once

#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include "core/errors/bridge_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "session/audit_log.hpp"

namespace bridge::session {

// {"result":<value>} or {"error":"<message>"}, compact, no trailing newline.
std::string serialize_outcome(const protocol::Outcome& outcome);

class ResponseWriter {
public:
    // audit may be null, in which case no audit records are kept.
    ResponseWriter(std::ostream& out, std::shared_ptr<AuditLog> audit);

    // Writes exactly one line and returns it. An error means the primary
    // output is gone; audit failures are only logged.
    core::errors::Result<std::string> write(const std::string& raw_input,
                                            const protocol::Outcome& outcome);

private:
    std::ostream& out_;
    std::shared_ptr<AuditLog> audit_;
    std::mutex mutex_;
};

}  // namespace bridge::session
