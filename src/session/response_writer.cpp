#include "session/response_writer.hpp"

#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace bridge::session {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

std::string serialize_outcome(const protocol::Outcome& outcome) {
    json response;
    if (core::errors::is_error(outcome)) {
        response["error"] = core::errors::get_error(outcome).message;
    } else {
        response["result"] = core::errors::get_value(outcome);
    }
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

ResponseWriter::ResponseWriter(std::ostream& out, std::shared_ptr<AuditLog> audit)
    : out_(out), audit_(std::move(audit)) {}

core::errors::Result<std::string> ResponseWriter::write(const std::string& raw_input,
                                                        const protocol::Outcome& outcome) {
    const std::string line = serialize_outcome(outcome);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << line << '\n';
        out_.flush();
        if (!out_.good()) {
            return BridgeError{ErrorCategory::Internal, "Output stream closed.",
                               "output_closed"};
        }
    }
    LOG_DEBUG("Sent response: " + line);

    if (audit_) {
        auto appended = audit_->append(raw_input, line);
        if (core::errors::is_error(appended)) {
            const auto& err = core::errors::get_error(appended);
            LOG_WARN("Audit append failed [" + err.code + "]: " + err.message);
        }
    }

    return line;
}

}  // namespace bridge::session
