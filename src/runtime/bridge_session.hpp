#pragma once

#include <cstddef>
#include <istream>
#include <memory>
#include "core/errors/bridge_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "session/response_writer.hpp"
#include "tools/tool_dispatcher.hpp"

namespace bridge::runtime {

struct SessionStats {
    std::size_t lines_in = 0;
    std::size_t lines_out = 0;
    std::size_t failures = 0;
};

// Drives one stdio session: every input line becomes an independent unit of
// work (decode -> dispatch -> backend), at most max_in_flight of them run at
// once, and a single writer thread emits their responses in input order.
class BridgeSession {
public:
    BridgeSession(std::shared_ptr<const tools::ToolDispatcher> dispatcher,
                  std::shared_ptr<session::ResponseWriter> writer,
                  std::size_t max_in_flight = 4);

    // Runs until input EOF (returns stats) or until the output stream is
    // lost (returns an output_closed error).
    core::errors::Result<SessionStats> run(std::istream& in);

    // Decode and dispatch a single line. Never throws.
    protocol::Outcome process_line(const std::string& line) const;

private:
    std::shared_ptr<const tools::ToolDispatcher> dispatcher_;
    std::shared_ptr<session::ResponseWriter> writer_;
    std::size_t max_in_flight_;
};

}  // namespace bridge::runtime
