#pragma once
#include <string>
#include "protocol/bridge_options.hpp"
#include "core/errors/bridge_errors.hpp"

namespace bridge::app::cli {
    bridge::core::errors::Result<bridge::protocol::BridgeOptions> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
