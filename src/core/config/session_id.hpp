#pragma once
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace bridge::core::config {

    // "<prefix>-" followed by 8 lowercase hex digits, e.g. "session-0f3a91c2".
    // Tags every log line and audit record of one bridge process.
    inline std::string generate_session_id(const std::string& prefix = "session") {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<std::uint32_t> dis;

        std::ostringstream out;
        out << prefix << '-' << std::hex << std::setw(8) << std::setfill('0') << dis(gen);
        return out.str();
    }

} // namespace bridge::core::config
