#include "session/line_reader.hpp"

namespace bridge::session {

LineReader::LineReader(std::istream& in) : in_(in) {}

std::optional<std::string> LineReader::next() {
    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    ++lines_read_;
    return line;
}

}  // namespace bridge::session
