#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>

namespace bridge::session {

// Yields one line per call with the terminator (and a trailing '\r') removed.
// A final line without a terminator is still yielded once the stream ends.
class LineReader {
public:
    explicit LineReader(std::istream& in);

    std::optional<std::string> next();

    std::size_t lines_read() const { return lines_read_; }

private:
    std::istream& in_;
    std::size_t lines_read_ = 0;
};

}  // namespace bridge::session
