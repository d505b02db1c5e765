#pragma once

#include <functional>
#include <string>

namespace live_relay {

/**
 * @brief Newline-delimited reads from a file descriptor
 *
 * Polls in short slices so a blocked read notices a stop request.
 */
class LineReader {
public:
    explicit LineReader(int fd) : fd_(fd) {}

    /**
     * @brief Read the next line without its terminator
     * @param should_stop Checked between poll slices
     * @return false on EOF (after buffered lines), read error or stop
     */
    bool read_line(const std::function<bool()>& should_stop, std::string& line);

    bool eof() const { return eof_ && buffer_.empty(); }

private:
    int fd_;
    std::string buffer_;
    bool eof_ = false;
};

} // namespace live_relay
