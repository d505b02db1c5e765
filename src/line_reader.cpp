#include "line_reader.h"
#include "core/constants.h"
#include "logger.h"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace live_relay {

bool LineReader::read_line(const std::function<bool()>& should_stop, std::string& line) {
    while (true) {
        size_t newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        if (eof_) {
            // Final line without a trailing newline
            if (buffer_.empty()) return false;
            line.swap(buffer_);
            buffer_.clear();
            return true;
        }
        if (should_stop && should_stop()) {
            return false;
        }

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, constants::pipeline::POLL_SLICE_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            Logger::error("input poll failed: " + std::string(std::strerror(errno)));
            return false;
        }
        if (ready == 0) continue;

        char chunk[4096];
        ssize_t n = read(fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            Logger::error("input read failed: " + std::string(std::strerror(errno)));
            return false;
        }
        if (n == 0) {
            eof_ = true;
            continue;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

} // namespace live_relay
