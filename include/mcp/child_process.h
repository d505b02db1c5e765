#pragma once

/**
 * @file child_process.h
 * @brief Subprocess with line-oriented stdin/stdout pipes
 */

#include "errors.h"
#include <chrono>
#include <map>
#include <string>
#include <sys/types.h>
#include <vector>

namespace live_relay {
namespace mcp {

struct ProcessSpec {
    std::string command;                       ///< Resolved through $PATH
    std::vector<std::string> args;
    std::map<std::string, std::string> env;    ///< Added to / overriding the inherited environment
};

/**
 * @brief fork/exec'd child whose stdin and stdout are pipes to this process
 *
 * The child's stderr is inherited. Not thread-safe; the owning client
 * serializes access.
 */
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    Result<void> spawn(const ProcessSpec& spec);

    bool is_started() const { return pid_ > 0; }

    /// True while the child has not exited (checked with waitpid WNOHANG).
    bool is_alive();

    /// Write one line; a newline is appended.
    Result<void> write_line(const std::string& line);

    /**
     * @brief Read one line (without the newline) before the deadline
     *
     * Fails with ErrorType::Timeout when the deadline passes and with
     * ErrorType::IOError on EOF.
     */
    Result<std::string> read_line(std::chrono::steady_clock::time_point deadline);

    /**
     * @brief SIGTERM, wait up to grace, then SIGKILL; reaps the child
     *
     * Safe to call repeatedly.
     */
    void terminate(std::chrono::milliseconds grace);

    pid_t pid() const { return pid_; }

private:
    void close_pipes();

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::string read_buffer_;
    bool exited_ = false;
};

} // namespace mcp
} // namespace live_relay
