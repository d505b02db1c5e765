#include "mcp/child_process.h"
#include "logger.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace live_relay {
namespace mcp {

namespace {

std::once_flag g_sigpipe_once;

// A child dying mid-write must surface as EPIPE, not kill the process.
void ignore_sigpipe() {
    std::call_once(g_sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv(*entry);
        size_t eq = kv.find('=');
        if (eq == std::string::npos) continue;
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& kv : overrides) {
        merged[kv.first] = kv.second;
    }

    std::vector<std::string> env;
    env.reserve(merged.size());
    for (const auto& kv : merged) {
        env.push_back(kv.first + "=" + kv.second);
    }
    return env;
}

} // namespace

ChildProcess::~ChildProcess() {
    terminate(std::chrono::milliseconds(0));
}

Result<void> ChildProcess::spawn(const ProcessSpec& spec) {
    if (pid_ > 0) {
        return make_state_error("Process already started");
    }
    if (spec.command.empty()) {
        return make_process_error("Empty server command");
    }
    ignore_sigpipe();

    // Close-on-exec from the start: a child forked by a concurrent spawn must not
    // inherit our ends, or EOF on this child's stdout would never arrive
    int in_pipe[2];
    int out_pipe[2];
    if (pipe2(in_pipe, O_CLOEXEC) != 0) {
        return make_process_error(errno_message("pipe"));
    }
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        std::string msg = errno_message("pipe");
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        return make_process_error(msg);
    }

    // Built before fork: only async-signal-safe calls are allowed in the child
    std::vector<std::string> argv_storage;
    argv_storage.push_back(spec.command);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& arg : argv_storage) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = build_environment(spec.env);
    std::vector<char*> envp;
    for (auto& entry : env_storage) envp.push_back(const_cast<char*>(entry.c_str()));
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        std::string msg = errno_message("fork");
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return make_process_error(msg);
    }

    if (pid == 0) {
        // dup2 clears close-on-exec on the targets
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        signal(SIGPIPE, SIG_DFL);
        execvpe(argv[0], argv.data(), envp.data());
        _exit(127);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    pid_ = pid;
    exited_ = false;
    read_buffer_.clear();

    Logger::debug("[MCP] Spawned '" + spec.command + "' pid " + std::to_string(pid_));
    return Result<void>();
}

bool ChildProcess::is_alive() {
    if (pid_ <= 0 || exited_) {
        return false;
    }
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        exited_ = true;
        return false;
    }
    return r == 0;
}

Result<void> ChildProcess::write_line(const std::string& line) {
    if (stdin_fd_ < 0) {
        return make_state_error("Server process not started");
    }
    std::string data = line + "\n";
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_io_error(errno_message("write to server"));
        }
        written += static_cast<size_t>(n);
    }
    return Result<void>();
}

Result<std::string> ChildProcess::read_line(std::chrono::steady_clock::time_point deadline) {
    if (stdout_fd_ < 0) {
        return make_state_error("Server process not started");
    }

    while (true) {
        size_t nl = read_buffer_.find('\n');
        if (nl != std::string::npos) {
            std::string line = read_buffer_.substr(0, nl);
            read_buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return make_timeout_error("Request timeout");
        }

        struct pollfd pfd;
        pfd.fd = stdout_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int pr = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (pr < 0) {
            if (errno == EINTR) continue;
            return make_io_error(errno_message("poll"));
        }
        if (pr == 0) {
            continue;
        }

        char chunk[4096];
        ssize_t n = ::read(stdout_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return make_io_error(errno_message("read from server"));
        }
        if (n == 0) {
            return make_io_error("No response from server");
        }
        read_buffer_.append(chunk, static_cast<size_t>(n));
    }
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
    close_pipes();
    if (pid_ <= 0) {
        return;
    }

    if (!exited_) {
        kill(pid_, SIGTERM);
        auto deadline = std::chrono::steady_clock::now() + grace;
        while (true) {
            int status = 0;
            pid_t r = waitpid(pid_, &status, WNOHANG);
            if (r == pid_ || (r < 0 && errno == ECHILD)) {
                exited_ = true;
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (!exited_) {
            Logger::warn("[MCP] pid " + std::to_string(pid_) + " ignored SIGTERM, killing");
            kill(pid_, SIGKILL);
            int status = 0;
            while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
            exited_ = true;
        }
    }
    pid_ = -1;
}

void ChildProcess::close_pipes() {
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
    if (stdout_fd_ >= 0) {
        ::close(stdout_fd_);
        stdout_fd_ = -1;
    }
    read_buffer_.clear();
}

} // namespace mcp
} // namespace live_relay
