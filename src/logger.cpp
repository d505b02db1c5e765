#include "logger.h"
#include "utils.h"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace live_relay {

namespace {

const char* level_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

thread_local std::string t_thread_tag;

// Serializes the bare-stderr fallback with initialized output
std::mutex g_console_mutex;

} // namespace

class Logger::Impl {
public:
    Impl(LogLevel min_level, const std::string& output_file)
        : min_level_(min_level) {
        if (output_file.empty()) {
            return;
        }
        file_.open(output_file, std::ios::app);
        if (!file_.is_open()) {
            std::lock_guard<std::mutex> lock(g_console_mutex);
            std::cerr << "Warning: cannot open log file " << output_file << ", logging to stderr only\n";
        }
    }

    bool enabled(LogLevel level) const { return level >= min_level_; }

    void write(const std::string& line) {
        std::lock_guard<std::mutex> lock(g_console_mutex);
        std::cerr << line << '\n';
        if (file_.is_open()) {
            file_ << line << '\n';
            file_.flush();
        }
    }

private:
    const LogLevel min_level_;
    std::ofstream file_;
};

std::unique_ptr<Logger::Impl> Logger::impl_ = nullptr;

void Logger::initialize(LogLevel min_level, const std::string& output_file) {
    if (!impl_) {
        impl_ = std::make_unique<Impl>(min_level, output_file);
    }
}

void Logger::shutdown() {
    impl_.reset();
}

std::string Logger::format_line(LogLevel level, const std::string& tag, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << "[" << level_string(level) << "] "
        << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();
    if (!tag.empty()) {
        oss << " " << tag;
    }
    oss << ": " << message;
    return oss.str();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (impl_) {
        if (impl_->enabled(level)) {
            impl_->write(format_line(level, t_thread_tag, message));
        }
        return;
    }
    // Not initialized (tests, early startup): INFO and up, unformatted
    if (level >= LogLevel::INFO) {
        std::lock_guard<std::mutex> lock(g_console_mutex);
        std::cerr << message << '\n';
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::set_thread_tag(const std::string& tag) {
    t_thread_tag = tag;
}

LogLevel Logger::parse_level(const std::string& name, LogLevel fallback) {
    std::string n = utils::normalize_copy(utils::trim_copy(name));
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "info") return LogLevel::INFO;
    if (n == "warn" || n == "warning") return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    return fallback;
}

} // namespace live_relay
