#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace live_relay {

/**
 * @brief Failure categories
 *
 * NetworkError covers the AI session transport; ProcessError and Timeout
 * come from tool server children; ResourceError means a capture or
 * playback device could not be used.
 */
enum class ErrorType {
    None,
    IOError,
    NetworkError,
    ParseError,
    InvalidState,
    ResourceError,
    Timeout,
    ProcessError,
    Unknown
};

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None:          return "none";
        case ErrorType::IOError:       return "io";
        case ErrorType::NetworkError:  return "network";
        case ErrorType::ParseError:    return "parse";
        case ErrorType::InvalidState:  return "state";
        case ErrorType::ResourceError: return "resource";
        case ErrorType::Timeout:       return "timeout";
        case ErrorType::ProcessError:  return "process";
        default: return "unknown";
    }
}

struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }

    /// "<category>: <message>", for logs. Events carry message alone.
    std::string describe() const {
        return std::string(error_type_name(type)) + ": " + message;
    }
};

/**
 * @brief Either a value of type T or an Error
 *
 * Returned across component boundaries (session, devices, tool servers,
 * command decoding). Failures inside pipeline tasks are thrown instead and
 * recorded by TaskGroup.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_error() const { return std::holds_alternative<Error>(data_); }

    // Throws if error
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result holds error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result holds error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    // Throws if success
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result holds a value, not an error");
        }
        return std::get<Error>(data_);
    }

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<T>(data_) : default_value;
    }

    /// Drop the error; std::nullopt on failure
    std::optional<T> ok() const {
        if (!is_ok()) return std::nullopt;
        return std::get<T>(data_);
    }

    explicit operator bool() const { return is_ok(); }

private:
    std::variant<T, Error> data_;
};

template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_io_error(const std::string& message) {
    return Error(ErrorType::IOError, message);
}

inline Error make_network_error(const std::string& message) {
    return Error(ErrorType::NetworkError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

inline Error make_state_error(const std::string& message) {
    return Error(ErrorType::InvalidState, message);
}

inline Error make_resource_error(const std::string& message) {
    return Error(ErrorType::ResourceError, message);
}

inline Error make_process_error(const std::string& message) {
    return Error(ErrorType::ProcessError, message);
}

inline Error make_timeout_error(const std::string& message = "Operation timed out") {
    return Error(ErrorType::Timeout, message);
}

} // namespace live_relay
