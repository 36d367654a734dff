#pragma once

#include <expected>
#include <source_location>
#include <string>
#include <memory>

namespace lattice {

// Error categories surfaced to the host
enum class ErrorCode {
    Generic,
    // Template compilation
    MalformedMarkup,
    UnknownReusable,
    CyclicReuse,
    UnboundLocal,
    // Data binding
    UnboundKey,
    WrongKind,
    // Ambient
    InvalidConfig,
    Io,
    SinkFailed,
};

[[nodiscard]] inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Generic: return "Generic";
        case ErrorCode::MalformedMarkup: return "MalformedMarkup";
        case ErrorCode::UnknownReusable: return "UnknownReusable";
        case ErrorCode::CyclicReuse: return "CyclicReuse";
        case ErrorCode::UnboundLocal: return "UnboundLocal";
        case ErrorCode::UnboundKey: return "UnboundKey";
        case ErrorCode::WrongKind: return "WrongKind";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::Io: return "Io";
        case ErrorCode::SinkFailed: return "SinkFailed";
    }
    return "Unknown";
}

// Error with chaining and source location
class Error {
public:
    explicit Error(std::string msg, std::source_location loc = std::source_location::current())
        : _msg(std::move(msg)), _loc(loc) {}

    Error(ErrorCode code, std::string msg, std::source_location loc = std::source_location::current())
        : _msg(std::move(msg)), _code(code), _loc(loc) {}

    // Wrapping keeps the code of the wrapped error
    Error(std::string msg, Error prev_error, std::source_location loc = std::source_location::current())
        : _msg(std::move(msg)), _code(prev_error.code()),
          _prev_error(std::make_unique<Error>(std::move(prev_error))), _loc(loc) {}

    // Wrapping under a new code
    Error(ErrorCode code, std::string msg, Error prev_error, std::source_location loc = std::source_location::current())
        : _msg(std::move(msg)), _code(code),
          _prev_error(std::make_unique<Error>(std::move(prev_error))), _loc(loc) {}

    Error(const Error& other)
        : _msg(other._msg), _code(other._code), _loc(other._loc) {
        if (other._prev_error) _prev_error = std::make_unique<Error>(*other._prev_error);
    }

    Error& operator=(const Error& other) {
        if (this != &other) {
            _msg = other._msg;
            _code = other._code;
            _loc = other._loc;
            _prev_error = other._prev_error ? std::make_unique<Error>(*other._prev_error) : nullptr;
        }
        return *this;
    }

    Error(Error&&) = default;
    Error& operator=(Error&&) = default;

    [[nodiscard]] const std::string& message() const { return _msg; }
    [[nodiscard]] ErrorCode code() const { return _code; }
    [[nodiscard]] const Error* prev_error() const { return _prev_error.get(); }
    [[nodiscard]] const std::source_location& location() const { return _loc; }

    // Innermost error of the chain
    [[nodiscard]] const Error& root_cause() const {
        const Error* e = this;
        while (e->_prev_error) e = e->_prev_error.get();
        return *e;
    }

    // "msg (Code) [file:line] <- inner msg [file:line] ..."; the code is printed once, on the innermost error
    [[nodiscard]] std::string to_string() const {
        std::string result;
        for (const Error* e = this; e; e = e->_prev_error.get()) {
            if (e != this) {
                result += " <- ";
            }
            result += e->_msg;
            if (!e->_prev_error && e->_code != ErrorCode::Generic) {
                result += " (";
                result += lattice::to_string(e->_code);
                result += ")";
            }
            result += " [";
            result += e->_loc.file_name();
            result += ":";
            result += std::to_string(e->_loc.line());
            result += "]";
        }
        return result;
    }

private:
    std::string _msg;
    ErrorCode _code = ErrorCode::Generic;
    std::unique_ptr<Error> _prev_error;
    std::source_location _loc;
};

template<typename T>
using Result = std::expected<T, Error>;

// Helper functions for creating results
template<typename T>
[[nodiscard]] inline Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

[[nodiscard]] inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
[[nodiscard]] inline std::unexpected<Error> Err(std::string msg, std::source_location loc = std::source_location::current()) {
    return std::unexpected(Error(std::move(msg), loc));
}

template<typename T = void>
[[nodiscard]] inline std::unexpected<Error> Err(ErrorCode code, std::string msg, std::source_location loc = std::source_location::current()) {
    return std::unexpected(Error(code, std::move(msg), loc));
}

template<typename T, typename U>
[[nodiscard]] inline std::unexpected<Error> Err(std::string msg, const Result<U>& prev, std::source_location loc = std::source_location::current()) {
    if (!prev.has_value()) {
        return std::unexpected(Error(std::move(msg), prev.error(), loc));
    }
    return std::unexpected(Error(std::move(msg), loc));
}

// Get error message from result
template<typename T>
[[nodiscard]] inline std::string error_msg(const Result<T>& res) {
    return res.has_value() ? "" : res.error().to_string();
}

// Get error code from result (Generic when the result holds a value)
template<typename T>
[[nodiscard]] inline ErrorCode error_code(const Result<T>& res) {
    return res.has_value() ? ErrorCode::Generic : res.error().code();
}

} // namespace lattice
