#pragma once

#include <expected>
#include <string>
#include <memory>
#include <map>
#include <vector>
#include <source_location>

namespace ydispatch {

// Error kinds reported by the dispatch core
enum class ErrorCode {
    Generic,
    DoesNotExist,      // emit/bind on a name that was never registered
    EventExists,       // property declared over an existing event name
    PropertyExists,    // event declared over an existing property name
    InvalidType,
    NoneNotAllowed,
    OutOfRange,
    Validation,        // custom validator rejected a value
    BindingContext,    // coroutine callback without a resolvable loop
    IndexError,
    KeyError,
    ValueNotFound,
    TaskFailed,
    Config
};

[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Generic: return "Generic";
        case ErrorCode::DoesNotExist: return "DoesNotExist";
        case ErrorCode::EventExists: return "EventExists";
        case ErrorCode::PropertyExists: return "PropertyExists";
        case ErrorCode::InvalidType: return "InvalidType";
        case ErrorCode::NoneNotAllowed: return "NoneNotAllowed";
        case ErrorCode::OutOfRange: return "OutOfRange";
        case ErrorCode::Validation: return "Validation";
        case ErrorCode::BindingContext: return "BindingContext";
        case ErrorCode::IndexError: return "IndexError";
        case ErrorCode::KeyError: return "KeyError";
        case ErrorCode::ValueNotFound: return "ValueNotFound";
        case ErrorCode::TaskFailed: return "TaskFailed";
        case ErrorCode::Config: return "Config";
    }
    return "Unknown";
}

[[nodiscard]] inline bool is_exists_error(ErrorCode code) {
    return code == ErrorCode::EventExists || code == ErrorCode::PropertyExists;
}

[[nodiscard]] inline bool is_validation_error(ErrorCode code) {
    return code == ErrorCode::InvalidType || code == ErrorCode::NoneNotAllowed ||
           code == ErrorCode::OutOfRange || code == ErrorCode::Validation;
}

// Error with a kind, chaining and source location
class Error {
public:
    explicit Error(std::string msg, std::source_location loc = std::source_location::current())
        : _code(ErrorCode::Generic), _msg(std::move(msg)), _loc(loc) {}

    Error(ErrorCode code, std::string msg, std::source_location loc = std::source_location::current())
        : _code(code), _msg(std::move(msg)), _loc(loc) {}

    // Wrapping keeps the kind of the error being wrapped
    Error(std::string msg, Error prev_error, std::source_location loc = std::source_location::current())
        : _code(prev_error.code()), _msg(std::move(msg)),
          _prev_error(std::make_unique<Error>(std::move(prev_error))), _loc(loc) {}

    Error(ErrorCode code, std::string msg, Error prev_error, std::source_location loc = std::source_location::current())
        : _code(code), _msg(std::move(msg)),
          _prev_error(std::make_unique<Error>(std::move(prev_error))), _loc(loc) {}

    Error(const Error& other)
        : _code(other._code), _msg(other._msg), _loc(other._loc) {
        if (other._prev_error) _prev_error = std::make_unique<Error>(*other._prev_error);
    }

    Error& operator=(const Error& other) {
        if (this != &other) {
            _code = other._code;
            _msg = other._msg;
            _loc = other._loc;
            _prev_error = other._prev_error ? std::make_unique<Error>(*other._prev_error) : nullptr;
        }
        return *this;
    }

    Error(Error&&) = default;
    Error& operator=(Error&&) = default;

    [[nodiscard]] ErrorCode code() const { return _code; }
    [[nodiscard]] const std::string& message() const { return _msg; }
    [[nodiscard]] const Error* prev_error() const { return _prev_error.get(); }
    [[nodiscard]] const std::source_location& location() const { return _loc; }

    // Message of the innermost error in the chain
    [[nodiscard]] const std::string& root_message() const {
        const Error* e = this;
        while (e->_prev_error) e = e->_prev_error.get();
        return e->_msg;
    }

    [[nodiscard]] std::string to_string() const {
        std::string result = "[";
        result += error_code_name(_code);
        result += "] ";
        result += _msg;
        result += " [";
        result += _loc.file_name();
        result += ":";
        result += std::to_string(_loc.line());
        result += "]";
        if (_prev_error) {
            result += " <- ";
            result += _prev_error->to_string();
        }
        return result;
    }

    void build_tree_recursive(std::vector<std::map<std::string, std::string>>& entries) const {
        std::map<std::string, std::string> entry;
        entry["error"] = _msg;
        entry["code"] = error_code_name(_code);
        entry["location"] = std::string(_loc.file_name()) + ":" + std::to_string(_loc.line());
        entries.push_back(entry);
        if (_prev_error) {
            _prev_error->build_tree_recursive(entries);
        }
    }

    // Flattened error chain, outermost first
    [[nodiscard]] std::vector<std::map<std::string, std::string>> as_tree() const {
        std::vector<std::map<std::string, std::string>> entries;
        build_tree_recursive(entries);
        return entries;
    }

private:
    ErrorCode _code;
    std::string _msg;
    std::unique_ptr<Error> _prev_error;
    std::source_location _loc;
};

template<typename T>
using Result = std::expected<T, Error>;

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

template<typename T, typename U>
[[nodiscard]] inline std::unexpected<Error> Err(ErrorCode code, std::string msg, const Result<U>& prev, std::source_location loc = std::source_location::current()) {
    if (!prev.has_value()) {
        return std::unexpected(Error(code, std::move(msg), prev.error(), loc));
    }
    return std::unexpected(Error(code, std::move(msg), loc));
}

template<typename T>
[[nodiscard]] inline std::string error_msg(const Result<T>& res) {
    return res.has_value() ? "" : res.error().to_string();
}

template<typename T>
[[nodiscard]] inline ErrorCode error_code(const Result<T>& res) {
    return res.has_value() ? ErrorCode::Generic : res.error().code();
}

} // namespace ydispatch
