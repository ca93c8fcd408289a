// =============================================================================
// PortalBridge - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that carries either a success value or an error.
// Handlers, the dispatcher and the transports pass failures upward as values;
// nothing below a transport boundary reports errors by throwing.
//
// Usage:
//   Result<int> parse_port(const std::string& s) {
//       if (s.empty()) return Err<int>(ErrorCode::MissingParameter, "port");
//       return Ok(std::stoi(s));
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace portal {

// =============================================================================
// Error Taxonomy
// =============================================================================

enum class ErrorCode : int {
    None = 0,
    UnknownAction,     // action name / path not in the table
    MissingParameter,  // required field absent (package, text)
    OperationFailed,   // device call returned failure
    Unauthorized,      // bearer token mismatch
    MalformedInput,    // unparseable JSON / body / base64
    QueueFull,         // reverse connection queue at capacity
    Queued,            // accepted into the reverse connection queue
    Timeout,           // wait condition not met in time
    Cancelled,         // wait aborted through its token
};

inline const char* errorCodeName(ErrorCode c) {
    switch (c) {
        case ErrorCode::None:             return "None";
        case ErrorCode::UnknownAction:    return "UnknownAction";
        case ErrorCode::MissingParameter: return "MissingParameter";
        case ErrorCode::OperationFailed:  return "OperationFailed";
        case ErrorCode::Unauthorized:     return "Unauthorized";
        case ErrorCode::MalformedInput:   return "MalformedInput";
        case ErrorCode::QueueFull:        return "QueueFull";
        case ErrorCode::Queued:           return "Queued";
        case ErrorCode::Timeout:          return "Timeout";
        case ErrorCode::Cancelled:        return "Cancelled";
    }
    return "Unknown";
}

// =============================================================================
// Error Types
// =============================================================================

// Generic error with message
struct Error {
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    explicit Error(const char* msg, int c = 0) : message(msg), code(c) {}
    Error(ErrorCode c, std::string msg) : message(std::move(msg)), code(static_cast<int>(c)) {}

    ErrorCode kind() const { return static_cast<ErrorCode>(code); }
    bool is(ErrorCode c) const { return code == static_cast<int>(c); }

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

// IO error (config file, sockets)
struct IoError : Error {
    enum class Kind {
        NotFound,
        PermissionDenied,
        ConnectionRefused,
        Timeout,
        Other
    };
    Kind kind = Kind::Other;

    IoError() = default;
    explicit IoError(std::string msg, Kind k = Kind::Other)
        : Error(std::move(msg)), kind(k) {}
};

// =============================================================================
// Result<T, E> Type
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Error constructor (from E or derived)
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    explicit operator bool() const { return is_ok(); }

    // Access value (throws if error)
    T& value() & {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    // Access error (throws if success)
    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    T value_or(T default_value) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(default_value);
    }

    std::optional<T> ok() const& {
        if (is_ok()) return std::get<0>(data_);
        return std::nullopt;
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<1>(data_);
        return std::nullopt;
    }

    template<typename F>
    auto map(F&& f) const& -> Result<decltype(f(std::declval<T>())), E> {
        using U = decltype(f(std::declval<T>()));
        if (is_ok()) return Result<U, E>(f(std::get<0>(data_)));
        return Result<U, E>(std::get<1>(data_));
    }

    template<typename F>
    auto map_err(F&& f) const& -> Result<T, decltype(f(std::declval<E>()))> {
        using U = decltype(f(std::declval<E>()));
        if (is_err()) return Result<T, U>(f(std::get<1>(data_)));
        return Result<T, U>(std::get<0>(data_));
    }

    T expect(const char* msg) const& {
        if (is_err()) throw std::runtime_error(std::string(msg) + ": " + error().message);
        return std::get<0>(data_);
    }

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E> Specialization
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    void value() const {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
    }

    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<E>(data_);
        return std::nullopt;
    }

private:
    std::variant<std::monostate, E> data_;
};

// =============================================================================
// Helper Functions
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T, typename E = Error>
Result<T, E> Err(E error) {
    return Result<T, E>(std::move(error));
}

template<typename T>
Result<T, Error> Err(std::string message, int code = 0) {
    return Result<T, Error>(Error(std::move(message), code));
}

template<typename T>
Result<T, Error> Err(const char* message, int code = 0) {
    return Result<T, Error>(Error(message, code));
}

template<typename T>
Result<T, Error> Err(ErrorCode code, std::string message) {
    return Result<T, Error>(Error(code, std::move(message)));
}

// =============================================================================
// Macros for Early Return
// =============================================================================

// Unwrap result or return its error from the enclosing function.
// Usage: auto value = PORTAL_TRY(some_function());
#define PORTAL_TRY(expr) \
    ({ \
        auto _result = (expr); \
        if (_result.is_err()) return _result.error(); \
        std::move(_result).value(); \
    })

#define PORTAL_TRY_OR(expr, default_val) \
    ((expr).value_or(default_val))

} // namespace portal
