#pragma once

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>

namespace parley {

/**
 * @brief Error types for different failure modes
 *
 * PermissionDenied is fatal to a conversation; RecognitionError,
 * SynthesisTransportError and DeviceError are recoverable (the turn is
 * driven back to listening); DecodeError is per-chunk and only logged.
 */
enum class ErrorType {
    None,
    PermissionDenied,
    RecognitionError,
    SynthesisTransportError,
    DecodeError,
    DeviceError,
    ConfigError,
    InvalidState,
    ParseError,
    Unknown
};

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }
};

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::PermissionDenied: return "PermissionDenied";
        case ErrorType::RecognitionError: return "RecognitionError";
        case ErrorType::SynthesisTransportError: return "SynthesisTransportError";
        case ErrorType::DecodeError: return "DecodeError";
        case ErrorType::DeviceError: return "DeviceError";
        case ErrorType::ConfigError: return "ConfigError";
        case ErrorType::InvalidState: return "InvalidState";
        case ErrorType::ParseError: return "ParseError";
        default: return "Unknown";
    }
}

inline std::string to_string(const Error& error) {
    return std::string(error_type_name(error.type)) + ": " + error.message;
}

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    // Construct from value (success)
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    // Construct from error
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
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

using VoidResult = Result<void>;

// Helper functions for creating errors
inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_permission_error(const std::string& message) {
    return Error(ErrorType::PermissionDenied, message);
}

inline Error make_recognition_error(const std::string& message) {
    return Error(ErrorType::RecognitionError, message);
}

inline Error make_transport_error(const std::string& message) {
    return Error(ErrorType::SynthesisTransportError, message);
}

inline Error make_decode_error(const std::string& message) {
    return Error(ErrorType::DecodeError, message);
}

inline Error make_device_error(const std::string& message) {
    return Error(ErrorType::DeviceError, message);
}

inline Error make_state_error(const std::string& message) {
    return Error(ErrorType::InvalidState, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

} // namespace parley
