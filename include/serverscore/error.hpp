#pragma once

#include "serverscore/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>
#include <functional>

namespace serverscore {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Success = 0,
    Unknown,
    InvalidArgument,
    OutOfRange,

    // Cryptography errors
    CryptoInitFailed,
    CryptoSignatureFailed,
    CryptoVerificationFailed,
    CryptoKeyGenerationFailed,
    InvalidPublicKey,
    InvalidSignatureEncoding,

    // Report errors
    MalformedReport,
    SanityViolation,
    IntegrityFailure,
    SignatureFailure,
    ReplayDetected,
    ClockDrift,

    // Configuration errors
    ConfigurationError,

    // Collaborator errors
    ReportSourceUnavailable,
    PublicKeyNotFound,
    WeightPublishFailed,

    // Serialization errors
    SerializationFailed,
    DeserializationFailed,
    InvalidFormat
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

// Error class with structured information
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& details() const { return details_; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
};

// Result type for error handling
template<typename T>
class Result {
public:
    static Result Ok(T value) {
        return Result(std::move(value));
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    bool is_ok() const { return std::holds_alternative<T>(value_); }
    bool is_err() const { return std::holds_alternative<Error>(value_); }

    // Get the value (throws if error)
    T& value() {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    // Get the error (throws if ok)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<Error>(value_);
    }

    T value_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return default_value;
    }

    // Unwrap or throw custom error
    T expect(const std::string& message) {
        if (is_err()) {
            throw std::runtime_error(message + ": " + error().to_string());
        }
        return value();
    }

    std::optional<T> ok() const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return std::nullopt;
    }

    std::optional<Error> err() const {
        if (is_err()) {
            return std::get<Error>(value_);
        }
        return std::nullopt;
    }

private:
    explicit Result(T value) : value_(std::move(value)) {}
    explicit Result(Error error) : value_(std::move(error)) {}

    std::variant<T, Error> value_;
};

// Specialized Result<void> for operations that don't return a value
template<>
class Result<void> {
public:
    static Result Ok() {
        return Result(true);
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }

    const Error& error() const {
        if (!error_) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return *error_;
    }

    void expect(const std::string& message) {
        if (is_err()) {
            throw std::runtime_error(message + ": " + error().to_string());
        }
    }

private:
    explicit Result(bool) : error_(std::nullopt) {}
    explicit Result(Error error) : error_(std::move(error)) {}

    std::optional<Error> error_;
};

// Custom exception classes
class ServerScoreException : public std::runtime_error {
public:
    ServerScoreException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class CryptoException : public ServerScoreException {
public:
    CryptoException(ErrorCode code, const std::string& message)
        : ServerScoreException(code, "Crypto error: " + message) {}
};

// Raised only while building a scoring configuration, never per report
class ConfigException : public ServerScoreException {
public:
    explicit ConfigException(const std::string& message)
        : ServerScoreException(ErrorCode::ConfigurationError, "Configuration error: " + message) {}
};

// Utility macros for error handling
#define SERVERSCORE_TRY(expr) \
    do { \
        auto __result = (expr); \
        if (__result.is_err()) { \
            return decltype(__result)::Err(__result.error()); \
        } \
    } while (0)

} // namespace serverscore
