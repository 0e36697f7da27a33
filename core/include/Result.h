#pragma once

/**
 * @file Result.h
 * @brief Consistent error handling types for HuffStream
 *
 * Provides a Result<T, E> type similar to Rust's Result or C++23's std::expected.
 * Codec, protocol, transport and configuration failures are all reported
 * through it instead of exceptions.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>

namespace hfs {

/**
 * @brief Error codes for HuffStream operations
 */
enum class ErrorCode {
    Success = 0,

    // Codec errors (100-199)
    CodecError = 100,
    MalformedPayload = 101,
    UnsupportedPayloadVersion = 102,
    TruncatedPayload = 103,
    CodeTableMismatch = 104,
    SizeMismatch = 105,

    // Protocol errors (200-299)
    InvalidCommand = 200,
    FrameTooLarge = 201,
    UnexpectedReply = 202,

    // Transport errors (300-399)
    TransportError = 300,
    ConnectionFailed = 301,
    HandshakeFailed = 302,
    SendFailed = 303,
    ReceiveFailed = 304,
    ConnectionClosed = 305,

    // Configuration errors (400-499)
    ConfigError = 400,
    InvalidConfig = 401,
    MissingConfig = 402,
    MissingTLSMaterial = 403,

    // File system errors (500-599)
    FileNotFound = 500,
    FileReadError = 501,
    FileWriteError = 502,
    DirectoryCreateFailed = 503,

    // General errors (900-999)
    InvalidArgument = 900,
    InternalError = 999
};

/**
 * @brief Convert error code to human-readable string
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::CodecError: return "Codec error";
        case ErrorCode::MalformedPayload: return "Malformed payload";
        case ErrorCode::UnsupportedPayloadVersion: return "Unsupported payload version";
        case ErrorCode::TruncatedPayload: return "Truncated payload";
        case ErrorCode::CodeTableMismatch: return "Code table mismatch";
        case ErrorCode::SizeMismatch: return "Decoded size mismatch";
        case ErrorCode::InvalidCommand: return "Invalid command";
        case ErrorCode::FrameTooLarge: return "Frame too large";
        case ErrorCode::UnexpectedReply: return "Unexpected reply";
        case ErrorCode::TransportError: return "Transport error";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::HandshakeFailed: return "Handshake failed";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::ReceiveFailed: return "Receive failed";
        case ErrorCode::ConnectionClosed: return "Connection closed";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::InvalidConfig: return "Invalid configuration";
        case ErrorCode::MissingConfig: return "Missing configuration";
        case ErrorCode::MissingTLSMaterial: return "Missing TLS material";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileReadError: return "File read error";
        case ErrorCode::FileWriteError: return "File write error";
        case ErrorCode::DirectoryCreateFailed: return "Directory creation failed";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/**
 * @brief Error category, derived from the numeric range of the code
 */
enum class ErrorCategory {
    None,
    Codec,
    Protocol,
    Transport,
    Config,
    FileSystem,
    General
};

inline ErrorCategory categoryOf(ErrorCode code) {
    int value = static_cast<int>(code);
    if (value == 0) return ErrorCategory::None;
    if (value < 200) return ErrorCategory::Codec;
    if (value < 300) return ErrorCategory::Protocol;
    if (value < 400) return ErrorCategory::Transport;
    if (value < 500) return ErrorCategory::Config;
    if (value < 600) return ErrorCategory::FileSystem;
    return ErrorCategory::General;
}

/**
 * @brief Error type with code and optional message
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c) : code(c), message(errorCodeToString(c)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    ErrorCategory category() const { return categoryOf(code); }

    bool operator==(const Error& other) const { return code == other.code; }
    bool operator!=(const Error& other) const { return code != other.code; }
};

/**
 * @brief Result type for operations that can fail
 *
 * @tparam T Success value type
 * @tparam E Error type (defaults to Error)
 *
 * Usage:
 * @code
 * Result<std::vector<uint8_t>> bytes = Codec::decode(payload);
 * if (!bytes) {
 *     std::cout << "Error: " << bytes.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T, typename E = Error>
class Result {
public:
    /// Construct success result
    Result(T value) : data_(std::move(value)) {}

    /// Construct error result
    Result(E error) : data_(std::move(error)) {}

    /// Check if result is success
    bool ok() const { return std::holds_alternative<T>(data_); }

    /// Check if result is success (bool conversion)
    explicit operator bool() const { return ok(); }

    /// Check if result is error
    bool isError() const { return std::holds_alternative<E>(data_); }

    /// Get success value (throws if error)
    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    /// Get success value with default
    T valueOr(T defaultValue) const {
        if (ok()) return std::get<T>(data_);
        return defaultValue;
    }

    /// Get error (throws if success)
    E& error() & { return std::get<E>(data_); }
    const E& error() const& { return std::get<E>(data_); }

    /// Dereference operator (get value)
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(value()); }

    /// Arrow operator (access value members)
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, E> data_;
};

/**
 * @brief Specialization for void success type
 */
template<typename E>
class Result<void, E> {
public:
    /// Construct success result
    Result() : error_(std::nullopt) {}

    /// Construct error result
    Result(E error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }
    bool isError() const { return error_.has_value(); }

    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

/// Create a success result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Create a void success result
inline Result<void> Ok() {
    return Result<void>();
}

/// Create an error result
template<typename T = void>
Result<T> Err(ErrorCode code) {
    return Result<T>(Error{code});
}

/// Create an error result with message
template<typename T = void>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

} // namespace hfs
