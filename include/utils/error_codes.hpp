#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace stagelink {

// Error categories with distinct ranges
enum class ErrorCategory : uint16_t {
    None = 0,
    Registry = 1000,
    Launch = 2000,
    Stream = 3000,
    System = 5000
};

// Structured error codes
enum class ErrorCode : uint32_t {
    // Success
    Success = 0,

    // Registry errors (1000-1999)
    RegistryNotFound = 1001,
    RegistryCollision = 1002,
    RegistryIOFailed = 1003,
    RegistryCorruptRecord = 1004,

    // Launch errors (2000-2999)
    LaunchSpawnFailure = 2001,
    LaunchRegistrationTimeout = 2002,
    LaunchDaemonUnreachable = 2003,
    LaunchCancelled = 2004,
    LaunchDaemonBusy = 2005,

    // Stream errors (3000-3999)
    StreamMalformedEvent = 3001,
    StreamOversizedLine = 3002,
    StreamIOError = 3003,
    StreamCancelled = 3004,

    // System errors (5000-5999)
    SystemResourceExhausted = 5001,
    SystemInvalidConfiguration = 5002,
    SystemBindFailed = 5003
};

// Result type for operations that can fail
template<typename T>
class Result {
public:
    Result(T value) noexcept : value_(std::move(value)), code_(ErrorCode::Success) {}
    Result(ErrorCode code) noexcept : code_(code) {}
    Result(ErrorCode code, std::string_view message)
        : code_(code), message_(message) {}

    bool isSuccess() const noexcept { return code_ == ErrorCode::Success; }
    bool isError() const noexcept { return code_ != ErrorCode::Success; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    T&& moveValue() noexcept { return std::move(value_); }

    ErrorCode error() const noexcept { return code_; }
    std::string_view message() const noexcept { return message_; }

    operator bool() const noexcept { return isSuccess(); }

private:
    T value_;
    ErrorCode code_;
    std::string message_;
};

// Specialization for void results
template<>
class Result<void> {
public:
    Result() noexcept : code_(ErrorCode::Success) {}
    Result(ErrorCode code) noexcept : code_(code) {}
    Result(ErrorCode code, std::string_view message)
        : code_(code), message_(message) {}

    bool isSuccess() const noexcept { return code_ == ErrorCode::Success; }
    bool isError() const noexcept { return code_ != ErrorCode::Success; }

    ErrorCode error() const noexcept { return code_; }
    std::string_view message() const noexcept { return message_; }

    operator bool() const noexcept { return isSuccess(); }

private:
    ErrorCode code_;
    std::string message_;
};

// Helper function to get error category
inline ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    uint32_t value = static_cast<uint32_t>(code);
    if (value == 0) return ErrorCategory::None;
    if (value >= 1000 && value < 2000) return ErrorCategory::Registry;
    if (value >= 2000 && value < 3000) return ErrorCategory::Launch;
    if (value >= 3000 && value < 4000) return ErrorCategory::Stream;
    if (value >= 5000 && value < 6000) return ErrorCategory::System;
    return ErrorCategory::None;
}

// Convert error code to string
inline std::string_view errorToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";

        // Registry errors
        case ErrorCode::RegistryNotFound: return "No daemon registered";
        case ErrorCode::RegistryCollision: return "Daemon already registered";
        case ErrorCode::RegistryIOFailed: return "Registry storage failure";
        case ErrorCode::RegistryCorruptRecord: return "Corrupt registry record";

        // Launch errors
        case ErrorCode::LaunchSpawnFailure: return "Daemon failed to start";
        case ErrorCode::LaunchRegistrationTimeout: return "Daemon did not register in time";
        case ErrorCode::LaunchDaemonUnreachable: return "Daemon unreachable";
        case ErrorCode::LaunchCancelled: return "Launch cancelled";
        case ErrorCode::LaunchDaemonBusy: return "Daemon has no free stream slots";

        // Stream errors
        case ErrorCode::StreamMalformedEvent: return "Malformed event";
        case ErrorCode::StreamOversizedLine: return "Event line exceeds maximum size";
        case ErrorCode::StreamIOError: return "Stream I/O error";
        case ErrorCode::StreamCancelled: return "Stream cancelled";

        // System errors
        case ErrorCode::SystemResourceExhausted: return "System resources exhausted";
        case ErrorCode::SystemInvalidConfiguration: return "Invalid configuration";
        case ErrorCode::SystemBindFailed: return "Failed to bind to address";

        default: return "Unknown error";
    }
}

// "<phase description>: <detail>" for operator-facing messages
template<typename T>
inline std::string describeError(const Result<T>& result) {
    std::string text(errorToString(result.error()));
    if (!result.message().empty()) {
        text += ": ";
        text += result.message();
    }
    return text;
}

} // namespace stagelink
