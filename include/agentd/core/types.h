#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

namespace agentd {

using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    InvalidParams,
    InvalidState,
    InvalidEvent,
    InternalError,
    NotFound,
    NotSupported,
    TaskNotFound,
    TaskNotCancelable,
    UnsupportedOperation,
    PushNotificationNotSupported,
    ContentTypeNotSupported,
    InvalidAgentResponse,
    AuthenticatedExtendedCardNotConfigured,
    SessionAlreadyExists,
    SessionClosed,
    OperationCancelled,
    NetworkError,
    Timeout,
    SystemShutdown,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidParams: return "Invalid parameters";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InvalidEvent: return "Invalid event";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::TaskNotFound: return "Task not found";
        case ErrorCode::TaskNotCancelable: return "Task cannot be canceled";
        case ErrorCode::UnsupportedOperation: return "This operation is not supported";
        case ErrorCode::PushNotificationNotSupported: return "Push Notification is not supported";
        case ErrorCode::ContentTypeNotSupported: return "Incompatible content types";
        case ErrorCode::InvalidAgentResponse: return "Invalid agent response";
        case ErrorCode::AuthenticatedExtendedCardNotConfigured:
            return "Authenticated Extended Card is not configured";
        case ErrorCode::SessionAlreadyExists: return "Session already exists";
        case ErrorCode::SessionClosed: return "Session closed";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::SystemShutdown: return "System shutdown";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail (compatible with pre-C++23)
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

/**
 * @brief Exception carrying a protocol-level Error.
 *
 * Thrown across coroutine boundaries where a Result cannot be returned (streams,
 * session jobs, collaborator hooks). The transport maps `error().code` onto its own
 * error representation.
 */
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(Error error)
        : std::runtime_error(error.message), error_(std::move(error)) {}
    ProtocolError(ErrorCode code, std::string message)
        : ProtocolError(Error{code, std::move(message)}) {}
    explicit ProtocolError(ErrorCode code) : ProtocolError(Error{code}) {}

    const Error& error() const noexcept { return error_; }
    ErrorCode code() const noexcept { return error_.code; }

private:
    Error error_;
};

// Throws ProtocolError if the result carries an error.
inline void throwIfError(const Result<void>& r) {
    if (!r) {
        throw ProtocolError(r.error());
    }
}

} // namespace agentd

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<agentd::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(agentd::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", agentd::errorToString(error));
    }
};
#endif
