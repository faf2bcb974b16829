// =============================================================================
// pooled-writer - Error Handling Framework
// =============================================================================
// Error handling for the pooled-writer library.
//
// This module provides:
// - ErrorCode enum shared by the library and the pwz exit codes
// - PWException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - ErrorContext carrying stream / sequence / path details
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (sink write, file open)
// - 3: Compression error
// - 4: Pool shut down
// - 5: Stream closed
// - 6: Internal channel failure
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef PW_COMMON_ERROR_H
#define PW_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace pw {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes, doubling as pwz exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error on the command line.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note Sink write/flush/close failure, file open failure.
    kIOError = 2,

    /// @brief The compressor failed on a block.
    kCompressionError = 3,

    /// @brief Submission attempted after the pool began shutting down.
    kPoolShutdown = 4,

    /// @brief Operation attempted on a closed stream.
    kClosed = 5,

    /// @brief Internal plumbing failure (bug class).
    /// @note Also used when a worker task escapes with an exception.
    kChannelClosed = 6,

    /// @brief Invalid configuration value.
    kInvalidArgument = 7,

    /// @brief Invalid state for operation.
    kInvalidState = 8,

    /// @brief Unknown or unavailable codec.
    kUnsupportedCodec = 9
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kCompressionError:
            return "compression error";
        case ErrorCode::kPoolShutdown:
            return "pool shut down";
        case ErrorCode::kClosed:
            return "stream closed";
        case ErrorCode::kChannelClosed:
            return "channel closed";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kInvalidState:
            return "invalid state";
        case ErrorCode::kUnsupportedCodec:
            return "unsupported codec";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code represents an error.
[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Stream the error belongs to (if applicable).
    std::optional<std::uint64_t> streamId;

    /// @brief Block sequence number within the stream (if applicable).
    std::optional<std::uint64_t> sequence;

    /// @brief Source location where the error was created.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    ErrorContext& withStream(std::uint64_t id) {
        streamId = id;
        return *this;
    }

    ErrorContext& withSequence(std::uint64_t seq) {
        sequence = seq;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all pooled-writer errors.
class PWException : public std::exception {
public:
    PWException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    PWException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~PWException() override = default;

    PWException(const PWException&) = default;
    PWException(PWException&&) noexcept = default;
    PWException& operator=(const PWException&) = default;
    PWException& operator=(PWException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
/// @note Thrown for invalid configuration passed to constructors.
class UsageError : public PWException {
public:
    explicit UsageError(std::string message)
        : PWException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : PWException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
class IOError : public PWException {
public:
    explicit IOError(std::string message)
        : PWException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : PWException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : PWException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    IOError(std::string message, std::error_code ec, ErrorContext context)
        : PWException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                      std::move(context)),
          systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for compressor failures (exit code 3).
class CompressionError : public PWException {
public:
    explicit CompressionError(std::string message)
        : PWException(ErrorCode::kCompressionError, std::move(message)) {}

    CompressionError(std::string message, ErrorContext context)
        : PWException(ErrorCode::kCompressionError, std::move(message), std::move(context)) {}
};

/// @brief Exception for submissions to a pool that is shutting down (exit code 4).
class PoolShutdownError : public PWException {
public:
    explicit PoolShutdownError(std::string message)
        : PWException(ErrorCode::kPoolShutdown, std::move(message)) {}
};

/// @brief Exception for operations on a closed stream (exit code 5).
class StreamClosedError : public PWException {
public:
    explicit StreamClosedError(std::string message)
        : PWException(ErrorCode::kClosed, std::move(message)) {}

    StreamClosedError(std::string message, ErrorContext context)
        : PWException(ErrorCode::kClosed, std::move(message), std::move(context)) {}
};

/// @brief Exception for internal channel failures (exit code 6).
/// @note Indicates a bug rather than an expected failure mode.
class ChannelClosedError : public PWException {
public:
    explicit ChannelClosedError(std::string message)
        : PWException(ErrorCode::kChannelClosed, std::move(message)) {}

    ChannelClosedError(std::string message, ErrorContext context)
        : PWException(ErrorCode::kChannelClosed, std::move(message), std::move(context)) {}
};

/// @brief Exception for unknown codec names (exit code 9).
class UnsupportedCodecError : public PWException {
public:
    explicit UnsupportedCodecError(std::string message)
        : PWException(ErrorCode::kUnsupportedCodec, std::move(message)) {}

    UnsupportedCodecError(std::string message, ErrorContext context)
        : PWException(ErrorCode::kUnsupportedCodec, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
/// @note Copyable so a stream can hand the same sticky error to every caller.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a PWException.
    explicit Error(const PWException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Convert to the appropriate exception type.
    [[nodiscard]] PWException toException() const;

    /// @brief Throw the appropriate exception.
    [[noreturn]] void throwException() const;

    friend bool operator==(const Error& lhs, const Error& rhs) noexcept {
        return lhs.code_ == rhs.code_ && lhs.message_ == rhs.message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

template <typename T>
[[nodiscard]] Result<T> makeSuccess(T value) {
    return Result<T>{std::move(value)};
}

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

template <typename T>
[[nodiscard]] Result<T> makeError(const PWException& ex) {
    return std::unexpected(Error{ex});
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

[[nodiscard]] inline VoidResult makeVoidError(Error error) {
    return std::unexpected(std::move(error));
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Unwrap a Result, throwing the matching exception on error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Try to execute a function and convert exceptions to Result.
/// @note Exceptions that are not PWException map to kChannelClosed.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const PWException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kChannelClosed, ex.what()});
    }
}

}  // namespace pw

#endif  // PW_COMMON_ERROR_H
