// =============================================================================
// pooled-writer - Error Handling Framework Implementation
// =============================================================================

#include "pw/common/error.h"

#include <sstream>

#include <fmt/format.h>

namespace pw {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!filePath.empty()) {
        oss << "file: " << filePath;
        hasContent = true;
    }

    if (streamId.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "stream: " << *streamId;
        hasContent = true;
    }

    if (sequence.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "block: " << *sequence;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// PWException Implementation
// =============================================================================

void PWException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// IOError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// =============================================================================
// Error Implementation
// =============================================================================

PWException Error::toException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
        case ErrorCode::kInvalidArgument:
            return UsageError(message_);
        case ErrorCode::kIOError:
            return IOError(message_);
        case ErrorCode::kCompressionError:
            return CompressionError(message_);
        case ErrorCode::kPoolShutdown:
            return PoolShutdownError(message_);
        case ErrorCode::kClosed:
            return StreamClosedError(message_);
        case ErrorCode::kChannelClosed:
            return ChannelClosedError(message_);
        case ErrorCode::kUnsupportedCodec:
            return UnsupportedCodecError(message_);
        case ErrorCode::kSuccess:
        case ErrorCode::kInvalidState:
            break;
    }
    return PWException(code_, message_);
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
        case ErrorCode::kInvalidArgument:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kCompressionError:
            throw CompressionError(message_);
        case ErrorCode::kPoolShutdown:
            throw PoolShutdownError(message_);
        case ErrorCode::kClosed:
            throw StreamClosedError(message_);
        case ErrorCode::kChannelClosed:
            throw ChannelClosedError(message_);
        case ErrorCode::kUnsupportedCodec:
            throw UnsupportedCodecError(message_);
        case ErrorCode::kSuccess:
        case ErrorCode::kInvalidState:
            break;
    }
    throw PWException(code_, message_);
}

}  // namespace pw
