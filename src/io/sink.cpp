// =============================================================================
// pooled-writer - Output Sinks
// =============================================================================

#include "pw/io/sink.h"

#include <system_error>

#include <fmt/format.h>

#include "pw/common/logger.h"

namespace pw::io {

// =============================================================================
// FileSink
// =============================================================================

FileSink::FileSink(PrivateTag, std::filesystem::path path) : path_(std::move(path)) {}

FileSink::~FileSink() {
    if (stream_.is_open()) {
        stream_.close();
    }
}

Result<std::unique_ptr<FileSink>> FileSink::open(const std::filesystem::path& path,
                                                 bool overwrite) {
    std::error_code ec;
    if (!overwrite && std::filesystem::exists(path, ec)) {
        return makeError<std::unique_ptr<FileSink>>(
            ErrorCode::kIOError,
            fmt::format("Output file exists: {} (use --force to overwrite)", path.string()));
    }

    auto sink = std::make_unique<FileSink>(PrivateTag{}, path);
    try {
        sink->stream_.open(path, std::ios::binary | std::ios::trunc);
    } catch (const std::exception& e) {
        return makeError<std::unique_ptr<FileSink>>(
            ErrorCode::kIOError, fmt::format("Failed to open file {}: {}", path.string(), e.what()));
    }

    if (!sink->stream_.is_open()) {
        return makeError<std::unique_ptr<FileSink>>(
            ErrorCode::kIOError, fmt::format("Failed to open file for writing: {}", path.string()));
    }

    PW_LOG_DEBUG("FileSink opened: path={}", path.string());
    return sink;
}

VoidResult FileSink::write(ByteSpan data) {
    if (!stream_.is_open()) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Write to closed file: {}", path_.string()));
    }
    stream_.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    if (!stream_) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Failed to write {} bytes to {}", data.size(),
                                         path_.string()));
    }
    bytesWritten_ += data.size();
    return {};
}

VoidResult FileSink::flush() {
    if (!stream_.is_open()) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Flush of closed file: {}", path_.string()));
    }
    stream_.flush();
    if (!stream_) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Failed to flush {}", path_.string()));
    }
    return {};
}

VoidResult FileSink::close() {
    if (!stream_.is_open()) {
        return {};
    }
    stream_.flush();
    const bool flushed = static_cast<bool>(stream_);
    stream_.close();
    if (!flushed || stream_.fail()) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Failed to close {}", path_.string()));
    }
    PW_LOG_DEBUG("FileSink closed: path={}, bytes={}", path_.string(), bytesWritten_);
    return {};
}

// =============================================================================
// MemorySink
// =============================================================================

VoidResult MemorySink::write(ByteSpan data) {
    buffer_->insert(buffer_->end(), data.begin(), data.end());
    return {};
}

VoidResult MemorySink::flush() {
    ++flushCount_;
    return {};
}

VoidResult MemorySink::close() {
    ++closeCount_;
    return {};
}

}  // namespace pw::io
