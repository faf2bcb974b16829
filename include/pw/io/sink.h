// =============================================================================
// pooled-writer - Output Sinks
// =============================================================================
// Byte-oriented destinations for compressed streams.
//
// A sink is owned by exactly one stream and is only ever touched from the
// threads calling into that stream (never from pool workers), so
// implementations need no internal locking.
// =============================================================================

#ifndef PW_IO_SINK_H
#define PW_IO_SINK_H

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include "pw/common/error.h"
#include "pw/common/types.h"

namespace pw::io {

// =============================================================================
// Sink Interface
// =============================================================================

class Sink {
public:
    virtual ~Sink() = default;

    /// @brief Append bytes to the sink.
    [[nodiscard]] virtual VoidResult write(ByteSpan data) = 0;

    /// @brief Push buffered bytes to the underlying destination.
    [[nodiscard]] virtual VoidResult flush() = 0;

    /// @brief Flush and release the destination. Called at most once.
    [[nodiscard]] virtual VoidResult close() = 0;

    /// @brief Short description for log messages (path, "memory", ...).
    [[nodiscard]] virtual std::string description() const = 0;
};

// =============================================================================
// FileSink
// =============================================================================

/// @brief Binary file sink over std::ofstream.
class FileSink final : public Sink {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// @brief Open a file for writing.
    /// @param path Destination path.
    /// @param overwrite Truncate an existing file instead of failing.
    [[nodiscard]] static Result<std::unique_ptr<FileSink>> open(const std::filesystem::path& path,
                                                                bool overwrite);

    /// @brief Use open().
    FileSink(PrivateTag, std::filesystem::path path);

    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    [[nodiscard]] VoidResult write(ByteSpan data) override;
    [[nodiscard]] VoidResult flush() override;
    [[nodiscard]] VoidResult close() override;
    [[nodiscard]] std::string description() const override { return path_.string(); }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] std::size_t bytesWritten() const noexcept { return bytesWritten_; }

private:
    std::filesystem::path path_;
    std::ofstream stream_;
    std::size_t bytesWritten_ = 0;
};

// =============================================================================
// MemorySink
// =============================================================================

/// @brief Sink appending to a shared in-memory buffer.
/// @note The buffer is shared so the caller can inspect it after the owning
///       stream has consumed the sink.
class MemorySink final : public Sink {
public:
    explicit MemorySink(std::shared_ptr<ByteBuffer> buffer) : buffer_(std::move(buffer)) {}

    [[nodiscard]] VoidResult write(ByteSpan data) override;
    [[nodiscard]] VoidResult flush() override;
    [[nodiscard]] VoidResult close() override;
    [[nodiscard]] std::string description() const override { return "memory"; }

    [[nodiscard]] std::size_t flushCount() const noexcept { return flushCount_; }
    [[nodiscard]] std::size_t closeCount() const noexcept { return closeCount_; }

private:
    std::shared_ptr<ByteBuffer> buffer_;
    std::size_t flushCount_ = 0;
    std::size_t closeCount_ = 0;
};

}  // namespace pw::io

#endif  // PW_IO_SINK_H
