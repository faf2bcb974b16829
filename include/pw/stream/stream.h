// =============================================================================
// pooled-writer - Ordered Compressed Output Stream
// =============================================================================
// A Stream turns caller writes into fixed-size blocks, hands them to a shared
// Pool for compression, and writes the compressed blocks to its Sink strictly
// in submission order, however the workers happen to finish them.
//
// Blocking points (all on the caller's thread):
// - write() blocks while maxInFlight blocks are outstanding, or while the
//   pool queue is full.
// - flush() and close() block until this stream's own blocks are done.
//
// Completed blocks are written to the sink from within write/flush/close, so
// sink I/O never happens on a pool worker.
//
// Failure model: the first failure in sequence order (compression, worker
// exception, sink I/O, pool shutdown) poisons the stream. Every block before
// the failing one has been written; nothing after it is. Every later call
// returns the same error.
//
// Usage:
//   auto pool = pw::pool::Pool::create({.threads = 4}).value();
//   pw::stream::Stream out(pool, std::move(sink), {.maxInFlight = 16});
//   out.write(data);
//   out.close();
// =============================================================================

#ifndef PW_STREAM_STREAM_H
#define PW_STREAM_STREAM_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include "pw/codec/compressor.h"
#include "pw/common/error.h"
#include "pw/common/types.h"
#include "pw/io/sink.h"
#include "pw/pool/pool.h"

namespace pw::stream {

class StreamImpl;

// =============================================================================
// State and Configuration
// =============================================================================

enum class StreamState : std::uint8_t {
    /// @brief Accepting writes.
    kOpen = 0,

    /// @brief close() in progress.
    kClosing = 1,

    /// @brief Closed successfully; terminal.
    kClosed = 2,

    /// @brief Poisoned by a failure; terminal.
    kErrored = 3
};

[[nodiscard]] std::string_view streamStateToString(StreamState state) noexcept;

struct StreamConfig {
    /// @brief Bytes per block (0 = min(compressor limit, kDefaultBlockSize)).
    std::size_t blockSize = 0;

    /// @brief Maximum blocks submitted but not yet written to the sink.
    std::size_t maxInFlight = kDefaultMaxInFlight;

    codec::CompressorConfig compressor;

    /// @brief Check maxInFlight, the codec level and the block size limit.
    [[nodiscard]] VoidResult validate() const;
};

struct StreamStats {
    /// @brief Uncompressed bytes accepted by write().
    std::uint64_t bytesWritten = 0;

    /// @brief Compressed bytes written to the sink.
    std::uint64_t bytesEmitted = 0;

    std::uint64_t blocksSubmitted = 0;
    std::uint64_t blocksEmitted = 0;
};

// =============================================================================
// Stream
// =============================================================================

class Stream {
public:
    /// @brief Open a stream on a pool.
    /// @throws UsageError on a null pool or sink, or an invalid config.
    Stream(std::shared_ptr<pool::Pool> pool, std::unique_ptr<io::Sink> sink,
           StreamConfig config = {});

    /// @brief Open a stream with a caller-supplied compressor.
    /// @note config.compressor is ignored; the block size limit comes from
    ///       compressor->maxBlockSize().
    /// @throws UsageError on a null pool, sink or compressor, or an invalid config.
    Stream(std::shared_ptr<pool::Pool> pool, std::unique_ptr<io::Sink> sink,
           std::shared_ptr<const codec::Compressor> compressor, StreamConfig config = {});

    /// @brief Non-throwing variant of the constructor.
    [[nodiscard]] static Result<std::unique_ptr<Stream>> open(std::shared_ptr<pool::Pool> pool,
                                                              std::unique_ptr<io::Sink> sink,
                                                              StreamConfig config = {});

    /// @brief Closes the stream if still open; errors are logged.
    ~Stream();

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;
    Stream(Stream&&) noexcept;
    Stream& operator=(Stream&&) noexcept;

    /// @brief Append bytes, submitting every block that fills up.
    [[nodiscard]] VoidResult write(ByteSpan bytes);
    [[nodiscard]] VoidResult write(std::string_view text);

    /// @brief Submit the partial block, wait for every outstanding block to
    ///        reach the sink, then flush the sink.
    [[nodiscard]] VoidResult flush();

    /// @brief Submit the final block, wait for everything (trailer included),
    ///        then close the sink.
    [[nodiscard]] VoidResult close();

    /// @brief Abandon the stream without finalizing it: nothing further is
    ///        submitted or emitted, no trailer is written, and the sink is
    ///        closed. Later calls fail with kClosed. No-op once closed.
    void abort();

    [[nodiscard]] StreamId id() const noexcept;

    [[nodiscard]] StreamState state() const noexcept;

    /// @brief Configuration with defaults resolved.
    [[nodiscard]] const StreamConfig& config() const noexcept;

    /// @brief Blocks submitted but not yet written to the sink.
    /// @note Safe to call from another thread while write() is blocked.
    [[nodiscard]] std::size_t inFlight() const noexcept;

    [[nodiscard]] StreamStats stats() const noexcept;

private:
    std::unique_ptr<StreamImpl> impl_;
};

}  // namespace pw::stream

#endif  // PW_STREAM_STREAM_H
