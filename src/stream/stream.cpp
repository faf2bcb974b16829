// =============================================================================
// pooled-writer - Ordered Compressed Output Stream Implementation
// =============================================================================

#include "pw/stream/stream.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "pw/common/logger.h"
#include "pw/pool/task.h"
#include "pw/stream/reorder_buffer.h"

namespace pw::stream {

std::string_view streamStateToString(StreamState state) noexcept {
    switch (state) {
        case StreamState::kOpen:
            return "open";
        case StreamState::kClosing:
            return "closing";
        case StreamState::kClosed:
            return "closed";
        case StreamState::kErrored:
            return "errored";
    }
    return "unknown";
}

// =============================================================================
// StreamConfig
// =============================================================================

namespace {

std::atomic<StreamId> gNextStreamId{0};

VoidResult checkGeometry(const StreamConfig& config, const codec::Compressor& compressor) {
    if (config.maxInFlight == 0) {
        return makeVoidError(ErrorCode::kInvalidArgument, "Max in-flight blocks must be > 0");
    }
    if (config.maxInFlight > kMaxInFlightLimit) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Max in-flight blocks must be at most {}, got {}",
                                         kMaxInFlightLimit, config.maxInFlight));
    }
    const std::size_t limit = compressor.maxBlockSize();
    if (config.blockSize > limit) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Block size {} exceeds the {} limit of {} bytes",
                                         config.blockSize,
                                         codec::codecKindName(compressor.kind()), limit));
    }
    return {};
}

}  // namespace

VoidResult StreamConfig::validate() const {
    auto compressorResult = codec::makeCompressor(compressor);
    if (!compressorResult) {
        return makeVoidError(compressorResult.error());
    }
    return checkGeometry(*this, **compressorResult);
}

// =============================================================================
// Completion Channel
// =============================================================================

/// @brief Where workers leave this stream's results.
class StreamChannel final : public pool::CompletionChannel {
public:
    explicit StreamChannel(std::size_t capacity) : reorder(capacity) {}

    void deliver(pool::TaskResult result) override {
        {
            std::lock_guard lock(mutex);
            if (discard) {
                return;
            }
            if (!result.bytes) {
                anyFailure = true;
            }
            auto inserted = reorder.insert(result.seq, std::move(result.bytes));
            if (!inserted && !internalError) {
                internalError = inserted.error();
            }
        }
        cv.notify_all();
    }

    std::mutex mutex;
    std::condition_variable cv;
    ReorderBuffer<Result<ByteBuffer>> reorder;

    /// @brief A failed result has been delivered (it may not be at the cursor yet).
    bool anyFailure = false;

    /// @brief Set once the stream is poisoned; later results are dropped.
    bool discard = false;

    std::optional<Error> internalError;
};

// =============================================================================
// StreamImpl
// =============================================================================

class StreamImpl {
public:
    StreamImpl(std::shared_ptr<pool::Pool> pool, std::unique_ptr<io::Sink> sink,
               std::shared_ptr<const codec::Compressor> compressor, StreamConfig config)
        : pool_(std::move(pool)),
          sink_(std::move(sink)),
          config_(std::move(config)),
          compressor_(std::move(compressor)) {
        if (!pool_) {
            throw UsageError("Stream requires a pool");
        }
        if (!sink_) {
            throw UsageError("Stream requires a sink");
        }
        if (!compressor_) {
            auto made = codec::makeCompressor(config_.compressor);
            if (!made) {
                throw UsageError(made.error().message());
            }
            compressor_ = std::move(*made);
        } else {
            config_.compressor = {compressor_->kind(), compressor_->level()};
        }
        if (auto valid = checkGeometry(config_, *compressor_); !valid) {
            throw UsageError(valid.error().message());
        }

        if (config_.blockSize == 0) {
            config_.blockSize = std::min(compressor_->maxBlockSize(), kDefaultBlockSize);
        }

        channel_ = std::make_shared<StreamChannel>(config_.maxInFlight);
        id_ = gNextStreamId.fetch_add(1, std::memory_order_relaxed);
        buffer_.reserve(config_.blockSize);
        pool_->attachStream();

        PW_LOG_DEBUG("Stream {} opened: sink={}, codec={}, level={}, block_size={}, "
                     "max_in_flight={}",
                     id_, sink_->description(), codec::codecKindName(compressor_->kind()),
                     compressor_->level(), config_.blockSize, config_.maxInFlight);
    }

    ~StreamImpl() {
        const auto current = state_.load(std::memory_order_acquire);
        if (current == StreamState::kOpen) {
            if (auto result = close(); !result) {
                PW_LOG_ERROR("Stream {} failed to close: {}", id_, result.error().message());
            }
        } else {
            std::lock_guard op(opMutex_);
            release();
        }
    }

    StreamImpl(const StreamImpl&) = delete;
    StreamImpl& operator=(const StreamImpl&) = delete;

    VoidResult write(ByteSpan bytes) {
        std::lock_guard op(opMutex_);
        if (auto usable = checkUsable(); !usable) {
            return usable;
        }
        if (auto surfaced = surfaceFailure(); !surfaced) {
            return surfaced;
        }

        const std::size_t blockSize = config_.blockSize;
        std::size_t offset = 0;

        if (!buffer_.empty()) {
            const std::size_t take = std::min(blockSize - buffer_.size(), bytes.size());
            buffer_.insert(buffer_.end(), bytes.begin(), bytes.begin() + take);
            offset = take;
            bytesWritten_.fetch_add(take, std::memory_order_relaxed);
            if (buffer_.size() == blockSize) {
                if (auto submitted = submitBlock(takeBuffer(), false); !submitted) {
                    return submitted;
                }
            }
        }

        while (bytes.size() - offset >= blockSize) {
            const auto first = bytes.begin() + static_cast<std::ptrdiff_t>(offset);
            ByteBuffer block(first, first + static_cast<std::ptrdiff_t>(blockSize));
            bytesWritten_.fetch_add(blockSize, std::memory_order_relaxed);
            offset += blockSize;
            if (auto submitted = submitBlock(std::move(block), false); !submitted) {
                return submitted;
            }
        }

        if (offset < bytes.size()) {
            buffer_.insert(buffer_.end(), bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                           bytes.end());
            bytesWritten_.fetch_add(bytes.size() - offset, std::memory_order_relaxed);
        }

        // Opportunistically push out whatever already completed.
        return emitUntil(0);
    }

    VoidResult flush() {
        std::lock_guard op(opMutex_);
        if (auto usable = checkUsable(); !usable) {
            return usable;
        }
        if (auto surfaced = surfaceFailure(); !surfaced) {
            return surfaced;
        }

        if (!buffer_.empty()) {
            if (auto submitted = submitBlock(takeBuffer(), false); !submitted) {
                return submitted;
            }
        }
        if (auto drained = emitUntil(nextSeq_.load(std::memory_order_acquire)); !drained) {
            return drained;
        }
        if (auto flushed = sink_->flush(); !flushed) {
            return poison(Error{ErrorCode::kIOError, flushed.error().message()});
        }

        PW_LOG_DEBUG("Stream {} flushed: blocks={}, bytes_emitted={}", id_,
                     blocksEmitted_.load(std::memory_order_relaxed),
                     bytesEmitted_.load(std::memory_order_relaxed));
        return {};
    }

    VoidResult close() {
        std::lock_guard op(opMutex_);
        const auto current = state_.load(std::memory_order_acquire);
        if (current == StreamState::kClosed) {
            return closedError();
        }
        if (current == StreamState::kErrored) {
            release();
            return makeVoidError(*stickyError_);
        }

        state_.store(StreamState::kClosing, std::memory_order_release);

        auto finished = finish();
        if (!finished) {
            release();
            return finished;
        }

        sinkClosed_ = true;
        if (auto closed = sink_->close(); !closed) {
            auto result = poison(Error{ErrorCode::kIOError, closed.error().message()});
            release();
            return result;
        }

        state_.store(StreamState::kClosed, std::memory_order_release);
        release();

        PW_LOG_DEBUG("Stream {} closed: blocks={}, bytes_in={}, bytes_out={}", id_,
                     blocksEmitted_.load(std::memory_order_relaxed),
                     bytesWritten_.load(std::memory_order_relaxed),
                     bytesEmitted_.load(std::memory_order_relaxed));
        return {};
    }

    void abort() {
        std::lock_guard op(opMutex_);
        if (state_.load(std::memory_order_acquire) == StreamState::kClosed) {
            return;
        }
        buffer_.clear();
        enterErrored(Error{ErrorCode::kClosed, fmt::format("Stream {} was aborted", id_)});
        release();
        PW_LOG_DEBUG("Stream {} aborted: blocks_emitted={}", id_,
                     blocksEmitted_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] StreamId id() const noexcept { return id_; }

    [[nodiscard]] StreamState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const StreamConfig& config() const noexcept { return config_; }

    [[nodiscard]] std::size_t inFlight() const noexcept {
        std::lock_guard lock(channel_->mutex);
        return static_cast<std::size_t>(nextSeq_.load(std::memory_order_acquire) -
                                        channel_->reorder.cursor());
    }

    [[nodiscard]] StreamStats stats() const noexcept {
        StreamStats s;
        s.bytesWritten = bytesWritten_.load(std::memory_order_relaxed);
        s.bytesEmitted = bytesEmitted_.load(std::memory_order_relaxed);
        s.blocksSubmitted = nextSeq_.load(std::memory_order_relaxed);
        s.blocksEmitted = blocksEmitted_.load(std::memory_order_relaxed);
        return s;
    }

private:
    // All private helpers expect opMutex_ to be held.

    VoidResult closedError() const {
        return makeVoidError(ErrorCode::kClosed, fmt::format("Stream {} is closed", id_));
    }

    VoidResult checkUsable() const {
        switch (state_.load(std::memory_order_acquire)) {
            case StreamState::kOpen:
                return {};
            case StreamState::kErrored:
                return makeVoidError(*stickyError_);
            case StreamState::kClosing:
            case StreamState::kClosed:
                return closedError();
        }
        return closedError();
    }

    /// @brief If any block failed, emit up to it and return its error.
    VoidResult surfaceFailure() {
        bool failed = false;
        {
            std::lock_guard lock(channel_->mutex);
            failed = channel_->anyFailure || channel_->internalError.has_value();
        }
        if (!failed) {
            return {};
        }
        return emitUntil(nextSeq_.load(std::memory_order_acquire));
    }

    VoidResult finish() {
        if (auto surfaced = surfaceFailure(); !surfaced) {
            return surfaced;
        }
        // The last block goes out even when empty so the trailer is written.
        if (auto submitted = submitBlock(takeBuffer(), true); !submitted) {
            return submitted;
        }
        return emitUntil(nextSeq_.load(std::memory_order_acquire));
    }

    ByteBuffer takeBuffer() {
        ByteBuffer block;
        block.swap(buffer_);
        buffer_.reserve(config_.blockSize);
        return block;
    }

    VoidResult submitBlock(ByteBuffer payload, bool isLast) {
        const SequenceNumber seq = nextSeq_.load(std::memory_order_acquire);

        // Backpressure: wait for the oldest outstanding block to be emitted.
        std::size_t outstanding = 0;
        {
            std::lock_guard lock(channel_->mutex);
            outstanding = static_cast<std::size_t>(seq - channel_->reorder.cursor());
        }
        if (outstanding >= config_.maxInFlight) {
            if (auto drained = emitUntil(seq + 1 - config_.maxInFlight); !drained) {
                return drained;
            }
        }

        pool::Task task;
        task.streamId = id_;
        task.seq = seq;
        task.payload = std::move(payload);
        task.compressor = compressor_;
        task.isLast = isLast;
        task.channel = channel_;

        if (auto submitted = pool_->submit(std::move(task)); !submitted) {
            // Everything before this block is still owed to the sink.
            if (auto drained = emitUntil(seq); !drained) {
                return drained;
            }
            return poison(submitted.error());
        }
        nextSeq_.store(seq + 1, std::memory_order_release);
        return {};
    }

    /// @brief Write completed blocks to the sink in order, blocking until the
    ///        cursor reaches `target`. A delivered failure overrides the
    ///        target: emission continues up to the failing block.
    VoidResult emitUntil(SequenceNumber target) {
        while (true) {
            std::vector<Result<ByteBuffer>> ready;
            std::optional<Error> internal;
            bool failurePending = false;
            SequenceNumber cursor = 0;
            {
                std::unique_lock lock(channel_->mutex);
                auto& ch = *channel_;
                ch.cv.wait(lock, [&] {
                    return ch.reorder.hasNext() || ch.internalError.has_value() ||
                           (!ch.anyFailure && ch.reorder.cursor() >= target);
                });
                ready = ch.reorder.popReady();
                internal = ch.internalError;
                failurePending = ch.anyFailure;
                cursor = ch.reorder.cursor();
            }

            for (auto& block : ready) {
                if (!block) {
                    return poison(block.error());
                }
                if (!block->empty()) {
                    if (auto written = sink_->write(*block); !written) {
                        return poison(Error{ErrorCode::kIOError, written.error().message()});
                    }
                }
                bytesEmitted_.fetch_add(block->size(), std::memory_order_relaxed);
                blocksEmitted_.fetch_add(1, std::memory_order_relaxed);
            }

            if (internal) {
                return poison(Error{ErrorCode::kChannelClosed, internal->message()});
            }
            if (!failurePending && cursor >= target) {
                return {};
            }
        }
    }

    /// @brief Enter the terminal error state, keeping the first error, and
    ///        drop every pending or later result.
    void enterErrored(Error error) {
        if (!stickyError_) {
            stickyError_ = std::move(error);
        }
        state_.store(StreamState::kErrored, std::memory_order_release);
        std::lock_guard lock(channel_->mutex);
        channel_->discard = true;
        channel_->reorder.clear();
    }

    VoidResult poison(Error error) {
        if (!stickyError_) {
            PW_LOG_ERROR("Stream {} failed: {} ({})", id_, error.message(),
                         errorCodeToString(error.code()));
        }
        enterErrored(std::move(error));
        return makeVoidError(*stickyError_);
    }

    /// @brief Close the sink and detach from the pool, each at most once.
    void release() {
        if (!sinkClosed_) {
            sinkClosed_ = true;
            if (auto closed = sink_->close(); !closed) {
                PW_LOG_WARNING("Stream {} sink close failed: {}", id_, closed.error().message());
            }
        }
        if (attached_) {
            attached_ = false;
            pool_->detachStream();
        }
    }

    std::shared_ptr<pool::Pool> pool_;
    std::unique_ptr<io::Sink> sink_;
    StreamConfig config_;
    std::shared_ptr<const codec::Compressor> compressor_;
    std::shared_ptr<StreamChannel> channel_;
    StreamId id_ = kInvalidStreamId;

    /// @brief Serializes write/flush/close.
    std::mutex opMutex_;

    ByteBuffer buffer_;
    std::atomic<SequenceNumber> nextSeq_{0};
    std::atomic<StreamState> state_{StreamState::kOpen};
    std::optional<Error> stickyError_;
    bool sinkClosed_ = false;
    bool attached_ = true;

    std::atomic<std::uint64_t> bytesWritten_{0};
    std::atomic<std::uint64_t> bytesEmitted_{0};
    std::atomic<std::uint64_t> blocksEmitted_{0};
};

// =============================================================================
// Stream
// =============================================================================

Stream::Stream(std::shared_ptr<pool::Pool> pool, std::unique_ptr<io::Sink> sink,
               StreamConfig config)
    : impl_(std::make_unique<StreamImpl>(std::move(pool), std::move(sink), nullptr,
                                         std::move(config))) {}

Stream::Stream(std::shared_ptr<pool::Pool> pool, std::unique_ptr<io::Sink> sink,
               std::shared_ptr<const codec::Compressor> compressor, StreamConfig config) {
    if (!compressor) {
        throw UsageError("Stream requires a compressor");
    }
    impl_ = std::make_unique<StreamImpl>(std::move(pool), std::move(sink), std::move(compressor),
                                         std::move(config));
}

Result<std::unique_ptr<Stream>> Stream::open(std::shared_ptr<pool::Pool> pool,
                                             std::unique_ptr<io::Sink> sink,
                                             StreamConfig config) {
    if (!pool) {
        return makeError<std::unique_ptr<Stream>>(ErrorCode::kInvalidArgument,
                                                  "Stream requires a pool");
    }
    if (!sink) {
        return makeError<std::unique_ptr<Stream>>(ErrorCode::kInvalidArgument,
                                                  "Stream requires a sink");
    }
    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return tryExecute([&] {
        return std::make_unique<Stream>(std::move(pool), std::move(sink), std::move(config));
    });
}

Stream::~Stream() = default;

Stream::Stream(Stream&&) noexcept = default;

Stream& Stream::operator=(Stream&&) noexcept = default;

VoidResult Stream::write(ByteSpan bytes) {
    return impl_->write(bytes);
}

VoidResult Stream::write(std::string_view text) {
    return impl_->write(asBytes(text));
}

VoidResult Stream::flush() {
    return impl_->flush();
}

VoidResult Stream::close() {
    return impl_->close();
}

void Stream::abort() {
    impl_->abort();
}

StreamId Stream::id() const noexcept {
    return impl_->id();
}

StreamState Stream::state() const noexcept {
    return impl_->state();
}

const StreamConfig& Stream::config() const noexcept {
    return impl_->config();
}

std::size_t Stream::inFlight() const noexcept {
    return impl_->inFlight();
}

StreamStats Stream::stats() const noexcept {
    return impl_->stats();
}

}  // namespace pw::stream
