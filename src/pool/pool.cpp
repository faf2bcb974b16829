// =============================================================================
// pooled-writer - Compression Worker Pool Implementation
// =============================================================================

#include "pw/pool/pool.h"

#include <exception>
#include <string>
#include <system_error>

#include <fmt/format.h>

#include "pw/common/logger.h"

namespace pw::pool {

// =============================================================================
// PoolConfig
// =============================================================================

std::size_t PoolConfig::effectiveThreads() const noexcept {
    if (threads != 0) {
        return threads;
    }
    const unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? kFallbackThreadCount : static_cast<std::size_t>(hw);
}

std::size_t PoolConfig::effectiveQueueSize() const noexcept {
    return queueSize != 0 ? queueSize : kQueueSlotsPerThread * effectiveThreads();
}

VoidResult PoolConfig::validate() const {
    if (threads > kMaxPoolThreads) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Thread count must be at most {}, got {}",
                                         kMaxPoolThreads, threads));
    }
    if (queueSize != 0 && queueSize < effectiveThreads()) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Queue size must be at least the thread count ({}), got {}",
                                         effectiveThreads(), queueSize));
    }
    return {};
}

// =============================================================================
// Pool
// =============================================================================

Result<std::shared_ptr<Pool>> Pool::create(PoolConfig config) {
    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }

    std::shared_ptr<Pool> pool;
    try {
        pool = std::make_shared<Pool>(PrivateTag{}, config.effectiveThreads(),
                                      config.effectiveQueueSize());
    } catch (const std::system_error& e) {
        return makeError<std::shared_ptr<Pool>>(
            ErrorCode::kInvalidState, fmt::format("Failed to start pool workers: {}", e.what()));
    }

    PW_LOG_INFO("Pool started: threads={}, queue_capacity={}", pool->threadCount(),
                pool->queueCapacity());
    return pool;
}

Pool::Pool(PrivateTag, std::size_t threads, std::size_t queueSize) : queueCapacity_(queueSize) {
    queue_.set_capacity(static_cast<std::ptrdiff_t>(queueSize));
    workers_.reserve(threads);
    try {
        for (std::size_t i = 0; i < threads; ++i) {
            workers_.emplace_back(&Pool::workerLoop, this, i);
        }
    } catch (...) {
        // Stop whatever already started before reporting the failure.
        shuttingDown_.store(true, std::memory_order_seq_cst);
        for (std::size_t i = 0; i < workers_.size(); ++i) {
            queue_.push(QueueItem{});
        }
        for (auto& worker : workers_) {
            worker.join();
        }
        joined_ = true;
        throw;
    }
}

Pool::~Pool() {
    shutdown();
}

VoidResult Pool::submit(Task task) {
    // Registering before the flag check lets shutdown() wait for this call to
    // finish enqueuing; the pairing relies on both sides being seq_cst.
    activeSubmitters_.fetch_add(1, std::memory_order_seq_cst);

    VoidResult result;
    if (shuttingDown_.load(std::memory_order_seq_cst)) {
        result = makeVoidError(ErrorCode::kPoolShutdown,
                               fmt::format("Pool is shut down (stream {}, block {})",
                                           task.streamId, task.seq));
    } else {
        const auto payloadSize = task.payload.size();
        queue_.push(QueueItem{std::move(task)});
        tasksSubmitted_.fetch_add(1, std::memory_order_relaxed);
        bytesIn_.fetch_add(payloadSize, std::memory_order_relaxed);
    }

    if (activeSubmitters_.fetch_sub(1, std::memory_order_seq_cst) == 1) {
        activeSubmitters_.notify_all();
    }
    return result;
}

void Pool::shutdown() {
    std::lock_guard lock(shutdownMutex_);
    if (joined_) {
        return;
    }

    shuttingDown_.store(true, std::memory_order_seq_cst);

    for (auto active = activeSubmitters_.load(std::memory_order_seq_cst); active != 0;
         active = activeSubmitters_.load(std::memory_order_seq_cst)) {
        activeSubmitters_.wait(active, std::memory_order_seq_cst);
    }

    if (const auto attached = attachedStreams(); attached != 0) {
        PW_LOG_WARNING("Pool shutting down with {} stream(s) still open", attached);
    }

    for (std::size_t i = 0; i < workers_.size(); ++i) {
        queue_.push(QueueItem{});
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    joined_ = true;

    const auto s = stats();
    PW_LOG_INFO("Pool shut down: tasks={}, failed={}, bytes_in={}, bytes_out={}",
                s.tasksCompleted, s.tasksFailed, s.bytesIn, s.bytesOut);
}

PoolStats Pool::stats() const noexcept {
    PoolStats s;
    s.tasksSubmitted = tasksSubmitted_.load(std::memory_order_relaxed);
    s.tasksCompleted = tasksCompleted_.load(std::memory_order_relaxed);
    s.tasksFailed = tasksFailed_.load(std::memory_order_relaxed);
    s.bytesIn = bytesIn_.load(std::memory_order_relaxed);
    s.bytesOut = bytesOut_.load(std::memory_order_relaxed);
    return s;
}

void Pool::attachStream() noexcept {
    attachedStreams_.fetch_add(1, std::memory_order_acq_rel);
}

void Pool::detachStream() noexcept {
    attachedStreams_.fetch_sub(1, std::memory_order_acq_rel);
}

// =============================================================================
// Workers
// =============================================================================

void Pool::workerLoop(std::size_t workerIndex) {
    PW_LOG_TRACE("Worker {} started", workerIndex);
    QueueItem item;
    while (true) {
        queue_.pop(item);
        if (!item.has_value()) {
            break;
        }
        runTask(*item);
        item.reset();
    }
    PW_LOG_TRACE("Worker {} stopped", workerIndex);
}

void Pool::runTask(Task& task) {
    TaskResult result{task.streamId, task.seq, ByteBuffer{}};

    try {
        if (!task.payload.empty() || !task.isLast) {
            result.bytes = task.compressor->compress(task.payload);
        }
        if (task.isLast && result.bytes.has_value()) {
            const auto trailer = task.compressor->trailer();
            result.bytes->insert(result.bytes->end(), trailer.begin(), trailer.end());
        }
    } catch (const std::exception& e) {
        result.bytes = makeError<ByteBuffer>(
            ErrorCode::kChannelClosed,
            fmt::format("Worker task failed (stream {}, block {}): {}", task.streamId, task.seq,
                        e.what()));
    } catch (...) {
        result.bytes = makeError<ByteBuffer>(
            ErrorCode::kChannelClosed,
            fmt::format("Worker task failed (stream {}, block {}): unknown exception",
                        task.streamId, task.seq));
    }

    if (result.bytes.has_value()) {
        tasksCompleted_.fetch_add(1, std::memory_order_relaxed);
        bytesOut_.fetch_add(result.bytes->size(), std::memory_order_relaxed);
    } else {
        tasksFailed_.fetch_add(1, std::memory_order_relaxed);
        PW_LOG_WARNING("Block failed: stream={}, seq={}, error={}", task.streamId, task.seq,
                       result.bytes.error().message());
    }

    // Release the payload before handing the result over.
    ByteBuffer().swap(task.payload);
    task.channel->deliver(std::move(result));
}

}  // namespace pw::pool
