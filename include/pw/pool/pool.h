// =============================================================================
// pooled-writer - Compression Worker Pool
// =============================================================================
// A fixed set of worker threads draining one bounded multi-producer /
// multi-consumer task queue. Any number of streams share a pool; the pool
// holds no per-stream state, it only compresses blocks and hands the results
// back through each task's completion channel.
//
// Shutdown protocol:
// 1. shuttingDown_ is raised; new submit() calls fail with kPoolShutdown.
// 2. Submitters already past the check finish enqueuing (activeSubmitters_).
// 3. One stop marker per worker is queued behind the remaining tasks, so
//    every task accepted before shutdown is still compressed and delivered.
// 4. Workers are joined.
// =============================================================================

#ifndef PW_POOL_POOL_H
#define PW_POOL_POOL_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <tbb/concurrent_queue.h>

#include "pw/common/error.h"
#include "pw/common/types.h"
#include "pw/pool/task.h"

namespace pw::pool {

// =============================================================================
// Configuration
// =============================================================================

struct PoolConfig {
    /// @brief Worker thread count (0 = hardware concurrency).
    std::size_t threads = 0;

    /// @brief Task queue capacity (0 = kQueueSlotsPerThread * threads).
    std::size_t queueSize = 0;

    /// @brief Worker count with 0 resolved.
    [[nodiscard]] std::size_t effectiveThreads() const noexcept;

    /// @brief Queue capacity with 0 resolved.
    [[nodiscard]] std::size_t effectiveQueueSize() const noexcept;

    [[nodiscard]] VoidResult validate() const;
};

/// @brief Snapshot of pool counters.
struct PoolStats {
    std::uint64_t tasksSubmitted = 0;
    std::uint64_t tasksCompleted = 0;
    std::uint64_t tasksFailed = 0;
    std::uint64_t bytesIn = 0;
    std::uint64_t bytesOut = 0;
};

// =============================================================================
// Pool
// =============================================================================

class Pool {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// @brief Validate the configuration and start the workers.
    [[nodiscard]] static Result<std::shared_ptr<Pool>> create(PoolConfig config = {});

    /// @brief Use create().
    Pool(PrivateTag, std::size_t threads, std::size_t queueSize);

    /// @brief Shuts down and joins the workers.
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    /// @brief Enqueue a task, blocking while the queue is full.
    /// @return kPoolShutdown once shutdown has begun.
    [[nodiscard]] VoidResult submit(Task task);

    /// @brief Stop accepting work, drain the queue and join the workers.
    /// @note Idempotent and safe to call from several threads.
    void shutdown();

    [[nodiscard]] std::size_t threadCount() const noexcept { return workers_.size(); }

    [[nodiscard]] std::size_t queueCapacity() const noexcept { return queueCapacity_; }

    [[nodiscard]] bool isShutdown() const noexcept {
        return shuttingDown_.load(std::memory_order_acquire);
    }

    [[nodiscard]] PoolStats stats() const noexcept;

    /// @brief Register / unregister a live stream (for the shutdown warning).
    void attachStream() noexcept;
    void detachStream() noexcept;

    [[nodiscard]] std::size_t attachedStreams() const noexcept {
        return attachedStreams_.load(std::memory_order_acquire);
    }

private:
    /// @brief nullopt is the per-worker stop marker.
    using QueueItem = std::optional<Task>;

    void workerLoop(std::size_t workerIndex);
    void runTask(Task& task);

    tbb::concurrent_bounded_queue<QueueItem> queue_;
    std::size_t queueCapacity_;
    std::vector<std::thread> workers_;

    std::atomic<bool> shuttingDown_{false};
    std::atomic<std::size_t> activeSubmitters_{0};
    std::atomic<std::size_t> attachedStreams_{0};

    std::mutex shutdownMutex_;
    bool joined_ = false;

    std::atomic<std::uint64_t> tasksSubmitted_{0};
    std::atomic<std::uint64_t> tasksCompleted_{0};
    std::atomic<std::uint64_t> tasksFailed_{0};
    std::atomic<std::uint64_t> bytesIn_{0};
    std::atomic<std::uint64_t> bytesOut_{0};
};

}  // namespace pw::pool

#endif  // PW_POOL_POOL_H
