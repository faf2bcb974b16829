// =============================================================================
// pooled-writer - Pool Work Items
// =============================================================================
// A Task is one block of one stream travelling from the stream's caller to a
// pool worker. The worker delivers a TaskResult back through the stream's
// CompletionChannel.
// =============================================================================

#ifndef PW_POOL_TASK_H
#define PW_POOL_TASK_H

#include <memory>

#include "pw/codec/compressor.h"
#include "pw/common/error.h"
#include "pw/common/types.h"

namespace pw::pool {

/// @brief Outcome of compressing one block.
struct TaskResult {
    StreamId streamId = kInvalidStreamId;
    SequenceNumber seq = 0;

    /// @brief Compressed bytes (with the trailer appended for the last block),
    ///        or the failure.
    Result<ByteBuffer> bytes;
};

/// @brief Receiver of a stream's completed blocks.
/// @note deliver() is called from worker threads, once per submitted task.
class CompletionChannel {
public:
    virtual ~CompletionChannel() = default;

    virtual void deliver(TaskResult result) = 0;
};

/// @brief One block of work.
struct Task {
    StreamId streamId = kInvalidStreamId;
    SequenceNumber seq = 0;

    /// @brief Uncompressed bytes, owned by the task.
    ByteBuffer payload;

    /// @brief The owning stream's compressor, shared read-only.
    std::shared_ptr<const codec::Compressor> compressor;

    /// @brief Final block of the stream: the compressor trailer is appended.
    bool isLast = false;

    std::shared_ptr<CompletionChannel> channel;
};

}  // namespace pw::pool

#endif  // PW_POOL_TASK_H
