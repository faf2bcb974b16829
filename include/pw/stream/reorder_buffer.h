// =============================================================================
// pooled-writer - Reorder Buffer
// =============================================================================
// Fixed ring of `capacity` slots holding out-of-order results until they form
// a contiguous run starting at the emission cursor. Sequence number `seq`
// lives in slot `seq % capacity`; since a stream never has more than
// `capacity` blocks outstanding, two live sequence numbers never collide.
//
// Not internally synchronized: the owning stream's channel mutex guards it.
// =============================================================================

#ifndef PW_STREAM_REORDER_BUFFER_H
#define PW_STREAM_REORDER_BUFFER_H

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "pw/common/error.h"
#include "pw/common/types.h"

namespace pw::stream {

template <typename T>
class ReorderBuffer {
public:
    /// @brief Construct with a window of `capacity` sequence numbers.
    /// @throws UsageError if capacity is zero.
    explicit ReorderBuffer(std::size_t capacity, SequenceNumber startSeq = 0)
        : slots_(capacity), cursor_(startSeq) {
        if (capacity == 0) {
            throw UsageError("Reorder buffer capacity must be > 0");
        }
    }

    /// @brief Store the item for `seq`.
    /// @return kInvalidState if seq is outside [cursor, cursor + capacity)
    ///         or already present.
    [[nodiscard]] VoidResult insert(SequenceNumber seq, T item) {
        if (seq < cursor_ || seq - cursor_ >= slots_.size()) {
            return makeVoidError(ErrorCode::kInvalidState,
                                 fmt::format("Sequence {} outside reorder window [{}, {})", seq,
                                             cursor_, cursor_ + slots_.size()));
        }
        auto& slot = slots_[slotIndex(seq)];
        if (slot.has_value()) {
            return makeVoidError(ErrorCode::kInvalidState,
                                 fmt::format("Duplicate result for sequence {}", seq));
        }
        slot.emplace(std::move(item));
        ++size_;
        return {};
    }

    /// @brief Whether the item at the cursor is present.
    [[nodiscard]] bool hasNext() const noexcept { return slots_[slotIndex(cursor_)].has_value(); }

    /// @brief Remove the item at the cursor and advance it.
    /// @return nullopt if the cursor's item has not arrived yet.
    [[nodiscard]] std::optional<T> popNext() {
        auto& slot = slots_[slotIndex(cursor_)];
        if (!slot.has_value()) {
            return std::nullopt;
        }
        std::optional<T> item = std::move(slot);
        slot.reset();
        --size_;
        ++cursor_;
        return item;
    }

    /// @brief Remove every item contiguous from the cursor, in order.
    [[nodiscard]] std::vector<T> popReady() {
        std::vector<T> ready;
        while (auto item = popNext()) {
            ready.push_back(std::move(*item));
        }
        return ready;
    }

    /// @brief Drop every buffered item. The cursor is unchanged.
    void clear() noexcept {
        for (auto& slot : slots_) {
            slot.reset();
        }
        size_ = 0;
    }

    /// @brief Next sequence number to be emitted.
    [[nodiscard]] SequenceNumber cursor() const noexcept { return cursor_; }

    [[nodiscard]] std::size_t capacity() const noexcept { return slots_.size(); }

    /// @brief Number of buffered items.
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

private:
    [[nodiscard]] std::size_t slotIndex(SequenceNumber seq) const noexcept {
        return static_cast<std::size_t>(seq % slots_.size());
    }

    std::vector<std::optional<T>> slots_;
    SequenceNumber cursor_;
    std::size_t size_ = 0;
};

}  // namespace pw::stream

#endif  // PW_STREAM_REORDER_BUFFER_H
