// =============================================================================
// pooled-writer - Common Type Definitions
// =============================================================================
// Core type aliases and constants shared by the pool, the streams and the
// codecs.
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef PW_COMMON_TYPES_H
#define PW_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>
#include <vector>

namespace pw {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Identifier of a stream, unique within the process.
using StreamId = std::uint64_t;

/// @brief Per-stream block sequence number, starting at 0.
using SequenceNumber = std::uint64_t;

/// @brief Owned byte buffer used for payloads and compressed blocks.
using ByteBuffer = std::vector<std::uint8_t>;

/// @brief Read-only view over bytes.
using ByteSpan = std::span<const std::uint8_t>;

// =============================================================================
// Constants
// =============================================================================

/// @brief Invalid stream ID sentinel value.
inline constexpr StreamId kInvalidStreamId = std::numeric_limits<StreamId>::max();

/// @brief Default bytes per block. Largest payload a BGZF block can carry.
inline constexpr std::size_t kDefaultBlockSize = 65280;

/// @brief Default bound on a stream's outstanding blocks.
inline constexpr std::size_t kDefaultMaxInFlight = 8;

/// @brief Upper bound on maxInFlight (one reorder slot per block).
inline constexpr std::size_t kMaxInFlightLimit = 65536;

/// @brief Queue slots per worker when no explicit queue size is configured.
inline constexpr std::size_t kQueueSlotsPerThread = 2;

/// @brief Fallback worker count when hardware concurrency is unknown.
inline constexpr std::size_t kFallbackThreadCount = 4;

/// @brief Upper bound on explicitly requested worker threads.
inline constexpr std::size_t kMaxPoolThreads = 1024;

// =============================================================================
// Helpers
// =============================================================================

/// @brief View a string as bytes.
[[nodiscard]] inline ByteSpan asBytes(std::string_view str) noexcept {
    return {reinterpret_cast<const std::uint8_t*>(str.data()), str.size()};
}

}  // namespace pw

#endif  // PW_COMMON_TYPES_H
