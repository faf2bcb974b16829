// =============================================================================
// pooled-writer - Block Compressor Capability
// =============================================================================
// Stateless, pluggable block compressors used by the pool workers.
//
// A Compressor is built once per stream from a CompressorConfig and shared
// read-only by every task of that stream. compress() and trailer() may be
// called concurrently from any number of worker threads: each call owns its
// codec state (z_stream, ZSTD_CCtx) for the duration of the call.
//
// Variants:
// - raw:  passthrough
// - gzip: one RFC 1952 member per block
// - bgzf: one BGZF block per block, EOF marker as trailer
// - zstd: one zstd frame per block
// =============================================================================

#ifndef PW_CODEC_COMPRESSOR_H
#define PW_CODEC_COMPRESSOR_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string_view>
#include <vector>

#include "pw/common/error.h"
#include "pw/common/types.h"

namespace pw::codec {

// =============================================================================
// Codec Selection
// =============================================================================

/// @brief Supported block compression algorithms.
enum class CodecKind : std::uint8_t {
    kRaw = 0,
    kGzip = 1,
    kBgzf = 2,
    kZstd = 3
};

/// @brief Level value meaning "use the codec's default level".
inline constexpr int kDefaultLevel = -1;

/// @brief Human-readable codec name ("raw", "gzip", "bgzf", "zstd").
[[nodiscard]] std::string_view codecKindName(CodecKind kind) noexcept;

/// @brief Parse a codec name (case-insensitive).
[[nodiscard]] Result<CodecKind> parseCodecKind(std::string_view name);

/// @brief Conventional file extension for a codec's output (".gz", ".zst", "").
[[nodiscard]] std::string_view codecFileExtension(CodecKind kind) noexcept;

/// @brief Default compression level for a codec.
[[nodiscard]] int defaultLevel(CodecKind kind) noexcept;

/// @brief Compressor configuration: algorithm and level.
struct CompressorConfig {
    CodecKind kind = CodecKind::kBgzf;

    /// @brief Compression level, or kDefaultLevel.
    /// @note gzip/bgzf accept 0-9, zstd accepts 1-22, raw ignores the level.
    int level = kDefaultLevel;

    /// @brief Level with kDefaultLevel resolved.
    [[nodiscard]] int effectiveLevel() const noexcept {
        return level == kDefaultLevel ? defaultLevel(kind) : level;
    }

    [[nodiscard]] VoidResult validate() const;

    friend bool operator==(const CompressorConfig&, const CompressorConfig&) = default;
};

// =============================================================================
// Compressor Interface
// =============================================================================

class Compressor {
public:
    virtual ~Compressor() = default;

    /// @brief Compress one block.
    /// @param payload Raw block bytes (at most maxBlockSize()).
    /// @return Compressed bytes, or kCompressionError.
    [[nodiscard]] virtual Result<ByteBuffer> compress(ByteSpan payload) const = 0;

    /// @brief Bytes appended once after a stream's final block (may be empty).
    [[nodiscard]] virtual ByteBuffer trailer() const { return {}; }

    /// @brief Largest payload a single compress() call accepts.
    [[nodiscard]] virtual std::size_t maxBlockSize() const noexcept {
        return std::numeric_limits<std::size_t>::max();
    }

    [[nodiscard]] virtual CodecKind kind() const noexcept = 0;

    [[nodiscard]] virtual int level() const noexcept { return 0; }
};

/// @brief Create the compressor for a configuration.
/// @return Shared read-only compressor, or the validation error.
[[nodiscard]] Result<std::shared_ptr<const Compressor>> makeCompressor(
    const CompressorConfig& config);

// =============================================================================
// Built-in Variants
// =============================================================================

class RawCompressor final : public Compressor {
public:
    [[nodiscard]] Result<ByteBuffer> compress(ByteSpan payload) const override;
    [[nodiscard]] CodecKind kind() const noexcept override { return CodecKind::kRaw; }
};

class GzipCompressor final : public Compressor {
public:
    explicit GzipCompressor(int level) : level_(level) {}

    [[nodiscard]] Result<ByteBuffer> compress(ByteSpan payload) const override;
    [[nodiscard]] std::size_t maxBlockSize() const noexcept override;
    [[nodiscard]] CodecKind kind() const noexcept override { return CodecKind::kGzip; }
    [[nodiscard]] int level() const noexcept override { return level_; }

private:
    int level_;
};

class BgzfCompressor final : public Compressor {
public:
    explicit BgzfCompressor(int level) : level_(level) {}

    [[nodiscard]] Result<ByteBuffer> compress(ByteSpan payload) const override;
    [[nodiscard]] ByteBuffer trailer() const override;
    [[nodiscard]] std::size_t maxBlockSize() const noexcept override;
    [[nodiscard]] CodecKind kind() const noexcept override { return CodecKind::kBgzf; }
    [[nodiscard]] int level() const noexcept override { return level_; }

private:
    int level_;
};

class ZstdCompressor final : public Compressor {
public:
    explicit ZstdCompressor(int level) : level_(level) {}

    [[nodiscard]] Result<ByteBuffer> compress(ByteSpan payload) const override;
    [[nodiscard]] CodecKind kind() const noexcept override { return CodecKind::kZstd; }
    [[nodiscard]] int level() const noexcept override { return level_; }

private:
    int level_;
};

}  // namespace pw::codec

#endif  // PW_CODEC_COMPRESSOR_H
