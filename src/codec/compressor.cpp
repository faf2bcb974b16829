// =============================================================================
// pooled-writer - Compressor Selection and Configuration
// =============================================================================

#include "pw/codec/compressor.h"

#include <algorithm>
#include <cctype>
#include <string>

#include <fmt/format.h>

namespace pw::codec {

namespace {

constexpr int kMinDeflateLevel = 0;
constexpr int kMaxDeflateLevel = 9;
constexpr int kMinZstdLevel = 1;
constexpr int kMaxZstdLevel = 22;

constexpr int kDefaultGzipLevel = 6;
constexpr int kDefaultBgzfLevel = 5;
constexpr int kDefaultZstdLevel = 3;

}  // namespace

std::string_view codecKindName(CodecKind kind) noexcept {
    switch (kind) {
        case CodecKind::kRaw:
            return "raw";
        case CodecKind::kGzip:
            return "gzip";
        case CodecKind::kBgzf:
            return "bgzf";
        case CodecKind::kZstd:
            return "zstd";
    }
    return "unknown";
}

Result<CodecKind> parseCodecKind(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "raw" || lower == "none") {
        return CodecKind::kRaw;
    }
    if (lower == "gzip" || lower == "gz") {
        return CodecKind::kGzip;
    }
    if (lower == "bgzf" || lower == "bgzip") {
        return CodecKind::kBgzf;
    }
    if (lower == "zstd" || lower == "zst") {
        return CodecKind::kZstd;
    }
    return makeError<CodecKind>(ErrorCode::kUnsupportedCodec,
                                fmt::format("unknown codec '{}'", name));
}

std::string_view codecFileExtension(CodecKind kind) noexcept {
    switch (kind) {
        case CodecKind::kGzip:
        case CodecKind::kBgzf:
            return ".gz";
        case CodecKind::kZstd:
            return ".zst";
        case CodecKind::kRaw:
            return "";
    }
    return "";
}

int defaultLevel(CodecKind kind) noexcept {
    switch (kind) {
        case CodecKind::kGzip:
            return kDefaultGzipLevel;
        case CodecKind::kBgzf:
            return kDefaultBgzfLevel;
        case CodecKind::kZstd:
            return kDefaultZstdLevel;
        case CodecKind::kRaw:
            return 0;
    }
    return 0;
}

// =============================================================================
// CompressorConfig
// =============================================================================

VoidResult CompressorConfig::validate() const {
    const int lvl = effectiveLevel();
    switch (kind) {
        case CodecKind::kRaw:
            return {};
        case CodecKind::kGzip:
        case CodecKind::kBgzf:
            if (lvl < kMinDeflateLevel || lvl > kMaxDeflateLevel) {
                return makeVoidError(
                    ErrorCode::kInvalidArgument,
                    fmt::format("{} level must be between {} and {}, got {}",
                                codecKindName(kind), kMinDeflateLevel, kMaxDeflateLevel, lvl));
            }
            return {};
        case CodecKind::kZstd:
            if (lvl < kMinZstdLevel || lvl > kMaxZstdLevel) {
                return makeVoidError(
                    ErrorCode::kInvalidArgument,
                    fmt::format("zstd level must be between {} and {}, got {}", kMinZstdLevel,
                                kMaxZstdLevel, lvl));
            }
            return {};
    }
    return makeVoidError(ErrorCode::kUnsupportedCodec,
                         fmt::format("unknown codec id {}", static_cast<int>(kind)));
}

// =============================================================================
// Factory
// =============================================================================

Result<std::shared_ptr<const Compressor>> makeCompressor(const CompressorConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }

    const int lvl = config.effectiveLevel();
    switch (config.kind) {
        case CodecKind::kRaw:
            return std::make_shared<const RawCompressor>();
        case CodecKind::kGzip:
            return std::make_shared<const GzipCompressor>(lvl);
        case CodecKind::kBgzf:
            return std::make_shared<const BgzfCompressor>(lvl);
        case CodecKind::kZstd:
            return std::make_shared<const ZstdCompressor>(lvl);
    }
    return makeError<std::shared_ptr<const Compressor>>(ErrorCode::kUnsupportedCodec,
                                                        "unknown codec");
}

// =============================================================================
// RawCompressor
// =============================================================================

Result<ByteBuffer> RawCompressor::compress(ByteSpan payload) const {
    return ByteBuffer(payload.begin(), payload.end());
}

}  // namespace pw::codec
