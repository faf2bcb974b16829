// =============================================================================
// pooled-writer - Deflate-based Compressors (gzip, BGZF)
// =============================================================================
// Both variants run a one-shot deflate over a private z_stream per call, so a
// single compressor instance can serve every worker thread at once.
// =============================================================================

#include <zlib.h>

#include <algorithm>
#include <cstring>

#include <fmt/format.h>

#include "pw/codec/bgzf.h"
#include "pw/codec/compressor.h"

namespace pw::codec {

namespace {

/// gzip wrapper (RFC 1952 header and trailer written by zlib).
constexpr int kGzipWindowBits = 15 + 16;

/// Raw deflate, no wrapper.
constexpr int kRawDeflateWindowBits = -15;

constexpr int kMemLevel = 8;

/// Largest payload handed to zlib in one call (avail_in is 32 bits).
constexpr std::size_t kMaxGzipPayload = std::size_t{1} << 30;

void putLe16(std::uint8_t* out, std::uint32_t value) {
    out[0] = static_cast<std::uint8_t>(value & 0xff);
    out[1] = static_cast<std::uint8_t>((value >> 8) & 0xff);
}

void putLe32(std::uint8_t* out, std::uint32_t value) {
    putLe16(out, value & 0xffff);
    putLe16(out + 2, value >> 16);
}

/// @brief Deflate payload into out starting at offset.
/// @return Number of compressed bytes produced.
Result<std::size_t> deflateInto(ByteSpan payload, int level, int windowBits, ByteBuffer& out,
                                std::size_t offset) {
    z_stream strm{};
    int ret = deflateInit2(&strm, level, Z_DEFLATED, windowBits, kMemLevel, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        return makeError<std::size_t>(ErrorCode::kCompressionError,
                                      fmt::format("deflateInit2 failed: {}", ret));
    }

    const auto bound = deflateBound(&strm, static_cast<uLong>(payload.size()));
    out.resize(offset + bound);

    strm.next_in = const_cast<Bytef*>(payload.data());
    strm.avail_in = static_cast<uInt>(payload.size());
    strm.next_out = out.data() + offset;
    strm.avail_out = static_cast<uInt>(bound);

    ret = deflate(&strm, Z_FINISH);
    const std::size_t produced = strm.total_out;
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        return makeError<std::size_t>(
            ErrorCode::kCompressionError,
            fmt::format("deflate did not finish: {} ({})", ret, strm.msg ? strm.msg : "no message"));
    }
    return produced;
}

}  // namespace

// =============================================================================
// GzipCompressor
// =============================================================================

Result<ByteBuffer> GzipCompressor::compress(ByteSpan payload) const {
    if (payload.size() > kMaxGzipPayload) {
        return makeError<ByteBuffer>(
            ErrorCode::kCompressionError,
            fmt::format("gzip block of {} bytes exceeds {}", payload.size(), kMaxGzipPayload));
    }

    ByteBuffer out;
    auto produced = deflateInto(payload, level_, kGzipWindowBits, out, 0);
    if (!produced) {
        return std::unexpected(produced.error());
    }
    out.resize(*produced);
    return out;
}

std::size_t GzipCompressor::maxBlockSize() const noexcept {
    return kMaxGzipPayload;
}

// =============================================================================
// BgzfCompressor
// =============================================================================

Result<ByteBuffer> BgzfCompressor::compress(ByteSpan payload) const {
    if (payload.size() > bgzf::kMaxPayloadSize) {
        return makeError<ByteBuffer>(ErrorCode::kCompressionError,
                                     fmt::format("BGZF payload of {} bytes exceeds {}",
                                                 payload.size(), bgzf::kMaxPayloadSize));
    }

    ByteBuffer out;
    auto produced = deflateInto(payload, level_, kRawDeflateWindowBits, out, bgzf::kHeaderSize);
    if (!produced) {
        return std::unexpected(produced.error());
    }

    const std::size_t blockSize = bgzf::kHeaderSize + *produced + bgzf::kFooterSize;
    if (blockSize > bgzf::kMaxBlockSize) {
        return makeError<ByteBuffer>(
            ErrorCode::kCompressionError,
            fmt::format("BGZF block of {} bytes exceeds {}", blockSize, bgzf::kMaxBlockSize));
    }
    out.resize(blockSize);

    std::copy(bgzf::kHeaderTemplate.begin(), bgzf::kHeaderTemplate.end(), out.begin());
    putLe16(out.data() + 16, static_cast<std::uint32_t>(blockSize - 1));

    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, payload.data(), static_cast<uInt>(payload.size()));
    std::uint8_t* footer = out.data() + bgzf::kHeaderSize + *produced;
    putLe32(footer, static_cast<std::uint32_t>(crc));
    putLe32(footer + 4, static_cast<std::uint32_t>(payload.size()));

    return out;
}

ByteBuffer BgzfCompressor::trailer() const {
    return ByteBuffer(bgzf::kEofMarker.begin(), bgzf::kEofMarker.end());
}

std::size_t BgzfCompressor::maxBlockSize() const noexcept {
    return bgzf::kMaxPayloadSize;
}

}  // namespace pw::codec
