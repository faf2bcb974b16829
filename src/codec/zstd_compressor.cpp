// =============================================================================
// pooled-writer - Zstandard Compressor
// =============================================================================

#include <zstd.h>

#include <memory>
#include <string>

#include <fmt/format.h>

#include "pw/codec/compressor.h"

namespace pw::codec {

namespace {

struct CCtxDeleter {
    void operator()(ZSTD_CCtx* ctx) const noexcept { ZSTD_freeCCtx(ctx); }
};

using CCtxPtr = std::unique_ptr<ZSTD_CCtx, CCtxDeleter>;

}  // namespace

Result<ByteBuffer> ZstdCompressor::compress(ByteSpan payload) const {
    CCtxPtr ctx(ZSTD_createCCtx());
    if (!ctx) {
        return makeError<ByteBuffer>(ErrorCode::kCompressionError,
                                     "Failed to create zstd compression context");
    }

    std::size_t const cBuffSize = ZSTD_compressBound(payload.size());
    ByteBuffer out(cBuffSize);

    std::size_t const cSize = ZSTD_compressCCtx(ctx.get(), out.data(), out.size(), payload.data(),
                                                payload.size(), level_);
    if (ZSTD_isError(cSize)) {
        return makeError<ByteBuffer>(
            ErrorCode::kCompressionError,
            fmt::format("Zstd compression failed: {}", ZSTD_getErrorName(cSize)));
    }

    out.resize(cSize);
    return out;
}

}  // namespace pw::codec
