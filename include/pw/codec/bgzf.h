// =============================================================================
// pooled-writer - BGZF Framing Constants
// =============================================================================
// Blocked GNU Zip Format, as used by SAM/BAM tooling. Each block is a gzip
// member carrying a "BC" extra subfield that records the total block size:
//
// 	+---+---+---+---+---+---+---+---+---+---+---+---+
// 	|x1F|x8B|x08|x04|     MTIME=0   |XFL|OS | XLEN=6|->
// 	+---+---+---+---+---+---+---+---+---+---+---+---+
// 	+---+---+---+---+---+---+=========+---+---+---+---+---+---+---+---+
// 	|x42|x43| SLEN=2| BSIZE |  CDATA  |     CRC32     |     ISIZE     |
// 	+---+---+---+---+---+---+=========+---+---+---+---+---+---+---+---+
//
// BSIZE  - total block size minus one
// CDATA  - raw deflate data (no zlib/gzip wrapper)
// CRC32  - CRC-32 of the uncompressed payload
// ISIZE  - uncompressed payload size
//
// A stream ends with the fixed 28-byte empty block below.
// =============================================================================

#ifndef PW_CODEC_BGZF_H
#define PW_CODEC_BGZF_H

#include <array>
#include <cstddef>
#include <cstdint>

namespace pw::codec::bgzf {

/// @brief Header length including the BC extra subfield.
inline constexpr std::size_t kHeaderSize = 18;

/// @brief CRC32 + ISIZE.
inline constexpr std::size_t kFooterSize = 8;

/// @brief Largest encoded block (BSIZE is 16 bits).
inline constexpr std::size_t kMaxBlockSize = 65536;

/// @brief Largest payload per block, leaving room for incompressible input.
inline constexpr std::size_t kMaxPayloadSize = 65280;

/// @brief Header template; bytes 16-17 receive BSIZE.
inline constexpr std::array<std::uint8_t, kHeaderSize> kHeaderTemplate = {
    0x1f, 0x8b, 0x08, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00,
    0xff, 0x06, 0x00, 0x42, 0x43, 0x02, 0x00, 0x00, 0x00};

/// @brief End-of-file marker block.
inline constexpr std::array<std::uint8_t, 28> kEofMarker = {
    0x1f, 0x8b, 0x08, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0xff,
    0x06, 0x00, 0x42, 0x43, 0x02, 0x00, 0x1b, 0x00, 0x03, 0x00,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};

}  // namespace pw::codec::bgzf

#endif  // PW_CODEC_BGZF_H
