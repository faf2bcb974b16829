// =============================================================================
// pooled-writer - Compress Command
// =============================================================================
// `pwz compress`: compresses M input files into M output files, driving all
// M streams from one thread over a shared pool of N workers.
//
// Inputs are read in fixed-size chunks, round-robin across every open
// stream, so the pool sees blocks from all streams interleaved.
// =============================================================================

#ifndef PW_COMMANDS_COMPRESS_COMMAND_H
#define PW_COMMANDS_COMPRESS_COMMAND_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

#include "pw/codec/compressor.h"
#include "pw/common/error.h"
#include "pw/common/types.h"

namespace pw::commands {

/// @brief Default bytes read from an input per round-robin turn.
inline constexpr std::size_t kDefaultReadSize = 64 * 1024;

// =============================================================================
// Compression Options
// =============================================================================

struct CompressOptions {
    /// @brief Input files, one output stream each.
    std::vector<std::filesystem::path> inputs;

    /// @brief Output directory (empty = beside each input).
    std::filesystem::path outputDir;

    codec::CompressorConfig compressor;

    /// @brief Bytes per block (0 = codec default).
    std::size_t blockSize = 0;

    std::size_t maxInFlight = kDefaultMaxInFlight;

    /// @brief Worker threads (0 = auto).
    std::size_t threads = 0;

    /// @brief Pool queue capacity (0 = 2 * threads).
    std::size_t queueSize = 0;

    std::size_t readSize = kDefaultReadSize;

    /// @brief Overwrite existing outputs.
    bool forceOverwrite = false;

    /// @brief Print the summary table when done.
    bool showSummary = true;
};

/// @brief Output path for one input: DIR/<name><ext>.
[[nodiscard]] std::filesystem::path outputPathFor(const std::filesystem::path& input,
                                                  const std::filesystem::path& outputDir,
                                                  codec::CodecKind kind);

// =============================================================================
// Compression Statistics
// =============================================================================

struct CompressionStats {
    std::uint64_t filesCompressed = 0;
    std::uint64_t inputBytes = 0;
    std::uint64_t outputBytes = 0;
    std::uint64_t blocksWritten = 0;
    double elapsedSeconds = 0.0;

    [[nodiscard]] double compressionRatio() const noexcept {
        return outputBytes > 0 ? static_cast<double>(inputBytes) / outputBytes : 0.0;
    }

    [[nodiscard]] double throughputMbps() const noexcept {
        return elapsedSeconds > 0
                   ? (static_cast<double>(inputBytes) / (1024 * 1024)) / elapsedSeconds
                   : 0.0;
    }
};

// =============================================================================
// CompressCommand Class
// =============================================================================

class CompressCommand {
public:
    explicit CompressCommand(CompressOptions options);

    ~CompressCommand();

    CompressCommand(const CompressCommand&) = delete;
    CompressCommand& operator=(const CompressCommand&) = delete;
    CompressCommand(CompressCommand&&) noexcept;
    CompressCommand& operator=(CompressCommand&&) noexcept;

    /// @brief Run the command.
    /// @return Exit code (0 = success, otherwise an ErrorCode value).
    [[nodiscard]] int execute();

    [[nodiscard]] const CompressionStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const CompressOptions& options() const noexcept { return options_; }

private:
    /// @brief Check inputs, output collisions and sizes.
    [[nodiscard]] VoidResult validateOptions() const;

    /// @brief Open every stream and pump the inputs through them.
    [[nodiscard]] VoidResult runCompression();

    void printSummary() const;

    CompressOptions options_;
    CompressionStats stats_;
};

}  // namespace pw::commands

#endif  // PW_COMMANDS_COMPRESS_COMMAND_H
