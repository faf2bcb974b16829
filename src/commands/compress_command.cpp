// =============================================================================
// pooled-writer - Compress Command Implementation
// =============================================================================

#include "compress_command.h"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <system_error>

#include <fmt/format.h>

#include "pw/common/logger.h"
#include "pw/io/sink.h"
#include "pw/pool/pool.h"
#include "pw/stream/stream.h"

namespace pw::commands {

namespace {

/// @brief One input file and the stream compressing it.
struct FileJob {
    std::filesystem::path input;
    std::filesystem::path output;
    std::ifstream in;
    std::unique_ptr<stream::Stream> out;

    /// @brief The output file has been created on disk.
    bool created = false;

    bool done = false;
};

Error withPath(const Error& error, const std::filesystem::path& path) {
    return Error{error.code(), fmt::format("{}: {}", path.string(), error.message())};
}

/// @brief Abort every unfinished stream and delete its output file.
void discardUnfinished(std::vector<FileJob>& jobs) {
    for (auto& job : jobs) {
        if (job.done || !job.created) {
            continue;
        }
        if (job.out) {
            job.out->abort();
            job.out.reset();
        }
        std::error_code ec;
        if (std::filesystem::remove(job.output, ec)) {
            PW_LOG_WARNING("Removed incomplete output: {}", job.output.string());
        } else if (ec) {
            PW_LOG_WARNING("Failed to remove incomplete output {}: {}", job.output.string(),
                           ec.message());
        }
    }
}

}  // namespace

std::filesystem::path outputPathFor(const std::filesystem::path& input,
                                    const std::filesystem::path& outputDir,
                                    codec::CodecKind kind) {
    std::filesystem::path name = input.filename();
    name += std::string(codec::codecFileExtension(kind));
    const auto dir = outputDir.empty() ? input.parent_path() : outputDir;
    return dir / name;
}

// =============================================================================
// CompressCommand Implementation
// =============================================================================

CompressCommand::CompressCommand(CompressOptions options) : options_(std::move(options)) {}

CompressCommand::~CompressCommand() = default;

CompressCommand::CompressCommand(CompressCommand&&) noexcept = default;
CompressCommand& CompressCommand::operator=(CompressCommand&&) noexcept = default;

int CompressCommand::execute() {
    const auto startTime = std::chrono::steady_clock::now();

    if (auto valid = validateOptions(); !valid) {
        PW_LOG_ERROR("{}", valid.error().message());
        return valid.error().exitCode();
    }

    if (auto result = runCompression(); !result) {
        PW_LOG_ERROR("Compression failed: {}", result.error().message());
        return result.error().exitCode();
    }

    stats_.elapsedSeconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();

    if (options_.showSummary) {
        printSummary();
    }
    return toExitCode(ErrorCode::kSuccess);
}

VoidResult CompressCommand::validateOptions() const {
    if (options_.inputs.empty()) {
        return makeVoidError(ErrorCode::kUsageError, "No input files given");
    }
    if (options_.readSize == 0) {
        return makeVoidError(ErrorCode::kUsageError, "Read size must be > 0");
    }

    std::error_code ec;
    if (!options_.outputDir.empty() && !std::filesystem::is_directory(options_.outputDir, ec)) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Output directory not found: {}",
                                         options_.outputDir.string()));
    }

    std::set<std::filesystem::path> outputs;
    for (const auto& input : options_.inputs) {
        if (!std::filesystem::is_regular_file(input, ec)) {
            return makeVoidError(ErrorCode::kIOError,
                                 fmt::format("Input file not found: {}", input.string()));
        }
        const auto output = outputPathFor(input, options_.outputDir, options_.compressor.kind);
        if (std::filesystem::equivalent(input, output, ec)) {
            return makeVoidError(ErrorCode::kUsageError,
                                 fmt::format("Output would overwrite input: {}", input.string()));
        }
        if (!outputs.insert(output.lexically_normal()).second) {
            return makeVoidError(ErrorCode::kUsageError,
                                 fmt::format("Two inputs map to the same output: {}",
                                             output.string()));
        }
        if (!options_.forceOverwrite && std::filesystem::exists(output, ec)) {
            return makeVoidError(ErrorCode::kIOError,
                                 fmt::format("Output file already exists: {} (use -f to overwrite)",
                                             output.string()));
        }
    }

    pool::PoolConfig poolConfig{options_.threads, options_.queueSize};
    if (auto valid = poolConfig.validate(); !valid) {
        return makeVoidError(ErrorCode::kUsageError, valid.error().message());
    }

    stream::StreamConfig streamConfig{options_.blockSize, options_.maxInFlight,
                                      options_.compressor};
    if (auto valid = streamConfig.validate(); !valid) {
        return makeVoidError(ErrorCode::kUsageError, valid.error().message());
    }
    return {};
}

VoidResult CompressCommand::runCompression() {
    auto poolResult = pool::Pool::create({options_.threads, options_.queueSize});
    if (!poolResult) {
        return makeVoidError(poolResult.error());
    }
    auto pool = std::move(*poolResult);

    const stream::StreamConfig streamConfig{options_.blockSize, options_.maxInFlight,
                                            options_.compressor};

    std::vector<FileJob> jobs;
    jobs.reserve(options_.inputs.size());
    auto fail = [&jobs](Error error) {
        discardUnfinished(jobs);
        return makeVoidError(std::move(error));
    };

    for (const auto& input : options_.inputs) {
        auto& job = jobs.emplace_back();
        job.input = input;
        job.output = outputPathFor(input, options_.outputDir, options_.compressor.kind);

        job.in.open(input, std::ios::binary);
        if (!job.in.is_open()) {
            return fail(Error{ErrorCode::kIOError,
                              fmt::format("Failed to open input: {}", input.string())});
        }

        auto sink = io::FileSink::open(job.output, options_.forceOverwrite);
        if (!sink) {
            return fail(sink.error());
        }
        job.created = true;
        auto out = stream::Stream::open(pool, std::move(*sink), streamConfig);
        if (!out) {
            return fail(withPath(out.error(), job.output));
        }
        job.out = std::move(*out);

        PW_LOG_DEBUG("Compressing {} -> {} (stream {})", job.input.string(), job.output.string(),
                     job.out->id());
    }

    PW_LOG_INFO("Compressing {} file(s) with {} on {} thread(s)", jobs.size(),
                codec::codecKindName(options_.compressor.kind), pool->threadCount());

    ByteBuffer chunk(options_.readSize);
    std::size_t remaining = jobs.size();
    while (remaining > 0) {
        for (auto& job : jobs) {
            if (job.done) {
                continue;
            }

            job.in.read(reinterpret_cast<char*>(chunk.data()),
                        static_cast<std::streamsize>(chunk.size()));
            const auto got = static_cast<std::size_t>(job.in.gcount());
            if (got > 0) {
                if (auto written = job.out->write(ByteSpan(chunk.data(), got)); !written) {
                    return fail(withPath(written.error(), job.output));
                }
            }

            if (job.in.eof()) {
                if (auto closed = job.out->close(); !closed) {
                    return fail(withPath(closed.error(), job.output));
                }
                const auto s = job.out->stats();
                stats_.inputBytes += s.bytesWritten;
                stats_.outputBytes += s.bytesEmitted;
                stats_.blocksWritten += s.blocksEmitted;
                ++stats_.filesCompressed;
                job.done = true;
                --remaining;
                PW_LOG_DEBUG("Finished {}: {} -> {} bytes", job.output.string(), s.bytesWritten,
                             s.bytesEmitted);
            } else if (!job.in) {
                return fail(Error{ErrorCode::kIOError,
                                  fmt::format("Failed to read input: {}", job.input.string())});
            }
        }
    }

    pool->shutdown();
    return {};
}

void CompressCommand::printSummary() const {
    std::cout << "\n=== Compression Summary ===" << std::endl;
    std::cout << "  Files:            " << stats_.filesCompressed << std::endl;
    std::cout << "  Input size:       " << stats_.inputBytes << " bytes" << std::endl;
    std::cout << "  Output size:      " << stats_.outputBytes << " bytes" << std::endl;
    std::cout << "  Blocks:           " << stats_.blocksWritten << std::endl;
    std::cout << "  Compression ratio: " << std::fixed << std::setprecision(2)
              << stats_.compressionRatio() << "x" << std::endl;
    std::cout << "  Elapsed time:     " << std::fixed << std::setprecision(2)
              << stats_.elapsedSeconds << " s" << std::endl;
    std::cout << "  Throughput:       " << std::fixed << std::setprecision(2)
              << stats_.throughputMbps() << " MB/s" << std::endl;
    std::cout << "===========================" << std::endl;
}

}  // namespace pw::commands
