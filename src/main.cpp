// =============================================================================
// pooled-writer - pwz Command-Line Tool
// =============================================================================
// Main entry point for pwz, built on CLI11:
// - Subcommand: compress
// - Global options: threads, verbosity, quiet, log file
//
// Exit codes follow pw::ErrorCode.
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "pw/codec/compressor.h"
#include "pw/common/error.h"
#include "pw/common/logger.h"
#include "pw/common/types.h"

#include "commands/compress_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "pwz: compress many files at once over a fixed pool of worker threads.\n"
    "Each output is written strictly in order regardless of which worker\n"
    "finishes a block first.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::size_t threads = 0;  // 0 = auto-detect
    int verbosity = 0;        // 0 = info, 1 = debug, 2+ = trace
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Compress Command Options
// =============================================================================

struct CliCompressOptions {
    std::vector<std::string> inputs;
    std::string outputDir;
    std::string codec = "bgzf";
    int level = pw::codec::kDefaultLevel;
    std::size_t blockSize = 0;
    std::size_t maxInFlight = pw::kDefaultMaxInFlight;
    std::size_t queueSize = 0;
    std::size_t readSize = pw::commands::kDefaultReadSize;
    bool force = false;
};

CliCompressOptions gCompressOpts;

void setupCompressCommand(CLI::App& app) {
    auto* compress = app.add_subcommand("compress", "Compress files, one output per input");
    compress->alias("c");

    compress->add_option("inputs", gCompressOpts.inputs, "Input files")
        ->required()
        ->check(CLI::ExistingFile);

    compress->add_option("-c,--codec", gCompressOpts.codec, "Codec: raw, gzip, bgzf, zstd")
        ->default_val("bgzf");

    compress->add_option("-l,--level", gCompressOpts.level,
                         "Compression level (gzip/bgzf 0-9, zstd 1-22; default per codec)");

    compress->add_option("-b,--block-size", gCompressOpts.blockSize,
                         "Uncompressed bytes per block (0 = codec default)")
        ->default_val(0);

    compress->add_option("--max-in-flight", gCompressOpts.maxInFlight,
                         "Maximum outstanding blocks per stream")
        ->default_val(pw::kDefaultMaxInFlight)
        ->check(CLI::PositiveNumber);

    compress->add_option("--queue-size", gCompressOpts.queueSize,
                         "Pool queue capacity (0 = 2 x threads)")
        ->default_val(0);

    compress->add_option("-o,--output-dir", gCompressOpts.outputDir,
                         "Output directory (default: beside each input)")
        ->check(CLI::ExistingDirectory);

    compress->add_flag("-f,--force", gCompressOpts.force, "Overwrite existing output files");

    compress->add_option("--read-size", gCompressOpts.readSize,
                         "Bytes read from each input per turn")
        ->default_val(pw::commands::kDefaultReadSize)
        ->check(CLI::PositiveNumber);
}

int runCompress() {
    auto kind = pw::codec::parseCodecKind(gCompressOpts.codec);
    if (!kind) {
        PW_LOG_ERROR("{}", kind.error().message());
        return kind.error().exitCode();
    }

    pw::commands::CompressOptions opts;
    opts.inputs.assign(gCompressOpts.inputs.begin(), gCompressOpts.inputs.end());
    opts.outputDir = gCompressOpts.outputDir;
    opts.compressor.kind = *kind;
    opts.compressor.level = gCompressOpts.level;
    opts.blockSize = gCompressOpts.blockSize;
    opts.maxInFlight = gCompressOpts.maxInFlight;
    opts.threads = gOptions.threads;
    opts.queueSize = gCompressOpts.queueSize;
    opts.readSize = gCompressOpts.readSize;
    opts.forceOverwrite = gCompressOpts.force;
    opts.showSummary = !gOptions.quiet;

    pw::commands::CompressCommand cmd(std::move(opts));
    return cmd.execute();
}

pw::log::Level logLevelFor(const GlobalOptions& options) noexcept {
    if (options.quiet) {
        return pw::log::Level::kError;
    }
    if (options.verbosity >= 2) {
        return pw::log::Level::kTrace;
    }
    if (options.verbosity == 1) {
        return pw::log::Level::kDebug;
    }
    return pw::log::Level::kInfo;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    app.add_option("-t,--threads", gOptions.threads, "Number of worker threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Only report errors");

    app.add_option("--log-file", gOptions.logFile, "Also write the log to this file");

    setupCompressCommand(app);
    app.require_subcommand(1);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int rc = app.exit(e);
        return rc == 0 ? EXIT_SUCCESS : pw::toExitCode(pw::ErrorCode::kUsageError);
    }

    try {
        pw::log::init(gOptions.logFile, logLevelFor(gOptions));
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return pw::toExitCode(pw::ErrorCode::kIOError);
    }

    int rc = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("compress")) {
            rc = runCompress();
        }
    } catch (const pw::PWException& ex) {
        PW_LOG_ERROR("Error: {}", ex.what());
        rc = ex.exitCode();
    } catch (const std::exception& ex) {
        PW_LOG_ERROR("Unexpected error: {}", ex.what());
        rc = pw::toExitCode(pw::ErrorCode::kChannelClosed);
    }

    pw::log::shutdown();
    return rc;
}
