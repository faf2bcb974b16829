// =============================================================================
// pooled-writer - Logger Module Implementation
// =============================================================================

#include "pw/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pw::log {

namespace {

std::atomic<quill::Logger*> gLogger{nullptr};

std::mutex gInitMutex;

}  // namespace

// =============================================================================
// Level Conversion
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

// =============================================================================
// Initialization
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);

    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::BackendOptions backendOptions;
    backendOptions.thread_name = "pw-log";
    quill::Backend::start(backendOptions);

    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (config.enableConsole || config.logFile.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("pw-console"));
    }

    if (!config.logFile.empty()) {
        auto fileSink = quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile,
            []() {
                quill::FileSinkConfig fileSinkConfig;
                fileSinkConfig.set_open_mode('w');
                return fileSinkConfig;
            }(),
            quill::FileEventNotifier{});
        sinks.push_back(std::move(fileSink));
    }

    quill::Logger* loggerPtr =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    loggerPtr->set_log_level(toQuillLevel(config.level));

    gLogger.store(loggerPtr, std::memory_order_release);
}

void init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = std::string(logFile);
    config.level = level;
    init(config);
}

// =============================================================================
// Access
// =============================================================================

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return logger() != nullptr;
}

void flush() {
    if (quill::Logger* loggerPtr = logger()) {
        loggerPtr->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (quill::Logger* loggerPtr = gLogger.exchange(nullptr, std::memory_order_acq_rel)) {
        loggerPtr->flush_log();
        quill::Backend::stop();
    }
}

}  // namespace pw::log
