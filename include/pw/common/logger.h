// =============================================================================
// pooled-writer - Logger Module
// =============================================================================
// Low-latency asynchronous logging using the Quill library.
//
// The library logs through the PW_LOG_* macros below. They are no-ops until
// pw::log::init() has been called, so embedding applications that never
// initialise logging pay only a pointer load per call site.
//
// Usage:
//   pw::log::init("pwz.log", pw::log::Level::kDebug);
//   PW_LOG_INFO("pool started: threads={}", 8);
// =============================================================================

#ifndef PW_COMMON_LOGGER_H
#define PW_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace pw::log {

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console (stderr) output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "pw";
};

/// @brief Initialize the global logger. Later calls are ignored.
void init(const Config& config);

/// @brief Initialize the global logger with a file and a level.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance, or nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Block until all pending log messages are written.
void flush();

/// @brief Flush and stop the backend thread.
void shutdown();

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

}  // namespace pw::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define PW_LOG_IMPL_(quillMacro, fmt, ...)                                 \
    do {                                                                   \
        if (quill::Logger* pwLogger_ = ::pw::log::logger()) {              \
            quillMacro(pwLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);         \
        }                                                                  \
    } while (false)

#define PW_LOG_TRACE(fmt, ...) PW_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)
#define PW_LOG_DEBUG(fmt, ...) PW_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define PW_LOG_INFO(fmt, ...) PW_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define PW_LOG_WARNING(fmt, ...) PW_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define PW_LOG_ERROR(fmt, ...) PW_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define PW_LOG_CRITICAL(fmt, ...) PW_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // PW_COMMON_LOGGER_H
