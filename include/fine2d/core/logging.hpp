#pragma once

#include <string>
#include <string_view>
#include <cstdio>

namespace fine2d {

// Log levels
enum class LogLevel {
    Trace,      // Per-flush and per-tick detail
    Debug,      // Debug information
    Info,       // Informational messages
    Warning,    // Potential problems
    Error,      // Errors that allow recovery
    Fatal       // Unrecoverable errors
};

// Log categories
enum class LogCategory {
    Core,       // Loop lifecycle and context
    Vulkan,     // Vulkan API calls and validation
    Resource,   // Texture and canvas loading
    Render,     // Rendering operations
    Batch,      // Batch accumulation and flushes
    Timing,     // Frame clock
    Scaling,    // Virtual canvas scaling
    Game        // General game logic
};

/**
 * @brief Process-wide logger
 *
 * Writes "[HH:MM:SS.mmm] [LEVEL] [CATEGORY] message (file:line)". Warning and
 * above go to stderr, everything else to stdout.
 */
class Logger {
public:
    static Logger& global();

    void setMinLevel(LogLevel level) { minLevel_ = level; }
    LogLevel minLevel() const { return minLevel_; }

    bool enabled(LogLevel level) const { return level >= minLevel_; }

    void log(LogLevel level, LogCategory category, std::string_view message,
             const char* file = nullptr, int line = 0);

    /// Validation layer output, already mapped to a level by the debug messenger
    void vulkanMessage(LogLevel level, std::string_view message);

private:
    Logger() = default;
    LogLevel minLevel_ = LogLevel::Info;
};

// Logging macros with file/line info
#define FINE2D_LOG(level, category, msg) \
    do { \
        if (fine2d::Logger::global().enabled(level)) { \
            fine2d::Logger::global().log(level, category, msg, __FILE__, __LINE__); \
        } \
    } while (0)

#define FINE2D_TRACE(category, msg)   FINE2D_LOG(fine2d::LogLevel::Trace, category, msg)
#define FINE2D_DEBUG(category, msg)   FINE2D_LOG(fine2d::LogLevel::Debug, category, msg)
#define FINE2D_INFO(category, msg)    FINE2D_LOG(fine2d::LogLevel::Info, category, msg)
#define FINE2D_WARN(category, msg)    FINE2D_LOG(fine2d::LogLevel::Warning, category, msg)
#define FINE2D_ERROR(category, msg)   FINE2D_LOG(fine2d::LogLevel::Error, category, msg)
#define FINE2D_FATAL(category, msg)   FINE2D_LOG(fine2d::LogLevel::Fatal, category, msg)

} // namespace fine2d
