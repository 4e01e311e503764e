#include "fine2d/core/logging.hpp"

#include <cstdio>
#include <ctime>
#include <chrono>

namespace fine2d {

namespace {

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:   return "TRACE";
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

const char* categoryName(LogCategory category) {
    switch (category) {
        case LogCategory::Core:     return "Core";
        case LogCategory::Vulkan:   return "Vulkan";
        case LogCategory::Resource: return "Resource";
        case LogCategory::Render:   return "Render";
        case LogCategory::Batch:    return "Batch";
        case LogCategory::Timing:   return "Timing";
        case LogCategory::Scaling:  return "Scaling";
        case LogCategory::Game:     return "Game";
    }
    return "Unknown";
}

} // anonymous namespace

Logger& Logger::global() {
    static Logger instance;
    return instance;
}

void Logger::log(LogLevel level, LogCategory category, std::string_view message,
                 const char* file, int line) {
    if (!enabled(level)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    int millis = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000);

    char stamp[16];
    std::strftime(stamp, sizeof(stamp), "%H:%M:%S", std::localtime(&seconds));

    // Location suffix only for macro call sites
    char location[256] = "";
    if (file && line > 0) {
        std::snprintf(location, sizeof(location), " (%s:%d)", file, line);
    }

    FILE* out = level >= LogLevel::Warning ? stderr : stdout;
    std::fprintf(out, "[%s.%03d] [%-7s] [%-8s] %.*s%s\n",
                 stamp, millis, levelName(level), categoryName(category),
                 static_cast<int>(message.size()), message.data(), location);
    std::fflush(out);
}

void Logger::vulkanMessage(LogLevel level, std::string_view message) {
    log(level, LogCategory::Vulkan, message);
}

} // namespace fine2d
