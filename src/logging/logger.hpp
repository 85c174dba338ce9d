//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// logging/logger.hpp
//
// Logging utilities based on spdlog
//===----------------------------------------------------------------------===//

#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace pgmux {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5
};

class Logger {
public:
    // Initialize logging system (console, plus rotating file when log_file is set)
    static void Initialize(const std::string& log_file = "",
                          const std::string& log_level = "info");

    static void Shutdown();

    // Get the main logger instance, initializing with defaults on first use
    static std::shared_ptr<spdlog::logger>& Get();

    static void SetLevel(LogLevel level);
    static void SetLevel(const std::string& level);

    static void Flush();

    // Convert between log levels
    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level);
    static spdlog::level::level_enum ToSpdlogLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static bool initialized_;
};

} // namespace pgmux

// Usage: LOG_INFO("pool", "created connection " + std::to_string(id))

#define LOG_TRACE(component, message) \
    do { \
        if (pgmux::Logger::Get()->should_log(spdlog::level::trace)) \
            pgmux::Logger::Get()->trace("[{}] {}", component, message); \
    } while(0)

#define LOG_DEBUG(component, message) \
    do { \
        if (pgmux::Logger::Get()->should_log(spdlog::level::debug)) \
            pgmux::Logger::Get()->debug("[{}] {}", component, message); \
    } while(0)

#define LOG_INFO(component, message) \
    do { \
        if (pgmux::Logger::Get()->should_log(spdlog::level::info)) \
            pgmux::Logger::Get()->info("[{}] {}", component, message); \
    } while(0)

#define LOG_WARN(component, message) \
    do { \
        if (pgmux::Logger::Get()->should_log(spdlog::level::warn)) \
            pgmux::Logger::Get()->warn("[{}] {}", component, message); \
    } while(0)

#define LOG_ERROR(component, message) \
    do { \
        if (pgmux::Logger::Get()->should_log(spdlog::level::err)) \
            pgmux::Logger::Get()->error("[{}] {}", component, message); \
    } while(0)

#define LOG_FATAL(component, message) \
    do { \
        if (pgmux::Logger::Get()->should_log(spdlog::level::critical)) \
            pgmux::Logger::Get()->critical("[{}] {}", component, message); \
    } while(0)
