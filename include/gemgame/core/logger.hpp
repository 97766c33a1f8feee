// GemGame Core
// logger.hpp - Category-aware logging on top of spdlog

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace gemgame::core {

// Log levels matching spdlog for easy conversion
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    bool log_to_file = false;
    std::filesystem::path log_directory;  // Empty = <user data dir>/logs
    std::string log_filename = "gemgame.log";
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 3;
    bool colored_output = true;
};

// Static logging interface. Usable before initialize(): messages then go
// straight to spdlog's default logger.
class Logger {
public:
    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

    static void set_category_level(std::string_view category, LogLevel level);
    [[nodiscard]] static LogLevel get_category_level(std::string_view category);

    static void set_global_level(LogLevel level);
    [[nodiscard]] static LogLevel get_global_level();

    static void flush();

    template<typename... Args>
    static void trace(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Trace, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Debug, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Info, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Warn, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Error, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Critical, category, fmt, std::forward<Args>(args)...);
    }

private:
    Logger() = delete;

    template<typename... Args>
    static void log_impl(LogLevel level, std::string_view category,
                         fmt::format_string<Args...> fmt, Args&&... args) {
        if (!should_log(level, category)) {
            return;
        }
        auto message = fmt::format(fmt, std::forward<Args>(args)...);
        log_message(level, category, message);
    }

    [[nodiscard]] static bool should_log(LogLevel level, std::string_view category);
    static void log_message(LogLevel level, std::string_view category, std::string_view message);
};

// Parses "trace", "debug", "info", "warn", "error", "critical" or "off".
// Unknown names yield the fallback.
[[nodiscard]] LogLevel parse_log_level(std::string_view name, LogLevel fallback = LogLevel::Info);

namespace log_category {
    inline constexpr const char* SERVER = "server";
    inline constexpr const char* CLIENT = "client";
    inline constexpr const char* NETWORK = "network";
    inline constexpr const char* WORLD = "world";
    inline constexpr const char* TERRAIN = "terrain";
    inline constexpr const char* STORAGE = "storage";
    inline constexpr const char* PROTOCOL = "protocol";
    inline constexpr const char* CONFIG = "config";
}  // namespace log_category

}  // namespace gemgame::core

#define GEMGAME_LOG_TRACE(category, ...) \
    ::gemgame::core::Logger::trace(category, __VA_ARGS__)

#define GEMGAME_LOG_DEBUG(category, ...) \
    ::gemgame::core::Logger::debug(category, __VA_ARGS__)

#define GEMGAME_LOG_INFO(category, ...) \
    ::gemgame::core::Logger::info(category, __VA_ARGS__)

#define GEMGAME_LOG_WARN(category, ...) \
    ::gemgame::core::Logger::warn(category, __VA_ARGS__)

#define GEMGAME_LOG_ERROR(category, ...) \
    ::gemgame::core::Logger::error(category, __VA_ARGS__)

#define GEMGAME_LOG_CRITICAL(category, ...) \
    ::gemgame::core::Logger::critical(category, __VA_ARGS__)
