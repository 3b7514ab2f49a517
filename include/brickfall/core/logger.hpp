// Brickfall Core
// logger.hpp - Category-based logging on top of spdlog

#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace brickfall::core {

class Config;

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// "trace", "debug", "info", ... (unknown names map to Info)
[[nodiscard]] LogLevel log_level_from_string(std::string_view name);

// Parse "destruction=debug,level=trace" into per-category levels
[[nodiscard]] std::map<std::string, LogLevel, std::less<>> parse_category_levels(std::string_view text);

struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    bool enable_file_log = true;
    std::filesystem::path log_directory;  // Empty = <user data>/logs
    std::string log_filename = "brickfall.log";
    size_t max_file_size = 2 * 1024 * 1024;
    size_t max_files = 2;
    std::map<std::string, LogLevel, std::less<>> category_levels;

    // Reads the [debug] section: log_level, log_to_file, log_categories
    [[nodiscard]] static LoggerConfig from_config(const Config& config);
};

// Static logging interface shared by every subsystem
class Logger {
public:
    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

    static void set_category_level(std::string_view category, LogLevel level);
    [[nodiscard]] static LogLevel get_category_level(std::string_view category);

    // Level for categories without an override
    static void set_global_level(LogLevel level);
    [[nodiscard]] static LogLevel get_global_level();

    [[nodiscard]] static bool is_enabled(LogLevel level, std::string_view category);

    static void flush();

    template<typename... Args>
    static void log(LogLevel level, std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        if (!is_enabled(level, category)) {
            return;
        }
        write(level, category, fmt::format(fmt, std::forward<Args>(args)...));
    }

private:
    Logger() = delete;

    static void write(LogLevel level, std::string_view category, std::string_view message);
};

namespace log_category {
    inline constexpr const char* ENGINE = "engine";
    inline constexpr const char* GRID = "grid";
    inline constexpr const char* DESTRUCTION = "destruction";
    inline constexpr const char* LEVEL = "level";
    inline constexpr const char* ENDLESS = "endless";
    inline constexpr const char* GAMEPLAY = "gameplay";
    inline constexpr const char* CONFIG = "config";
    inline constexpr const char* FILE_IO = "file_io";
}  // namespace log_category

}  // namespace brickfall::core

// Level is checked before the message is formatted
#define BRICKFALL_LOG_TRACE(category, ...) \
    ::brickfall::core::Logger::log(::brickfall::core::LogLevel::Trace, category, __VA_ARGS__)

#define BRICKFALL_LOG_DEBUG(category, ...) \
    ::brickfall::core::Logger::log(::brickfall::core::LogLevel::Debug, category, __VA_ARGS__)

#define BRICKFALL_LOG_INFO(category, ...) \
    ::brickfall::core::Logger::log(::brickfall::core::LogLevel::Info, category, __VA_ARGS__)

#define BRICKFALL_LOG_WARN(category, ...) \
    ::brickfall::core::Logger::log(::brickfall::core::LogLevel::Warn, category, __VA_ARGS__)

#define BRICKFALL_LOG_ERROR(category, ...) \
    ::brickfall::core::Logger::log(::brickfall::core::LogLevel::Error, category, __VA_ARGS__)

#define BRICKFALL_LOG_CRITICAL(category, ...) \
    ::brickfall::core::Logger::log(::brickfall::core::LogLevel::Critical, category, __VA_ARGS__)
