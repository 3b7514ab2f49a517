// Brickfall Core
// logger.cpp - Logging system implementation

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <brickfall/core/config.hpp>
#include <brickfall/core/logger.hpp>
#include <brickfall/platform/file_io.hpp>

#include <array>
#include <mutex>
#include <utility>
#include <vector>

namespace brickfall::core {

namespace {

struct LoggerState {
    std::mutex mutex;
    bool initialized = false;
    LogLevel global_level = LogLevel::Info;
    std::map<std::string, LogLevel, std::less<>> category_levels;
    std::shared_ptr<spdlog::logger> logger;
};

LoggerState& state() {
    static LoggerState instance;
    return instance;
}

constexpr std::array<std::pair<std::string_view, LogLevel>, 8> LEVEL_NAMES = {{
    {"trace", LogLevel::Trace},
    {"debug", LogLevel::Debug},
    {"info", LogLevel::Info},
    {"warn", LogLevel::Warn},
    {"warning", LogLevel::Warn},
    {"error", LogLevel::Error},
    {"critical", LogLevel::Critical},
    {"off", LogLevel::Off},
}};

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
            return spdlog::level::trace;
        case LogLevel::Debug:
            return spdlog::level::debug;
        case LogLevel::Info:
            return spdlog::level::info;
        case LogLevel::Warn:
            return spdlog::level::warn;
        case LogLevel::Error:
            return spdlog::level::err;
        case LogLevel::Critical:
            return spdlog::level::critical;
        case LogLevel::Off:
            return spdlog::level::off;
    }
    return spdlog::level::info;
}

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

}  // namespace

LogLevel log_level_from_string(std::string_view name) {
    for (const auto& [text, level] : LEVEL_NAMES) {
        if (text == name) {
            return level;
        }
    }
    return LogLevel::Info;
}

std::map<std::string, LogLevel, std::less<>> parse_category_levels(std::string_view text) {
    std::map<std::string, LogLevel, std::less<>> levels;
    while (!text.empty()) {
        const auto comma = text.find(',');
        const std::string_view entry = text.substr(0, comma);
        text = comma == std::string_view::npos ? std::string_view{} : text.substr(comma + 1);

        const auto equals = entry.find('=');
        if (equals == std::string_view::npos) {
            continue;
        }
        const std::string_view category = trim(entry.substr(0, equals));
        if (!category.empty()) {
            levels[std::string(category)] = log_level_from_string(trim(entry.substr(equals + 1)));
        }
    }
    return levels;
}

LoggerConfig LoggerConfig::from_config(const Config& config) {
    LoggerConfig result;
    result.console_level =
        log_level_from_string(config.get_string(config_section::DEBUG, config_key::LOG_LEVEL, "info"));
    result.enable_file_log = config.get_bool(config_section::DEBUG, config_key::LOG_TO_FILE, false);
    result.category_levels = parse_category_levels(config.get_string(config_section::DEBUG, config_key::LOG_CATEGORIES));
    return result;
}

void Logger::initialize(const LoggerConfig& config) {
    if (is_initialized()) {
        return;
    }

    // Resolve the log file before locking; file helpers log through us
    std::filesystem::path log_path;
    if (config.enable_file_log) {
        const auto log_dir = config.log_directory.empty() ? platform::FileSystem::get_user_data_directory() / "logs"
                                                          : config.log_directory;
        if (platform::FileSystem::create_directories(log_dir) || platform::FileSystem::exists(log_dir)) {
            log_path = log_dir / config.log_filename;
        }
    }

    {
        auto& s = state();
        std::lock_guard lock(s.mutex);

        std::vector<spdlog::sink_ptr> sinks;
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_level(spdlog::level::trace);  // Category levels filter console output
        console->set_pattern("[%H:%M:%S] [%^%l%$] %v");
        sinks.push_back(console);

        if (!log_path.empty()) {
            try {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_path.string(), config.max_file_size, config.max_files);
                file->set_level(to_spdlog(config.file_level));
                file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(file);
            } catch (const spdlog::spdlog_ex& ex) {
                spdlog::warn("Log file '{}' unavailable: {}", log_path.string(), ex.what());
                log_path.clear();
            }
        }

        s.logger = std::make_shared<spdlog::logger>("brickfall", sinks.begin(), sinks.end());
        s.logger->set_level(spdlog::level::trace);  // Sinks filter
        s.logger->flush_on(spdlog::level::warn);

        s.global_level = config.console_level;
        s.category_levels = config.category_levels;
        s.initialized = true;
    }

    BRICKFALL_LOG_DEBUG(log_category::ENGINE, "Logger initialized ({} category overrides)",
                        config.category_levels.size());
    if (!log_path.empty()) {
        BRICKFALL_LOG_INFO(log_category::ENGINE, "Log file: {}", log_path.string());
    }
}

void Logger::shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (!s.initialized) {
        return;
    }

    s.logger->flush();
    s.logger.reset();
    s.category_levels.clear();
    s.initialized = false;
}

bool Logger::is_initialized() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.initialized;
}

void Logger::set_category_level(std::string_view category, LogLevel level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.category_levels[std::string(category)] = level;
}

LogLevel Logger::get_category_level(std::string_view category) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    const auto it = s.category_levels.find(category);
    return it != s.category_levels.end() ? it->second : s.global_level;
}

void Logger::set_global_level(LogLevel level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.global_level = level;
}

LogLevel Logger::get_global_level() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.global_level;
}

bool Logger::is_enabled(LogLevel level, std::string_view category) {
    if (level == LogLevel::Off) {
        return false;
    }

    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (!s.initialized) {
        return true;  // spdlog's default logger filters
    }
    const auto it = s.category_levels.find(category);
    const LogLevel threshold = it != s.category_levels.end() ? it->second : s.global_level;
    return static_cast<int>(level) >= static_cast<int>(threshold);
}

void Logger::flush() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.logger) {
        s.logger->flush();
    }
}

void Logger::write(LogLevel level, std::string_view category, std::string_view message) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.logger) {
        s.logger->log(to_spdlog(level), "[{}] {}", category, message);
    } else {
        spdlog::log(to_spdlog(level), "[{}] {}", category, message);
    }
}

}  // namespace brickfall::core
