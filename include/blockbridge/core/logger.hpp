// blockbridge Core
// logger.hpp - Logging system with categories and file output

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace blockbridge::core {

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

// Parse "trace", "debug", ... "off" (case-sensitive)
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);
[[nodiscard]] const char* log_level_name(LogLevel level);

// Logger configuration
struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    bool file_enabled = true;
    std::filesystem::path log_directory;  // Empty = use default user data dir
    std::string log_filename = "blockbridge.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 3;                      // Rotating backup count
    bool include_timestamps = true;
};

// Static logging interface
class Logger {
public:
    // Initialize/shutdown (call once at startup/exit)
    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

    // Category-based level control
    static void set_category_level(std::string_view category, LogLevel level);
    [[nodiscard]] static LogLevel get_category_level(std::string_view category);

    // Global level (default for unconfigured categories)
    static void set_global_level(LogLevel level);
    [[nodiscard]] static LogLevel get_global_level();

    // Lowest level any category currently emits; messages below it are dropped without locking
    [[nodiscard]] static LogLevel get_level_floor();

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
    Logger() = delete;  // Static-only class

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

// Pre-defined log categories for consistency
namespace log_category {
    inline constexpr const char* ENGINE = "engine";
    inline constexpr const char* GRAPHICS = "graphics";
    inline constexpr const char* PALETTE = "palette";
    inline constexpr const char* GL = "gl";
    inline constexpr const char* CONFIG = "config";
}  // namespace log_category

}  // namespace blockbridge::core

// Convenience logging macros - performance-friendly (check level before formatting)
#define BLOCKBRIDGE_LOG_TRACE(category, ...) \
    ::blockbridge::core::Logger::trace(category, __VA_ARGS__)

#define BLOCKBRIDGE_LOG_DEBUG(category, ...) \
    ::blockbridge::core::Logger::debug(category, __VA_ARGS__)

#define BLOCKBRIDGE_LOG_INFO(category, ...) \
    ::blockbridge::core::Logger::info(category, __VA_ARGS__)

#define BLOCKBRIDGE_LOG_WARN(category, ...) \
    ::blockbridge::core::Logger::warn(category, __VA_ARGS__)

#define BLOCKBRIDGE_LOG_ERROR(category, ...) \
    ::blockbridge::core::Logger::error(category, __VA_ARGS__)

#define BLOCKBRIDGE_LOG_CRITICAL(category, ...) \
    ::blockbridge::core::Logger::critical(category, __VA_ARGS__)
