// CaveGen Core
// logger.hpp - Category-tagged logging over a registered spdlog logger

#pragma once

#include <filesystem>
#include <memory>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace cavegen::core {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Off };

// Accepts trace, debug, info, warn, warning, error and off in any case
[[nodiscard]] LogLevel parse_log_level(std::string_view name, LogLevel fallback = LogLevel::Info);

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level);

struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;

    // Rotating file sink under log_directory, or <user data>/logs when empty
    bool file_output = false;
    std::filesystem::path log_directory;
};

/// Owns the "cavegen" logger in spdlog's registry. Before initialize() and
/// after shutdown() messages go to spdlog's default logger.
class Logger {
public:
    static constexpr const char* NAME = "cavegen";
    static constexpr const char* FILE_NAME = "cavegen.log";

    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

    // Path of the active log file, empty without a file sink
    [[nodiscard]] static std::filesystem::path log_file();

    template <typename... Args>
    static void log(LogLevel level, std::string_view category, fmt::format_string<Args...> format,
                    Args&&... args) {
        const auto target = active();
        const auto spdlog_level = to_spdlog_level(level);
        if (!target->should_log(spdlog_level)) {
            return;
        }
        target->log(spdlog_level, "[{}] {}", category, fmt::format(format, std::forward<Args>(args)...));
    }

private:
    Logger() = delete;

    [[nodiscard]] static std::shared_ptr<spdlog::logger> active();
};

namespace log_category {
    inline constexpr const char* GENERATION = "generation";
    inline constexpr const char* ANALYSIS = "analysis";
    inline constexpr const char* PLACEMENT = "placement";
    inline constexpr const char* PIPELINE = "pipeline";
    inline constexpr const char* CONFIG = "config";
    inline constexpr const char* CLI = "cli";
}  // namespace log_category

}  // namespace cavegen::core

#define CAVEGEN_LOG_TRACE(category, ...) ::cavegen::core::Logger::log(::cavegen::core::LogLevel::Trace, category, __VA_ARGS__)
#define CAVEGEN_LOG_DEBUG(category, ...) ::cavegen::core::Logger::log(::cavegen::core::LogLevel::Debug, category, __VA_ARGS__)
#define CAVEGEN_LOG_INFO(category, ...) ::cavegen::core::Logger::log(::cavegen::core::LogLevel::Info, category, __VA_ARGS__)
#define CAVEGEN_LOG_WARN(category, ...) ::cavegen::core::Logger::log(::cavegen::core::LogLevel::Warn, category, __VA_ARGS__)
#define CAVEGEN_LOG_ERROR(category, ...) ::cavegen::core::Logger::log(::cavegen::core::LogLevel::Error, category, __VA_ARGS__)
