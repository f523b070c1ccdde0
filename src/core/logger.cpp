// CaveGen Core
// logger.cpp - Logger sink setup and level parsing

#include <cavegen/core/logger.hpp>
#include <cavegen/platform/file_io.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <string>
#include <vector>

namespace cavegen::core {

namespace {

constexpr size_t MAX_LOG_FILE_BYTES = 5 * 1024 * 1024;
constexpr size_t MAX_LOG_FILES = 3;

std::mutex& state_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::filesystem::path& active_log_file() {
    static std::filesystem::path path;
    return path;
}

}  // namespace

LogLevel parse_log_level(std::string_view name, LogLevel fallback) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "off") return LogLevel::Off;
    return fallback;
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
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
        case LogLevel::Off:
            return spdlog::level::off;
    }
    return spdlog::level::info;
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard lock(state_mutex());
    if (spdlog::get(NAME)) {
        return;
    }

    // stderr keeps stdout free for command output
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(to_spdlog_level(config.console_level));
    console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    std::vector<spdlog::sink_ptr> sinks{console_sink};
    spdlog::level::level_enum threshold = console_sink->level();

    std::filesystem::path log_path;
    if (config.file_output) {
        const std::filesystem::path directory = config.log_directory.empty()
                                                    ? platform::FileSystem::get_user_data_directory() / "logs"
                                                    : config.log_directory;
        try {
            if (platform::FileSystem::create_directories(directory)) {
                log_path = directory / FILE_NAME;
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_path.string(), MAX_LOG_FILE_BYTES, MAX_LOG_FILES);
                file_sink->set_level(spdlog::level::debug);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(file_sink);
                threshold = std::min(threshold, spdlog::level::debug);
            }
        } catch (const spdlog::spdlog_ex& ex) {
            spdlog::error("Log file unavailable: {}", ex.what());
            log_path.clear();
        }
    }

    auto logger = std::make_shared<spdlog::logger>(NAME, sinks.begin(), sinks.end());
    logger->set_level(threshold);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    active_log_file() = log_path;

    logger->debug("[{}] Logger initialized{}", log_category::CLI,
                  log_path.empty() ? std::string() : fmt::format(", writing {}", log_path.string()));
}

void Logger::shutdown() {
    std::lock_guard lock(state_mutex());
    if (auto logger = spdlog::get(NAME)) {
        logger->flush();
        spdlog::drop(NAME);
    }
    active_log_file().clear();
}

bool Logger::is_initialized() {
    return spdlog::get(NAME) != nullptr;
}

std::filesystem::path Logger::log_file() {
    std::lock_guard lock(state_mutex());
    return active_log_file();
}

std::shared_ptr<spdlog::logger> Logger::active() {
    if (auto logger = spdlog::get(NAME)) {
        return logger;
    }
    return spdlog::default_logger();
}

}  // namespace cavegen::core
