/**
 * @file Logger.hpp
 * @brief Process-wide spdlog logger for the render pipeline.
 *
 * Render workers, the encoder consumer and the job driver all log through
 * one thread-safe logger. The console sink shows the thread id so frame
 * work can be told apart; the rotating file sink also records the source
 * location.
 *
 * @section Dependencies
 * - spdlog
 */

#pragma once
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace lf {

struct LogOptions {
    spdlog::level::level_enum level{spdlog::level::info};
    bool console{true};
    // Directory for the rotating log file; unset uses <cache dir>/logs
    std::optional<std::filesystem::path> directory;
    std::size_t maxFileSize{5 * 1024 * 1024};
    std::size_t maxFiles{3};
};

class Logger {
public:
    static void init(std::string_view appName = "lyricforge",
                     bool debug = false);
    static void init(std::string_view appName, const LogOptions& options);
    static void shutdown();

    static std::shared_ptr<spdlog::logger>& get();

    // Path of the active log file, empty when file logging is unavailable
    static std::filesystem::path logFile();

    // Accepts spdlog level names ("trace", "debug", "info", "warn", ...)
    static spdlog::level::level_enum parseLevel(std::string_view name);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::filesystem::path logFile_;
};

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(lf::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(lf::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(lf::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(lf::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(lf::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(lf::Logger::get(), __VA_ARGS__)

} // namespace lf
