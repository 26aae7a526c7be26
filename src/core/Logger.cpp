#include "Logger.hpp"
#include <mutex>
#include <vector>
#include "util/FileUtils.hpp"

namespace lf {

std::shared_ptr<spdlog::logger> Logger::logger_;
std::filesystem::path Logger::logFile_;

namespace {

// Workers log from several threads; init/get must not race on logger_
std::recursive_mutex& loggerMutex() {
    static std::recursive_mutex m;
    return m;
}

} // namespace

void Logger::init(std::string_view appName, bool debug) {
    LogOptions options;
    options.level = debug ? spdlog::level::debug : spdlog::level::info;
    init(appName, options);
}

void Logger::init(std::string_view appName, const LogOptions& options) {
    std::lock_guard lock(loggerMutex());
    const std::string name(appName);
    spdlog::drop(name);
    logFile_.clear();

    std::vector<spdlog::sink_ptr> sinks;
    if (options.console) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("%^[%H:%M:%S.%e] [%l]%$ [%t] %v");
        sinks.push_back(console);
    }

    std::string fileError;
    try {
        auto logDir = options.directory.value_or(file::cacheDir() / "logs");
        if (!file::ensureDir(logDir)) {
            throw spdlog::spdlog_ex("cannot create " + logDir.string());
        }

        auto path = logDir / (name + ".log");
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), options.maxFileSize, options.maxFiles);
        sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");
        sinks.push_back(sink);
        logFile_ = path;
    } catch (const spdlog::spdlog_ex& ex) {
        fileError = ex.what();
    }

    logger_ = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger_->set_level(options.level);
    logger_->flush_on(spdlog::level::warn);

    spdlog::register_logger(logger_);
    spdlog::set_default_logger(logger_);

    if (!fileError.empty()) {
        LOG_WARN("File logging disabled: {}", fileError);
    } else {
        LOG_DEBUG("Log file: {}", logFile_.string());
    }
}

void Logger::shutdown() {
    std::lock_guard lock(loggerMutex());
    if (logger_) {
        logger_->flush();
    }
    logger_.reset();
    logFile_.clear();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    std::lock_guard lock(loggerMutex());
    if (!logger_) {
        init();
    }
    return logger_;
}

std::filesystem::path Logger::logFile() {
    std::lock_guard lock(loggerMutex());
    return logFile_;
}

spdlog::level::level_enum Logger::parseLevel(std::string_view name) {
    if (name == "warning")
        return spdlog::level::warn;
    // Unknown names map to off in spdlog; fall back to info instead
    auto level = spdlog::level::from_str(std::string(name));
    if (level == spdlog::level::off && name != "off")
        return spdlog::level::info;
    return level;
}

} // namespace lf
