#include "Config.hpp"
#include "ConfigLoader.hpp"

namespace lf {

Config::Config(const Config& other) {
    *this = other;
}

Config& Config::operator=(const Config& other) {
    if (this == &other)
        return *this;
    std::scoped_lock lock(mutex_, other.mutex_);
    configPath_ = other.configPath_;
    dirty_ = other.dirty_;
    debug_ = other.debug_;
    video_ = other.video_;
    canvas_ = other.canvas_;
    safeZone_ = other.safeZone_;
    styles_ = other.styles_;
    layout_ = other.layout_;
    effects_ = other.effects_;
    timing_ = other.timing_;
    sections_ = other.sections_;
    scheduler_ = other.scheduler_;
    recording_ = other.recording_;
    logging_ = other.logging_;
    return *this;
}

Result<void> Config::load(const fs::path& path) {
    std::lock_guard lock(mutex_);
    configPath_ = path;
    return ConfigLoader::load(*this, path);
}

Result<void> Config::loadFromString(std::string_view toml) {
    std::lock_guard lock(mutex_);
    return ConfigLoader::loadFromString(*this, toml);
}

Result<void> Config::loadDefault() {
    std::lock_guard lock(mutex_);
    return ConfigLoader::loadDefault(*this);
}

Result<void> Config::save(const fs::path& path) const {
    std::lock_guard lock(mutex_);
    return ConfigLoader::save(*this, path);
}

void Config::addStyleTemplate(const std::string& name, Style style) {
    std::lock_guard lock(mutex_);
    styles_.templates[name] = std::move(style);
    markDirty();
}

void Config::removeStyleTemplate(const std::string& name) {
    std::lock_guard lock(mutex_);
    styles_.templates.erase(name);
    markDirty();
}

LogOptions Config::logOptions() const {
    std::lock_guard lock(mutex_);
    LogOptions options;
    options.level = Logger::parseLevel(logging_.level);
    if (debug_ && options.level > spdlog::level::debug)
        options.level = spdlog::level::debug;
    options.console = logging_.console;
    if (!logging_.directory.empty())
        options.directory = logging_.directory;
    return options;
}

} // namespace lf
