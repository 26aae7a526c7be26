#include "ConfigLoader.hpp"
#include <fstream>
#include "Config.hpp"
#include "ConfigParsers.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace lf {

namespace {

void applyTable(Config& config, const toml::table& tbl) {
    if (auto gen = tbl["general"].as_table()) {
        config.setDebug((*gen)["debug"].value_or(false));
    }

    ConfigParsers::parseVideo(tbl, config.video());
    ConfigParsers::parseCanvas(tbl, config.canvas());
    ConfigParsers::parseSafeZone(tbl, config.safeZone());
    ConfigParsers::parseStyles(tbl, config.styles());
    ConfigParsers::parseLayout(tbl, config.layout());
    ConfigParsers::parseEffects(tbl, config.effects());
    ConfigParsers::parseTiming(tbl, config.timing());
    ConfigParsers::parseSections(tbl, config.sections());
    ConfigParsers::parseScheduler(tbl, config.scheduler());
    ConfigParsers::parseRecording(tbl, config.recording());
    ConfigParsers::parseLogging(tbl, config.logging());
}

} // namespace

Result<void> ConfigLoader::load(Config& config, const fs::path& path) {
    try {
        auto tbl = toml::parse_file(path.string());
        applyTable(config, tbl);
        config.markClean();
        LOG_INFO("Config loaded from: {}", path.string());
        return Result<void>::ok();
    } catch (const toml::parse_error& err) {
        return Result<void>::err(ErrorKind::Config,
                                 std::string("Config parse error: ") +
                                         err.what());
    }
}

Result<void> ConfigLoader::loadFromString(Config& config,
                                          std::string_view toml) {
    try {
        auto tbl = toml::parse(toml);
        applyTable(config, tbl);
        config.markClean();
        return Result<void>::ok();
    } catch (const toml::parse_error& err) {
        return Result<void>::err(ErrorKind::Config,
                                 std::string("Config parse error: ") +
                                         err.what());
    }
}

fs::path ConfigLoader::defaultPath() {
    return file::configDir() / "config.toml";
}

Result<void> ConfigLoader::loadDefault(Config& config) {
    auto configDir = file::configDir();
    auto defaultPath = ConfigLoader::defaultPath();

    if (fs::exists(defaultPath)) {
        config.configPath_ = defaultPath;
        return load(config, defaultPath);
    }

    fs::path systemDefault = "/usr/share/lyricforge/config/default.toml";
    if (fs::exists(systemDefault)) {
        file::ensureDir(configDir);
        std::error_code ec;
        fs::copy_file(systemDefault, defaultPath, ec);
        if (!ec) {
            config.configPath_ = defaultPath;
            return load(config, defaultPath);
        }
    }

    LOG_WARN("No config file found, using built-in defaults");
    config.recording().outputDirectory = file::expandPath("~/Videos/LyricForge");
    config.configPath_ = defaultPath;
    if (!file::ensureDir(configDir)) {
        LOG_WARN("Cannot create config directory {}", configDir.string());
        return Result<void>::ok();
    }
    if (auto saved = save(config, defaultPath); !saved) {
        LOG_WARN("Could not write default config: {}", saved.error().message);
    }
    return Result<void>::ok();
}

Result<void> ConfigLoader::save(const Config& config, const fs::path& path) {
    try {
        auto tbl = ConfigParsers::serialize(config.video(),
                                            config.canvas(),
                                            config.safeZone(),
                                            config.styles(),
                                            config.layout(),
                                            config.effects(),
                                            config.timing(),
                                            config.sections(),
                                            config.scheduler(),
                                            config.recording(),
                                            config.logging(),
                                            config.debug());
        fs::path tempPath = path;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath);
            if (!file)
                return Result<void>::err(ErrorKind::Io,
                                         "Failed to open temp config file");
            file << tbl;
        }
        fs::rename(tempPath, path);
        LOG_DEBUG("Config saved to: {}", path.string());
        return Result<void>::ok();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save config: {}", e.what());
        return Result<void>::err(ErrorKind::Io,
                                 std::string("Failed to save config: ") +
                                         e.what());
    }
}

} // namespace lf
