/**
 * @file Config.hpp
 * @brief Aggregated job configuration.
 *
 * This file defines the Config class which holds every configuration section
 * a render job needs. It delegates parsing to ConfigParsers and file I/O to
 * ConfigLoader. A Config is owned by whoever launches jobs; the pipeline only
 * ever sees the resolved section structs, never the Config itself.
 *
 * @section Dependencies
 * - ConfigData
 * - ConfigLoader
 * - ConfigParsers
 * - Logger (LogOptions)
 */

#pragma once
#include <mutex>
#include "ConfigData.hpp"
#include "Logger.hpp"
#include "util/Result.hpp"

namespace lf {

class Config {
public:
    Config() = default;
    Config(const Config& other);
    Config& operator=(const Config& other);

    Result<void> load(const fs::path& path);
    Result<void> loadFromString(std::string_view toml);
    Result<void> save(const fs::path& path) const;
    Result<void> loadDefault();

    fs::path configPath() const {
        return configPath_;
    }
    bool debug() const {
        return debug_;
    }
    void setDebug(bool v) {
        debug_ = v;
        markDirty();
    }

    // Section accessors (const)
    const VideoConfig& video() const {
        return video_;
    }
    const CanvasConfig& canvas() const {
        return canvas_;
    }
    const SafeZoneConfig& safeZone() const {
        return safeZone_;
    }
    const StyleSheet& styles() const {
        return styles_;
    }
    const LayoutConfig& layout() const {
        return layout_;
    }
    const std::vector<EffectConfig>& effects() const {
        return effects_;
    }
    const TimingConfig& timing() const {
        return timing_;
    }
    const SectionsConfig& sections() const {
        return sections_;
    }
    const SchedulerConfig& scheduler() const {
        return scheduler_;
    }
    const RecordingConfig& recording() const {
        return recording_;
    }
    const LoggingConfig& logging() const {
        return logging_;
    }

    // Logger options for this configuration; debug raises the level to at
    // least debug
    LogOptions logOptions() const;

    // Section accessors (mutable)
    VideoConfig& video() {
        markDirty();
        return video_;
    }
    CanvasConfig& canvas() {
        markDirty();
        return canvas_;
    }
    SafeZoneConfig& safeZone() {
        markDirty();
        return safeZone_;
    }
    StyleSheet& styles() {
        markDirty();
        return styles_;
    }
    LayoutConfig& layout() {
        markDirty();
        return layout_;
    }
    std::vector<EffectConfig>& effects() {
        markDirty();
        return effects_;
    }
    TimingConfig& timing() {
        markDirty();
        return timing_;
    }
    SectionsConfig& sections() {
        markDirty();
        return sections_;
    }
    SchedulerConfig& scheduler() {
        markDirty();
        return scheduler_;
    }
    RecordingConfig& recording() {
        markDirty();
        return recording_;
    }
    LoggingConfig& logging() {
        markDirty();
        return logging_;
    }

    void addStyleTemplate(const std::string& name, Style style);
    void removeStyleTemplate(const std::string& name);

    bool isDirty() const {
        return dirty_;
    }
    void markClean() {
        dirty_ = false;
    }

private:
    friend class ConfigLoader;

    void markDirty() {
        dirty_ = true;
    }

    fs::path configPath_;
    bool dirty_{false};
    bool debug_{false};

    VideoConfig video_;
    CanvasConfig canvas_;
    SafeZoneConfig safeZone_;
    StyleSheet styles_;
    LayoutConfig layout_;
    std::vector<EffectConfig> effects_;
    TimingConfig timing_;
    SectionsConfig sections_;
    SchedulerConfig scheduler_;
    RecordingConfig recording_;
    LoggingConfig logging_;

    mutable std::mutex mutex_;
};

} // namespace lf
