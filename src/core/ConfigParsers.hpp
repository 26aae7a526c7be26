/**
 * @file ConfigParsers.hpp
 * @brief TOML parsing and serialization logic.
 *
 * This file defines the ConfigParsers class which handles the conversion
 * between TOML data structures and the job configuration structs. Values are
 * clamped to sane ranges on the way in; a missing key keeps the struct's
 * current value.
 *
 * @section Dependencies
 * - toml++
 * - ConfigData
 */

#pragma once
#include <optional>
#include <string_view>
#include <toml++/toml.h>
#include "ConfigData.hpp"

namespace lf {

class ConfigParsers {
public:
    static void parseVideo(const toml::table& tbl, VideoConfig& cfg);
    static void parseCanvas(const toml::table& tbl, CanvasConfig& cfg);
    static void parseSafeZone(const toml::table& tbl, SafeZoneConfig& cfg);
    static void parseStyles(const toml::table& tbl, StyleSheet& sheet);
    static void parseStyle(const toml::table& tbl, Style& style);
    static void parseLayout(const toml::table& tbl, LayoutConfig& cfg);
    static void parseEffects(const toml::table& tbl,
                             std::vector<EffectConfig>& effects);
    static void parseTiming(const toml::table& tbl, TimingConfig& cfg);
    // [[sections]] spans and [section_styles.<kind>] modifiers
    static void parseSections(const toml::table& tbl, SectionsConfig& cfg);
    static void parseScheduler(const toml::table& tbl, SchedulerConfig& cfg);
    static void parseRecording(const toml::table& tbl, RecordingConfig& cfg);
    static void parseLogging(const toml::table& tbl, LoggingConfig& cfg);

    static toml::table serialize(const VideoConfig& video,
                                 const CanvasConfig& canvas,
                                 const SafeZoneConfig& safeZone,
                                 const StyleSheet& styles,
                                 const LayoutConfig& layout,
                                 const std::vector<EffectConfig>& effects,
                                 const TimingConfig& timing,
                                 const SectionsConfig& sections,
                                 const SchedulerConfig& scheduler,
                                 const RecordingConfig& recording,
                                 const LoggingConfig& logging,
                                 bool debug);

    // Enum <-> string, lower-case snake names as written in TOML
    static std::optional<Alignment> alignmentFromString(std::string_view s);
    static std::optional<VerticalPosition> verticalFromString(std::string_view s);
    static std::optional<AnimationKind> animationFromString(std::string_view s);
    static std::optional<Easing> easingFromString(std::string_view s);
    static std::optional<EffectKind> effectFromString(std::string_view s);
    static std::optional<QualityPreset> qualityFromString(std::string_view s);
    static std::optional<OverflowPolicy> overflowFromString(std::string_view s);
    static std::optional<SectionKind> sectionFromString(std::string_view s);

    static const char* toString(Alignment v);
    static const char* toString(VerticalPosition v);
    static const char* toString(AnimationKind v);
    static const char* toString(Easing v);
    static const char* toString(EffectKind v);
    static const char* toString(QualityPreset v);
    static const char* toString(OverflowPolicy v);
    static const char* toString(SectionKind v);
};

} // namespace lf
