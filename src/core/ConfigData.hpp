/**
 * @file ConfigData.hpp
 * @brief Configuration data structures.
 *
 * This file defines the POD (Plain Old Data) structs used to hold configuration
 * values. It is separated from the logic classes to keep headers lean and
 * avoid circular dependencies. Everything here is resolved before a job
 * starts and passed by value or const reference into the pipeline; nothing
 * reads configuration at render time.
 */

#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "util/Types.hpp"

namespace lf {

namespace fs = std::filesystem;

// Output frame size and timing
struct VideoConfig {
    u32 width{1920};
    u32 height{1080};
    u32 fps{30};
    f64 startTime{0.0};
    f64 duration{0.0};        // 0: up to the end of the timing track
    f64 durationPadding{2.0}; // seconds appended after the last cue/sample
};

// Padding around the working canvas, only there to catch effect bleed
struct CanvasConfig {
    u32 pad{200};
};

// Margins in final-frame space; never include the canvas padding
struct SafeZoneConfig {
    u32 left{100};
    u32 right{100};
    u32 top{150};
    u32 bottom{350};
};

enum class Alignment { Left, Center, Right };
enum class VerticalPosition { Top, Center, Bottom };
enum class AnimationKind { None, Fade, SlideUp, ScaleIn, Typewriter };
enum class Easing { Linear, EaseIn, EaseOut, EaseInOut, Bounce };

struct Style {
    std::string fontFamily{"DejaVu Sans"};
    u32 fontSize{72};
    bool bold{true};
    Color color{Color::white()};
    Color strokeColor{Color::black()};
    f32 strokeWidth{3.0f};
    f32 glowRadius{0.0f};
    Color glowColor{Color::white()};
    Color highlightColor{Color::fromHex("#FFD700")};
    Alignment alignment{Alignment::Center};
    VerticalPosition verticalPosition{VerticalPosition::Bottom};
    AnimationKind animation{AnimationKind::Fade};
    Easing easing{Easing::EaseOut};
    f32 animationDuration{0.3f}; // seconds, entrance and exit each
};

// Base style plus named per-cue templates
struct StyleSheet {
    Style base;
    std::map<std::string, Style> templates;

    const Style& resolve(const std::string& templateName) const {
        if (templateName.empty())
            return base;
        auto it = templates.find(templateName);
        return it != templates.end() ? it->second : base;
    }
};

enum class OverflowPolicy {
    ShrinkFont, // retry with a smaller font until it fits
    Fail,       // abort the job
    Skip        // render the frame without the text
};

struct LayoutConfig {
    usize measureCacheSize{256};
    OverflowPolicy overflowPolicy{OverflowPolicy::ShrinkFont};
    u32 minFontSize{24};
};

enum class EffectKind { Glow, Shadow, Pulse, BeatFlash, Tint, HueShift };

// Audio-reactive parameter: base + scale * energy(band)
struct EffectConfig {
    EffectKind kind{EffectKind::Glow};
    bool enabled{true};
    f32 base{8.0f};
    f32 scale{16.0f};
    i32 band{-1}; // -1: mean energy
    Color color{Color::white()};
    f32 opacity{0.8f};
    Vec2 offset{4.0f, 4.0f}; // shadow only
};

// Cue placement relative to the beat grid and onset matching
struct TimingConfig {
    bool snapToBeats{false};
    f64 maxSnapShift{0.2};     // seconds
    f64 onsetTolerance{0.025}; // seconds
};

enum class SectionKind { Intro, Verse, Chorus, Bridge, Instrumental, Outro };

// Modifiers a song section applies on top of the cue's style and effects.
// The defaults leave a frame unchanged.
struct SectionStyle {
    std::string styleTemplate; // used when the cue names no template
    f32 glowIntensity{1.0f};   // scales glow and shadow radius
    bool energyBursts{true};   // false disables beat flashes
    std::optional<VerticalPosition> verticalPosition;
    f32 hueShift{0.0f}; // degrees added to the text hue
};

// [start, end) in seconds
struct SectionSpan {
    f64 start{0.0};
    f64 end{0.0};
    SectionKind kind{SectionKind::Verse};
};

struct SectionsConfig {
    std::vector<SectionSpan> spans;
    std::map<SectionKind, SectionStyle> styles;
};

struct SchedulerConfig {
    u32 workers{0};          // 0: hardware concurrency
    u32 poolSize{6};
    u32 reorderCapacity{6};  // capped at poolSize
    u32 frameTimeoutMs{2000};
    u32 maxRenderAttempts{3};
};

enum class QualityPreset { Fast, Balanced, HighQuality };

// Video encoding settings
struct VideoEncoderConfig {
    bool preferHardware{true};
    std::string hardwareEncoder{"auto"}; // auto or an FFmpeg encoder name
    std::string softwareCodec{"libx264"};
    QualityPreset quality{QualityPreset::Balanced};
    std::string pixelFormat{"yuv420p"};
    u32 gopSize{0};
};

// Audio encoding settings
struct AudioEncoderConfig {
    std::string codec{"aac"};
    u32 bitrate{192};
    u32 sampleRate{48000};
    u32 channels{2};
};

struct LoggingConfig {
    std::string level{"info"};
    fs::path directory; // empty: <cache dir>/logs
    bool console{true};
};

struct RecordingConfig {
    fs::path outputDirectory;
    std::string defaultFilename{"lyricforge_{date}_{time}"};
    std::string container{"mp4"};
    VideoEncoderConfig video;
    AudioEncoderConfig audio;
};

} // namespace lf
