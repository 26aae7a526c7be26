#include "ConfigParsers.hpp"
#include <algorithm>
#include <array>
#include <limits>
#include <utility>
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace lf {

namespace {
template <typename T>
T get(const toml::table& tbl, std::string_view key, T defaultVal) {
    if (auto node = tbl[key]) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto val = node.value<std::string>())
                return *val;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto val = node.value<bool>())
                return *val;
        } else if constexpr (std::is_floating_point_v<T>) {
            if (auto val = node.value<double>())
                return static_cast<T>(*val);
        } else if constexpr (std::is_integral_v<T>) {
            if (auto val = node.value<i64>())
                return static_cast<T>(std::max<i64>(
                        *val,
                        static_cast<i64>(std::numeric_limits<T>::min())));
        }
    }
    return defaultVal;
}

Vec2 parseVec2(const toml::table& tbl, Vec2 defaultVal = {}) {
    return {get(tbl, "x", defaultVal.x), get(tbl, "y", defaultVal.y)};
}

template <typename E, usize N>
std::optional<E> lookup(const std::array<std::pair<const char*, E>, N>& names,
                        std::string_view s) {
    for (const auto& [name, value] : names) {
        if (s == name)
            return value;
    }
    return std::nullopt;
}

template <typename E, usize N>
const char* nameOf(const std::array<std::pair<const char*, E>, N>& names,
                   E v) {
    for (const auto& [name, value] : names) {
        if (value == v)
            return name;
    }
    return names[0].first;
}

template <typename E, typename Fn>
E getEnum(const toml::table& tbl, std::string_view key, E current, Fn parse) {
    if (auto s = tbl[key].value<std::string>()) {
        if (auto v = parse(*s))
            return *v;
        LOG_WARN("Config: unknown value '{}' for '{}'", *s, key);
    }
    return current;
}

constexpr std::array<std::pair<const char*, Alignment>, 3> kAlignments{{
        {"center", Alignment::Center},
        {"left", Alignment::Left},
        {"right", Alignment::Right},
}};

constexpr std::array<std::pair<const char*, VerticalPosition>, 3> kVerticals{{
        {"bottom", VerticalPosition::Bottom},
        {"center", VerticalPosition::Center},
        {"top", VerticalPosition::Top},
}};

constexpr std::array<std::pair<const char*, AnimationKind>, 5> kAnimations{{
        {"fade", AnimationKind::Fade},
        {"none", AnimationKind::None},
        {"slide_up", AnimationKind::SlideUp},
        {"scale_in", AnimationKind::ScaleIn},
        {"typewriter", AnimationKind::Typewriter},
}};

constexpr std::array<std::pair<const char*, Easing>, 5> kEasings{{
        {"ease_out", Easing::EaseOut},
        {"linear", Easing::Linear},
        {"ease_in", Easing::EaseIn},
        {"ease_in_out", Easing::EaseInOut},
        {"bounce", Easing::Bounce},
}};

constexpr std::array<std::pair<const char*, EffectKind>, 6> kEffects{{
        {"glow", EffectKind::Glow},
        {"shadow", EffectKind::Shadow},
        {"pulse", EffectKind::Pulse},
        {"beat_flash", EffectKind::BeatFlash},
        {"tint", EffectKind::Tint},
        {"hue_shift", EffectKind::HueShift},
}};

constexpr std::array<std::pair<const char*, QualityPreset>, 3> kQualities{{
        {"balanced", QualityPreset::Balanced},
        {"fast", QualityPreset::Fast},
        {"high_quality", QualityPreset::HighQuality},
}};

constexpr std::array<std::pair<const char*, OverflowPolicy>, 3> kOverflow{{
        {"shrink_font", OverflowPolicy::ShrinkFont},
        {"fail", OverflowPolicy::Fail},
        {"skip", OverflowPolicy::Skip},
}};

constexpr std::array<std::pair<const char*, SectionKind>, 6> kSections{{
        {"verse", SectionKind::Verse},
        {"intro", SectionKind::Intro},
        {"chorus", SectionKind::Chorus},
        {"bridge", SectionKind::Bridge},
        {"instrumental", SectionKind::Instrumental},
        {"outro", SectionKind::Outro},
}};

u32 even(u32 v) {
    return (v + 1) & ~1u;
}

toml::table styleTable(const Style& s) {
    return toml::table{
            {"font_family", s.fontFamily},
            {"font_size", (i64)s.fontSize},
            {"bold", s.bold},
            {"color", s.color.toHex()},
            {"stroke_color", s.strokeColor.toHex()},
            {"stroke_width", (double)s.strokeWidth},
            {"glow_radius", (double)s.glowRadius},
            {"glow_color", s.glowColor.toHex()},
            {"highlight_color", s.highlightColor.toHex()},
            {"alignment", ConfigParsers::toString(s.alignment)},
            {"vertical_position", ConfigParsers::toString(s.verticalPosition)},
            {"animation", ConfigParsers::toString(s.animation)},
            {"easing", ConfigParsers::toString(s.easing)},
            {"animation_duration", (double)s.animationDuration}};
}
} // namespace

std::optional<Alignment> ConfigParsers::alignmentFromString(std::string_view s) {
    return lookup(kAlignments, s);
}
std::optional<VerticalPosition> ConfigParsers::verticalFromString(
        std::string_view s) {
    return lookup(kVerticals, s);
}
std::optional<AnimationKind> ConfigParsers::animationFromString(
        std::string_view s) {
    return lookup(kAnimations, s);
}
std::optional<Easing> ConfigParsers::easingFromString(std::string_view s) {
    return lookup(kEasings, s);
}
std::optional<EffectKind> ConfigParsers::effectFromString(std::string_view s) {
    return lookup(kEffects, s);
}
std::optional<QualityPreset> ConfigParsers::qualityFromString(
        std::string_view s) {
    return lookup(kQualities, s);
}
std::optional<OverflowPolicy> ConfigParsers::overflowFromString(
        std::string_view s) {
    return lookup(kOverflow, s);
}
std::optional<SectionKind> ConfigParsers::sectionFromString(std::string_view s) {
    return lookup(kSections, s);
}

const char* ConfigParsers::toString(Alignment v) {
    return nameOf(kAlignments, v);
}
const char* ConfigParsers::toString(VerticalPosition v) {
    return nameOf(kVerticals, v);
}
const char* ConfigParsers::toString(AnimationKind v) {
    return nameOf(kAnimations, v);
}
const char* ConfigParsers::toString(Easing v) {
    return nameOf(kEasings, v);
}
const char* ConfigParsers::toString(EffectKind v) {
    return nameOf(kEffects, v);
}
const char* ConfigParsers::toString(QualityPreset v) {
    return nameOf(kQualities, v);
}
const char* ConfigParsers::toString(OverflowPolicy v) {
    return nameOf(kOverflow, v);
}
const char* ConfigParsers::toString(SectionKind v) {
    return nameOf(kSections, v);
}

void ConfigParsers::parseVideo(const toml::table& tbl, VideoConfig& cfg) {
    if (auto video = tbl["video"].as_table()) {
        cfg.width = even(std::clamp(get(*video, "width", cfg.width), 16u, 7680u));
        cfg.height =
                even(std::clamp(get(*video, "height", cfg.height), 16u, 4320u));
        cfg.fps = std::clamp(get(*video, "fps", cfg.fps), 1u, 120u);
        cfg.startTime = std::max(0.0, get(*video, "start_time", cfg.startTime));
        cfg.duration = std::max(0.0, get(*video, "duration", cfg.duration));
        cfg.durationPadding = std::clamp(
                get(*video, "duration_padding", cfg.durationPadding), 0.0, 60.0);
    }
}

void ConfigParsers::parseCanvas(const toml::table& tbl, CanvasConfig& cfg) {
    if (auto canvas = tbl["canvas"].as_table()) {
        cfg.pad = std::clamp(get(*canvas, "pad", cfg.pad), 0u, 2000u);
    }
}

void ConfigParsers::parseSafeZone(const toml::table& tbl, SafeZoneConfig& cfg) {
    if (auto zone = tbl["safe_zone"].as_table()) {
        cfg.left = get(*zone, "left", cfg.left);
        cfg.right = get(*zone, "right", cfg.right);
        cfg.top = get(*zone, "top", cfg.top);
        cfg.bottom = get(*zone, "bottom", cfg.bottom);
    }
}

void ConfigParsers::parseStyle(const toml::table& tbl, Style& s) {
    s.fontFamily = get(tbl, "font_family", s.fontFamily);
    s.fontSize = std::clamp(get(tbl, "font_size", s.fontSize), 4u, 512u);
    s.bold = get(tbl, "bold", s.bold);
    if (auto c = tbl["color"].value<std::string>())
        s.color = Color::fromHex(*c);
    if (auto c = tbl["stroke_color"].value<std::string>())
        s.strokeColor = Color::fromHex(*c);
    s.strokeWidth = std::clamp(get(tbl, "stroke_width", s.strokeWidth), 0.0f, 64.0f);
    s.glowRadius = std::clamp(get(tbl, "glow_radius", s.glowRadius), 0.0f, 256.0f);
    if (auto c = tbl["glow_color"].value<std::string>())
        s.glowColor = Color::fromHex(*c);
    if (auto c = tbl["highlight_color"].value<std::string>())
        s.highlightColor = Color::fromHex(*c);
    s.alignment = getEnum(tbl, "alignment", s.alignment, alignmentFromString);
    s.verticalPosition = getEnum(
            tbl, "vertical_position", s.verticalPosition, verticalFromString);
    s.animation = getEnum(tbl, "animation", s.animation, animationFromString);
    s.easing = getEnum(tbl, "easing", s.easing, easingFromString);
    s.animationDuration = std::clamp(
            get(tbl, "animation_duration", s.animationDuration), 0.0f, 10.0f);
}

void ConfigParsers::parseStyles(const toml::table& tbl, StyleSheet& sheet) {
    if (auto style = tbl["style"].as_table()) {
        parseStyle(*style, sheet.base);

        if (auto templates = (*style)["templates"].as_table()) {
            sheet.templates.clear();
            for (const auto& [name, node] : *templates) {
                if (auto t = node.as_table()) {
                    Style derived = sheet.base;
                    parseStyle(*t, derived);
                    sheet.templates.emplace(std::string(name.str()),
                                            std::move(derived));
                }
            }
        }
    }
}

void ConfigParsers::parseLayout(const toml::table& tbl, LayoutConfig& cfg) {
    if (auto layout = tbl["layout"].as_table()) {
        cfg.measureCacheSize = std::clamp<usize>(
                get(*layout, "measure_cache_size", cfg.measureCacheSize),
                1,
                65536);
        cfg.overflowPolicy = getEnum(*layout,
                                     "overflow_policy",
                                     cfg.overflowPolicy,
                                     overflowFromString);
        cfg.minFontSize =
                std::clamp(get(*layout, "min_font_size", cfg.minFontSize), 4u, 512u);
    }
}

void ConfigParsers::parseEffects(const toml::table& tbl,
                                 std::vector<EffectConfig>& effects) {
    auto arr = tbl["effects"].as_array();
    if (!arr)
        return;

    effects.clear();
    for (const auto& elem : *arr) {
        auto e = elem.as_table();
        if (!e)
            continue;

        auto kindName = get(*e, "kind", std::string());
        auto kind = effectFromString(kindName);
        if (!kind) {
            LOG_WARN("Config: skipping effect with unknown kind '{}'", kindName);
            continue;
        }

        EffectConfig cfg;
        cfg.kind = *kind;
        cfg.enabled = get(*e, "enabled", true);
        cfg.base = get(*e, "base", cfg.base);
        cfg.scale = get(*e, "scale", cfg.scale);
        cfg.band = std::max(-1, get(*e, "band", cfg.band));
        if (auto c = (*e)["color"].value<std::string>())
            cfg.color = Color::fromHex(*c);
        cfg.opacity = std::clamp(get(*e, "opacity", cfg.opacity), 0.0f, 1.0f);
        if (auto off = (*e)["offset"].as_table())
            cfg.offset = parseVec2(*off, cfg.offset);
        effects.push_back(cfg);
    }
}

void ConfigParsers::parseTiming(const toml::table& tbl, TimingConfig& cfg) {
    if (auto t = tbl["timing"].as_table()) {
        cfg.snapToBeats = get(*t, "snap_to_beats", cfg.snapToBeats);
        cfg.maxSnapShift =
                std::clamp(get(*t, "max_snap_shift", cfg.maxSnapShift), 0.0, 2.0);
        cfg.onsetTolerance = std::clamp(
                get(*t, "onset_tolerance", cfg.onsetTolerance), 0.0, 0.5);
    }
}

void ConfigParsers::parseSections(const toml::table& tbl, SectionsConfig& cfg) {
    if (auto arr = tbl["sections"].as_array()) {
        cfg.spans.clear();
        for (const auto& elem : *arr) {
            auto t = elem.as_table();
            if (!t)
                continue;
            auto kindName = get(*t, "kind", std::string());
            auto kind = sectionFromString(kindName);
            if (!kind) {
                LOG_WARN("Config: skipping section with unknown kind '{}'",
                         kindName);
                continue;
            }
            SectionSpan span;
            span.kind = *kind;
            span.start = get(*t, "start", span.start);
            span.end = get(*t, "end", span.end);
            cfg.spans.push_back(span);
        }
    }

    if (auto styles = tbl["section_styles"].as_table()) {
        for (const auto& [name, node] : *styles) {
            auto t = node.as_table();
            auto kind = sectionFromString(name.str());
            if (!t || !kind) {
                LOG_WARN("Config: unknown section style '{}'", name.str());
                continue;
            }
            SectionStyle& s = cfg.styles[*kind];
            s.styleTemplate = get(*t, "style_template", s.styleTemplate);
            s.glowIntensity = std::clamp(
                    get(*t, "glow_intensity", s.glowIntensity), 0.0f, 8.0f);
            s.energyBursts = get(*t, "energy_bursts", s.energyBursts);
            if (auto v = (*t)["vertical_position"].value<std::string>()) {
                if (auto pos = verticalFromString(*v))
                    s.verticalPosition = *pos;
                else
                    LOG_WARN("Config: unknown value '{}' for 'vertical_position'",
                             *v);
            }
            s.hueShift = get(*t, "hue_shift", s.hueShift);
        }
    }
}

void ConfigParsers::parseScheduler(const toml::table& tbl, SchedulerConfig& cfg) {
    if (auto s = tbl["scheduler"].as_table()) {
        cfg.workers = std::clamp(get(*s, "workers", cfg.workers), 0u, 64u);
        cfg.poolSize = std::clamp(get(*s, "pool_size", cfg.poolSize), 2u, 64u);
        cfg.reorderCapacity = std::clamp(
                get(*s, "reorder_capacity", cfg.reorderCapacity), 1u, 64u);
        cfg.frameTimeoutMs = std::clamp(
                get(*s, "frame_timeout_ms", cfg.frameTimeoutMs), 10u, 600000u);
        cfg.maxRenderAttempts = std::clamp(
                get(*s, "max_render_attempts", cfg.maxRenderAttempts), 1u, 10u);
    }
}

void ConfigParsers::parseRecording(const toml::table& tbl,
                                   RecordingConfig& cfg) {
    if (auto rec = tbl["recording"].as_table()) {
        auto outDir = get(*rec, "output_directory", std::string());
        if (!outDir.empty())
            cfg.outputDirectory = file::expandPath(outDir);
        cfg.defaultFilename =
                get(*rec, "default_filename", cfg.defaultFilename);
        cfg.container = get(*rec, "container", cfg.container);

        if (auto video = (*rec)["video"].as_table()) {
            cfg.video.preferHardware =
                    get(*video, "prefer_hardware", cfg.video.preferHardware);
            cfg.video.hardwareEncoder =
                    get(*video, "hardware_encoder", cfg.video.hardwareEncoder);
            cfg.video.softwareCodec =
                    get(*video, "software_codec", cfg.video.softwareCodec);
            cfg.video.quality = getEnum(
                    *video, "quality", cfg.video.quality, qualityFromString);
            cfg.video.pixelFormat =
                    get(*video, "pixel_format", cfg.video.pixelFormat);
            cfg.video.gopSize =
                    std::clamp(get(*video, "gop_size", cfg.video.gopSize), 0u, 1000u);
        }

        if (auto audio = (*rec)["audio"].as_table()) {
            cfg.audio.codec = get(*audio, "codec", cfg.audio.codec);
            cfg.audio.bitrate =
                    std::clamp(get(*audio, "bitrate", cfg.audio.bitrate), 64u, 640u);
            cfg.audio.sampleRate = std::clamp(
                    get(*audio, "sample_rate", cfg.audio.sampleRate), 8000u, 192000u);
            cfg.audio.channels =
                    std::clamp(get(*audio, "channels", cfg.audio.channels), 1u, 2u);
        }
    }
}

void ConfigParsers::parseLogging(const toml::table& tbl, LoggingConfig& cfg) {
    if (auto log = tbl["logging"].as_table()) {
        cfg.level = get(*log, "level", cfg.level);
        auto dir = get(*log, "directory", std::string());
        if (!dir.empty())
            cfg.directory = file::expandPath(dir);
        cfg.console = get(*log, "console", cfg.console);
    }
}

toml::table ConfigParsers::serialize(const VideoConfig& video,
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
                                     bool debug) {
    toml::table root;
    root.insert("general", toml::table{{"debug", debug}});
    root.insert("logging",
                toml::table{{"level", logging.level},
                            {"directory", logging.directory.string()},
                            {"console", logging.console}});
    root.insert("video",
                toml::table{{"width", (i64)video.width},
                            {"height", (i64)video.height},
                            {"fps", (i64)video.fps},
                            {"start_time", video.startTime},
                            {"duration", video.duration},
                            {"duration_padding", video.durationPadding}});
    root.insert("canvas", toml::table{{"pad", (i64)canvas.pad}});
    root.insert("safe_zone",
                toml::table{{"left", (i64)safeZone.left},
                            {"right", (i64)safeZone.right},
                            {"top", (i64)safeZone.top},
                            {"bottom", (i64)safeZone.bottom}});

    toml::table styleTbl = styleTable(styles.base);
    toml::table templatesTbl;
    for (const auto& [name, style] : styles.templates)
        templatesTbl.insert(name, styleTable(style));
    styleTbl.insert("templates", templatesTbl);
    root.insert("style", styleTbl);

    root.insert("layout",
                toml::table{{"measure_cache_size", (i64)layout.measureCacheSize},
                            {"overflow_policy", toString(layout.overflowPolicy)},
                            {"min_font_size", (i64)layout.minFontSize}});

    toml::array effectsArr;
    for (const auto& e : effects) {
        effectsArr.push_back(toml::table{
                {"kind", toString(e.kind)},
                {"enabled", e.enabled},
                {"base", (double)e.base},
                {"scale", (double)e.scale},
                {"band", (i64)e.band},
                {"color", e.color.toHex()},
                {"opacity", (double)e.opacity},
                {"offset",
                 toml::table{{"x", (double)e.offset.x},
                             {"y", (double)e.offset.y}}}});
    }
    root.insert("effects", effectsArr);

    root.insert("timing",
                toml::table{{"snap_to_beats", timing.snapToBeats},
                            {"max_snap_shift", timing.maxSnapShift},
                            {"onset_tolerance", timing.onsetTolerance}});

    toml::array spansArr;
    for (const auto& span : sections.spans) {
        spansArr.push_back(toml::table{{"start", span.start},
                                       {"end", span.end},
                                       {"kind", toString(span.kind)}});
    }
    root.insert("sections", spansArr);

    toml::table sectionStyles;
    for (const auto& [kind, s] : sections.styles) {
        toml::table t{{"style_template", s.styleTemplate},
                      {"glow_intensity", (double)s.glowIntensity},
                      {"energy_bursts", s.energyBursts},
                      {"hue_shift", (double)s.hueShift}};
        if (s.verticalPosition)
            t.insert("vertical_position", toString(*s.verticalPosition));
        sectionStyles.insert(toString(kind), t);
    }
    root.insert("section_styles", sectionStyles);

    root.insert("scheduler",
                toml::table{{"workers", (i64)scheduler.workers},
                            {"pool_size", (i64)scheduler.poolSize},
                            {"reorder_capacity", (i64)scheduler.reorderCapacity},
                            {"frame_timeout_ms", (i64)scheduler.frameTimeoutMs},
                            {"max_render_attempts",
                             (i64)scheduler.maxRenderAttempts}});

    toml::table recVideo{{"prefer_hardware", recording.video.preferHardware},
                         {"hardware_encoder", recording.video.hardwareEncoder},
                         {"software_codec", recording.video.softwareCodec},
                         {"quality", toString(recording.video.quality)},
                         {"pixel_format", recording.video.pixelFormat},
                         {"gop_size", (i64)recording.video.gopSize}};
    toml::table recAudio{{"codec", recording.audio.codec},
                         {"bitrate", (i64)recording.audio.bitrate},
                         {"sample_rate", (i64)recording.audio.sampleRate},
                         {"channels", (i64)recording.audio.channels}};
    root.insert("recording",
                toml::table{{"output_directory",
                             recording.outputDirectory.string()},
                            {"default_filename", recording.defaultFilename},
                            {"container", recording.container},
                            {"video", recVideo},
                            {"audio", recAudio}});

    return root;
}

} // namespace lf
