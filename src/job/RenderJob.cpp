#include "RenderJob.hpp"
#include <cmath>
#include <set>
#include "compositor/Effects.hpp"
#include "core/Config.hpp"
#include "core/ConfigParsers.hpp"
#include "core/Logger.hpp"
#include "layout/TextAnimator.hpp"

namespace lf {

RenderJobConfig RenderJobConfig::fromConfig(const Config& config) {
    RenderJobConfig c;
    c.video = config.video();
    c.canvas = config.canvas();
    c.safeZone = config.safeZone();
    c.layout = config.layout();
    c.effects = config.effects();
    c.sections = config.sections();
    c.scheduler = config.scheduler();
    c.recording = config.recording();
    c.timing = config.timing();
    return c;
}

namespace {

// The cue's own template wins over the section's
const std::string& templateFor(const LyricCue* cue, const SectionStyle& section) {
    if (cue && !cue->styleTemplate.empty())
        return cue->styleTemplate;
    return section.styleTemplate;
}

Style resolveStyle(const StyleSheet& sheet,
                   const std::string& templateName,
                   const SectionStyle& section) {
    Style style = sheet.resolve(templateName);
    if (section.verticalPosition)
        style.verticalPosition = *section.verticalPosition;
    return style;
}

} // namespace

struct RenderJob::Pipeline {
    using EffectsKey = std::pair<std::string, SectionKind>;

    Pipeline(TimingModel model,
             SectionMap sectionMap,
             const RenderJobConfig& config,
             const TextMeasurer& measurer)
        : timing(std::move(model)),
          sections(std::move(sectionMap)),
          frame{config.video.width, config.video.height},
          layout(frame,
                 config.safeZone,
                 config.canvas,
                 measurer,
                 config.layout.measureCacheSize),
          compositor(frame, config.canvas),
          startTime(config.video.startTime),
          fps(config.video.fps) {
    }

    const std::vector<EffectConfig>& effectsFor(const std::string& name,
                                                SectionKind section) const {
        auto it = effects.find({name, section});
        return it != effects.end()
                       ? it->second
                       : effects.at({std::string{}, SectionMap::kDefaultKind});
    }

    TimingModel timing;
    SectionMap sections;
    FrameGeometry frame;
    TextLayoutEngine layout;
    Compositor compositor;
    // Final effect list per (style template, song section)
    std::map<EffectsKey, std::vector<EffectConfig>> effects;
    BufferPool* pool{nullptr};
    f64 startTime;
    u32 fps;
};

RenderJob::RenderJob(TimingTrack track,
                     std::vector<LyricCue> cues,
                     const BackgroundSource& background,
                     StyleSheet styles,
                     RenderJobConfig config,
                     EncoderBackendProvider& provider,
                     const TextMeasurer& measurer)
    : track_(std::move(track)),
      cues_(std::move(cues)),
      background_(background),
      styles_(std::move(styles)),
      config_(std::move(config)),
      provider_(provider),
      measurer_(measurer) {
}

RenderJob::~RenderJob() = default;

u64 RenderJob::frameCount() const {
    const auto fps = static_cast<f64>(config_.video.fps);
    if (config_.video.duration > 0.0)
        return static_cast<u64>(std::ceil(config_.video.duration * fps));

    f64 end = track_.endTime();
    if (!cues_.empty())
        end = std::max(end, cues_.back().endTime);

    const f64 span = end + config_.video.durationPadding - config_.video.startTime;
    if (span <= 0.0)
        return 0;
    return static_cast<u64>(std::ceil(span * fps - 1e-9));
}

EncodingJob RenderJob::snapshot() const {
    std::lock_guard lock(snapshotMutex_);
    return snapshot_;
}

EncoderSettings RenderJob::encoderSettings(u64 frames) const {
    EncoderSettings s = EncoderSettings::fromConfig(config_.recording, config_.video);
    if (outputPath_)
        s.outputPath = *outputPath_;
    else if (!title_.empty())
        s.outputPath = EncoderSettings::resolveOutputPath(config_.recording, title_);
    s.audioSource = audioSource_;
    s.duration = static_cast<f64>(frames) / config_.video.fps;
    return s;
}

Result<RenderJob::PlacedText> RenderJob::place(const Pipeline& pipeline,
                                               const std::string& text,
                                               const Style& style) const {
    using Out = Result<PlacedText>;
    auto laid = pipeline.layout.layout(text, style);
    if (laid && !laid->overflowedWidth)
        return Out::ok(*laid);
    if (!laid && laid.error().kind != ErrorKind::LayoutOverflow)
        return Out::err(laid.error());

    switch (config_.layout.overflowPolicy) {
    case OverflowPolicy::ShrinkFont: {
        auto size = pipeline.layout.fitFontSize(text, style, config_.layout.minFontSize);
        if (!size)
            return Out::err(size.error());
        auto shrunk = pipeline.layout.layout(text, style, *size);
        if (!shrunk)
            return Out::err(shrunk.error());
        return Out::ok(*shrunk);
    }
    case OverflowPolicy::Fail:
        if (!laid)
            return Out::err(laid.error());
        return Out::ok(*laid);
    case OverflowPolicy::Skip:
        if (!laid)
            return Out::ok(std::nullopt);
        return Out::ok(*laid);
    }
    return Out::ok(std::nullopt);
}

Result<void> RenderJob::analyze(Pipeline& pipeline) {
    Size hint;
    const SectionMap& sections = pipeline.sections;
    std::set<Pipeline::EffectsKey> combos{
            {std::string{}, SectionMap::kDefaultKind}};

    auto checkTemplate = [this](const std::string& name, const std::string& user) {
        if (!name.empty() && styles_.templates.count(name) == 0) {
            LOG_WARN("{} uses unknown style template '{}', using base",
                     user,
                     name);
        }
    };

    // Frames without a cue still take the section's template and effects
    for (SectionKind kind : sections.kinds()) {
        const std::string& name = sections.style(kind).styleTemplate;
        checkTemplate(name,
                      std::string("Section ") + ConfigParsers::toString(kind));
        combos.emplace(name, kind);
    }

    for (usize i = 0; i < pipeline.timing.cues().size(); ++i) {
        const LyricCue& cue = pipeline.timing.cues()[i];
        checkTemplate(cue.styleTemplate, "Cue " + std::to_string(i));

        for (SectionKind kind : sections.sectionsBetween(cue.startTime, cue.endTime)) {
            const SectionStyle& section = sections.style(kind);
            const std::string& name = templateFor(&cue, section);
            combos.emplace(name, kind);

            auto placed = place(pipeline, cue.text, resolveStyle(styles_, name, section));
            if (!placed) {
                Error err = placed.error();
                err.message = "Cue " + std::to_string(i) + " (\"" + cue.text +
                              "\"): " + err.message;
                return Result<void>::err(std::move(err));
            }
            if (!placed->has_value()) {
                LOG_WARN("Cue {} does not fit the safe zone and will be skipped", i);
                continue;
            }
            hint.width = std::max(hint.width, (*placed)->textSize.width);
            hint.height = std::max(hint.height, (*placed)->textSize.height);
        }
    }

    for (const auto& [name, kind] : combos) {
        const SectionStyle& section = sections.style(kind);
        const Style style = resolveStyle(styles_, name, section);
        auto effects = effects::forSection(
                effects::forStyle(config_.effects, style), section);
        if (auto valid = effects::validate(effects,
                                           config_.canvas.pad,
                                           hint,
                                           TextRenderer::surfaceMargin(style.strokeWidth));
            !valid) {
            Error err = valid.error();
            std::string where;
            if (!name.empty())
                where = "Style template '" + name + "'";
            if (!sections.empty()) {
                where += where.empty() ? "Section " : ", section ";
                where += ConfigParsers::toString(kind);
            }
            if (!where.empty())
                err.message = where + ": " + err.message;
            return Result<void>::err(std::move(err));
        }
        pipeline.effects.emplace(Pipeline::EffectsKey{name, kind}, std::move(effects));
    }

    LOG_DEBUG("Analysis done: {} cues, {} section(s), {} effect set(s), "
              "largest text box {}x{}",
              pipeline.timing.cues().size(),
              sections.spans().size(),
              combos.size(),
              hint.width,
              hint.height);
    return Result<void>::ok();
}

Result<FrameBufferPtr> RenderJob::renderFrame(const Pipeline& pipeline,
                                              u64 index,
                                              const RenderAttempt& attempt) const {
    using Out = Result<FrameBufferPtr>;
    if (attempt.stop.stop_requested())
        return Out::err(Error(ErrorKind::Cancelled, "Render cancelled").atFrame(index));

    const f64 t = pipeline.startTime + static_cast<f64>(index) / pipeline.fps;
    const RenderContext ctx = pipeline.timing.contextAt(t);

    const SectionKind sectionKind = pipeline.sections.sectionAt(t);
    const SectionStyle& section = pipeline.sections.style(sectionKind);
    const LyricCue* cue =
            ctx.activeCue ? pipeline.timing.cue(*ctx.activeCue) : nullptr;
    const std::string& templateName = templateFor(cue, section);
    const std::vector<EffectConfig>& effects =
            pipeline.effectsFor(templateName, sectionKind);

    std::optional<TextSurface> surface;
    if (cue) {
        const Style style = resolveStyle(styles_, templateName, section);
        auto placed = place(pipeline, cue->text, style);
        if (!placed)
            return Out::err(std::move(placed.error().atFrame(index)));

        if (placed->has_value()) {
            LayoutResult layout = **placed;
            const AnimationState anim =
                    TextAnimator::compute(style, ctx.timeInCue, ctx.timeToCueEnd);

            if (anim.offset != Vec2{}) {
                const Vec2 moved = pipeline.layout.clampToSafeZone(
                        layout.framePosition + anim.offset, layout.textSize);
                layout.framePosition = moved;
                layout.paintPosition = pipeline.layout.toCanvas(moved);
                layout.boundingBox = {moved.x,
                                      moved.y,
                                      layout.textSize.width,
                                      layout.textSize.height};
            }

            surface = TextRenderer::render(
                    cue->text, style, layout, anim, ctx.perWordProgress);
        }
    }

    auto frame = pipeline.compositor.composite(background_,
                                               surface,
                                               effects,
                                               ctx,
                                               *pipeline.pool,
                                               attempt.deadline,
                                               attempt.stop);
    if (!frame)
        return Out::err(std::move(frame.error().atFrame(index)));

    frame.value()->index = index;
    frame.value()->timestamp = t;
    return frame;
}

Result<fs::path> RenderJob::run(std::stop_token stop) {
    using Out = Result<fs::path>;
    const auto started = Clock::now();

    const u64 frames = frameCount();
    if (frames == 0) {
        return Out::err(ErrorKind::InvalidArgument,
                        "Render job has no frames to produce");
    }

    Encoder encoder(encoderSettings(frames), frames, provider_);
    auto syncSnapshot = [this, &encoder] {
        std::lock_guard lock(snapshotMutex_);
        snapshot_ = encoder.snapshot();
    };
    encoder.progress.connect([this, &encoder](const ProgressEvent& ev) {
        {
            std::lock_guard lock(snapshotMutex_);
            snapshot_ = encoder.snapshot();
        }
        progress.emitSignal(ev);
    });

    auto failJob = [&](Error error) -> Out {
        if (stop.stop_requested())
            error.kind = ErrorKind::Cancelled;
        encoder.fail(error);
        syncSnapshot();
        return Out::err(std::move(error));
    };

    LOG_INFO("Render job: {} frames at {}x{} @ {} fps, {} cues",
             frames,
             config_.video.width,
             config_.video.height,
             config_.video.fps,
             cues_.size());

    if (auto r = encoder.beginAnalysis(); !r)
        return Out::err(r.error());

    auto timing = TimingModel::create(track_, cues_, config_.timing);
    if (!timing)
        return failJob(timing.error());

    auto sections = SectionMap::create(config_.sections);
    if (!sections)
        return failJob(sections.error());

    Pipeline pipeline(std::move(timing).value(),
                      std::move(sections).value(),
                      config_,
                      measurer_);
    if (auto r = analyze(pipeline); !r)
        return failJob(r.error());

    if (stop.stop_requested())
        return failJob(Error(ErrorKind::Cancelled, "Cancelled before rendering"));

    if (auto r = encoder.beginRendering(); !r)
        return Out::err(r.error());

    BufferPool pool(config_.scheduler.poolSize,
                    config_.video.width,
                    config_.video.height,
                    config_.canvas.pad);
    pipeline.pool = &pool;

    FrameScheduler scheduler(config_.scheduler, pool);
    auto rendered = scheduler.run(
            FrameRange{0, frames},
            [this, &pipeline](u64 index, const RenderAttempt& attempt) {
                return renderFrame(pipeline, index, attempt);
            },
            [&encoder](const FrameBuffer& frame) {
                return encoder.submitFrame(frame);
            },
            stop);
    if (!rendered)
        return failJob(rendered.error());

    if (auto r = encoder.finalize(); !r) {
        syncSnapshot();
        return Out::err(r.error());
    }
    syncSnapshot();

    const auto job = snapshot();
    const auto elapsed =
            std::chrono::duration<f64>(Clock::now() - started).count();
    LOG_INFO("Render job done: {} in {:.1f}s ({} render retries)",
             job.outputPath.string(),
             elapsed,
             scheduler.retries());
    return Out::ok(job.outputPath);
}

Result<fs::path> renderJob(TimingTrack track,
                           std::vector<LyricCue> cues,
                           const BackgroundSource& background,
                           const StyleSheet& styles,
                           const RenderJobConfig& config,
                           EncoderBackendProvider& provider,
                           const TextMeasurer& measurer,
                           std::stop_token stop) {
    RenderJob job(std::move(track),
                  std::move(cues),
                  background,
                  styles,
                  config,
                  provider,
                  measurer);
    return job.run(std::move(stop));
}

Result<fs::path> renderJob(const fs::path& audioSource,
                           const fs::path& lyricSource,
                           AudioFeatureProvider& features,
                           LyricParser& lyrics,
                           const BackgroundSource& background,
                           const StyleSheet& styles,
                           const RenderJobConfig& config,
                           EncoderBackendProvider& provider,
                           const TextMeasurer& measurer,
                           std::stop_token stop) {
    auto track = features.load(audioSource);
    if (!track) {
        LOG_ERROR("Audio features for {} unavailable: {}",
                  audioSource.string(),
                  track.error().message);
        return Result<fs::path>::err(track.error());
    }

    auto cues = lyrics.parse(lyricSource);
    if (!cues) {
        LOG_ERROR("Lyrics {} could not be parsed: {}",
                  lyricSource.string(),
                  cues.error().message);
        return Result<fs::path>::err(cues.error());
    }

    RenderJob job(std::move(track).value(),
                  std::move(cues).value(),
                  background,
                  styles,
                  config,
                  provider,
                  measurer);
    job.setAudioSource(audioSource);
    job.setTitle(lyricSource.stem().string());
    return job.run(std::move(stop));
}

} // namespace lf
