/**
 * @file RenderJob.hpp
 * @brief One lyric video, from timing data to a finished file.
 *
 * RenderJob wires the pipeline together for a single output:
 *
 *   TimingModel::contextAt -> TextLayoutEngine -> TextRenderer
 *     -> Compositor (pooled buffer) -> FrameScheduler -> Encoder
 *
 * Everything the frames share (timing, styles, layout engine, effects) is
 * built during the Analyzing phase and read-only while workers render.
 * Configuration problems such as disjoint timing, oversized effects or text
 * that cannot fit under the Fail policy end the job before the first frame.
 *
 * @section Dependencies
 * - timing, layout, compositor, render, recorder
 */

#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include "compositor/BackgroundSource.hpp"
#include "compositor/Compositor.hpp"
#include "recorder/Encoder.hpp"
#include "render/FrameScheduler.hpp"
#include "timing/Providers.hpp"
#include "timing/SectionMap.hpp"
#include "timing/TimingModel.hpp"

namespace lf {

class Config;

// Sections a job needs, copied out of Config so the job never sees later
// edits
struct RenderJobConfig {
    VideoConfig video;
    CanvasConfig canvas;
    SafeZoneConfig safeZone;
    LayoutConfig layout;
    std::vector<EffectConfig> effects;
    SectionsConfig sections;
    SchedulerConfig scheduler;
    RecordingConfig recording;
    TimingConfig timing;

    static RenderJobConfig fromConfig(const Config& config);
};

class RenderJob {
public:
    RenderJob(TimingTrack track,
              std::vector<LyricCue> cues,
              const BackgroundSource& background,
              StyleSheet styles,
              RenderJobConfig config,
              EncoderBackendProvider& provider,
              const TextMeasurer& measurer);
    ~RenderJob();

    RenderJob(const RenderJob&) = delete;
    RenderJob& operator=(const RenderJob&) = delete;

    // Defaults to the recording filename template in the output directory
    void setOutputPath(fs::path path) {
        outputPath_ = std::move(path);
    }
    void setAudioSource(fs::path path) {
        audioSource_ = std::move(path);
    }
    void setTitle(std::string title) {
        title_ = std::move(title);
    }

    // Output path on success. A stop request fails the job with Cancelled.
    Result<fs::path> run(std::stop_token stop = {});

    // Frames the job will produce, from the configured duration or the
    // end of the timing track and cues plus padding
    u64 frameCount() const;

    EncodingJob snapshot() const;

    Signal<ProgressEvent> progress;

private:
    struct Pipeline;
    using PlacedText = std::optional<LayoutResult>;

    Result<void> analyze(Pipeline& pipeline);
    Result<PlacedText> place(const Pipeline& pipeline,
                             const std::string& text,
                             const Style& style) const;
    Result<FrameBufferPtr> renderFrame(const Pipeline& pipeline,
                                       u64 index,
                                       const RenderAttempt& attempt) const;
    EncoderSettings encoderSettings(u64 frames) const;

    TimingTrack track_;
    std::vector<LyricCue> cues_;
    const BackgroundSource& background_;
    StyleSheet styles_;
    RenderJobConfig config_;
    EncoderBackendProvider& provider_;
    const TextMeasurer& measurer_;

    std::optional<fs::path> outputPath_;
    std::optional<fs::path> audioSource_;
    std::string title_;

    mutable std::mutex snapshotMutex_;
    EncodingJob snapshot_;
};

// Builds a job from in-memory inputs and runs it to completion
Result<fs::path> renderJob(TimingTrack track,
                           std::vector<LyricCue> cues,
                           const BackgroundSource& background,
                           const StyleSheet& styles,
                           const RenderJobConfig& config,
                           EncoderBackendProvider& provider,
                           const TextMeasurer& measurer,
                           std::stop_token stop = {});

// Loads timing and cues through the provider contracts; the audio source
// is also muxed into the output
Result<fs::path> renderJob(const fs::path& audioSource,
                           const fs::path& lyricSource,
                           AudioFeatureProvider& features,
                           LyricParser& lyrics,
                           const BackgroundSource& background,
                           const StyleSheet& styles,
                           const RenderJobConfig& config,
                           EncoderBackendProvider& provider,
                           const TextMeasurer& measurer,
                           std::stop_token stop = {});

} // namespace lf
