/**
 * @file TimingModel.hpp
 * @brief Merges the audio timing track with lyric cues.
 *
 * TimingModel is built once per job from a pre-computed TimingTrack and the
 * parsed cues. It is immutable afterwards and can be queried from any number
 * of render workers without locking.
 *
 * @section Dependencies
 * - TimingTypes
 */

#pragma once
#include <utility>
#include <vector>
#include "TimingTypes.hpp"
#include "core/ConfigData.hpp"
#include "util/Result.hpp"

namespace lf {

using TimingOptions = TimingConfig;

class TimingModel {
public:
    // Fails with TimingGap when the track and the cues share no time range
    static Result<TimingModel> create(TimingTrack track,
                                      std::vector<LyricCue> cues,
                                      TimingOptions options = {});

    RenderContext contextAt(f64 timestamp) const;

    const TimingTrack& track() const {
        return track_;
    }
    const std::vector<LyricCue>& cues() const {
        return cues_;
    }
    const LyricCue* cue(usize index) const {
        return index < cues_.size() ? &cues_[index] : nullptr;
    }

    std::pair<f64, f64> timeRange() const {
        return {track_.startTime(), track_.endTime()};
    }
    std::pair<f64, f64> cueRange() const;

private:
    TimingModel(TimingTrack track,
                std::vector<LyricCue> cues,
                TimingOptions options);

    std::optional<usize> findCue(f64 t) const;
    void sampleTrack(f64 t, RenderContext& ctx) const;
    bool onsetNear(f64 t) const;

    void snapCuesToBeats();
    f64 snapTime(f64 t) const;
    static void distributeWords(LyricCue& cue);

    TimingTrack track_;
    std::vector<LyricCue> cues_;
    TimingOptions options_;
};

} // namespace lf
