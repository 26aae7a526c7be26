#pragma once
// TimingTypes.hpp - Timing track samples, lyric cues and per-frame context
// Produced by external collaborators, consumed read-only by the pipeline

#include <optional>
#include <string>
#include <vector>
#include "util/Types.hpp"

namespace lf {

struct TimingSample {
    f64 time{0.0};
    f32 beatPhase{0.0f}; // [0,1)
    bool onset{false};
    std::vector<f32> bandEnergies;
};

struct TimingTrack {
    std::vector<TimingSample> samples; // sorted by time
    std::vector<f64> beatTimes;        // optional, sorted
    f64 duration{0.0};                 // audio length, 0 if unknown

    bool empty() const {
        return samples.empty();
    }
    f64 startTime() const {
        return samples.empty() ? 0.0 : samples.front().time;
    }
    f64 endTime() const {
        if (samples.empty())
            return 0.0;
        return std::max(samples.back().time, duration);
    }
    usize bandCount() const {
        return samples.empty() ? 0 : samples.front().bandEnergies.size();
    }
};

struct WordTiming {
    std::string text;
    f64 start{0.0};
    f64 end{0.0};
};

struct LyricCue {
    f64 startTime{0.0};
    f64 endTime{0.0};
    std::string text;
    std::vector<WordTiming> words;  // empty: distributed evenly
    std::string styleTemplate;      // empty: base style

    f64 duration() const {
        return endTime - startTime;
    }
    bool contains(f64 t) const {
        return t >= startTime && t < endTime;
    }
};

struct RenderContext {
    f64 timestamp{0.0};
    std::optional<usize> activeCue;
    f32 cueProgress{0.0f};
    std::vector<f32> perWordProgress;
    f32 beatPhase{0.0f};
    std::vector<f32> bandEnergies;
    bool onset{false};
    f32 energy{0.0f};      // mean band energy, [0,1]
    f64 timeInCue{0.0};    // seconds since cue start
    f64 timeToCueEnd{0.0}; // seconds until cue end

    f32 band(usize i) const {
        return i < bandEnergies.size() ? bandEnergies[i] : 0.0f;
    }
};

} // namespace lf
