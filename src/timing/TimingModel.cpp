#include "TimingModel.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include "core/Logger.hpp"

namespace lf {

namespace {

f32 clamp01(f64 v) {
    return static_cast<f32>(std::clamp(v, 0.0, 1.0));
}

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream ss(text);
    std::string w;
    while (ss >> w)
        words.push_back(w);
    return words;
}

} // namespace

Result<TimingModel> TimingModel::create(TimingTrack track,
                                        std::vector<LyricCue> cues,
                                        TimingOptions options) {
    if (track.samples.empty()) {
        return Result<TimingModel>::err(ErrorKind::TimingGap,
                                        "Timing track has no samples");
    }

    std::stable_sort(track.samples.begin(),
                     track.samples.end(),
                     [](const auto& a, const auto& b) { return a.time < b.time; });
    std::sort(track.beatTimes.begin(), track.beatTimes.end());

    const usize bands = track.bandCount();
    for (const auto& s : track.samples) {
        if (s.bandEnergies.size() != bands) {
            return Result<TimingModel>::err(
                    ErrorKind::InvalidArgument,
                    "Timing samples disagree on band count");
        }
    }

    std::stable_sort(cues.begin(), cues.end(), [](const auto& a, const auto& b) {
        return a.startTime < b.startTime;
    });

    for (usize i = 0; i < cues.size(); ++i) {
        if (cues[i].endTime <= cues[i].startTime) {
            return Result<TimingModel>::err(
                    ErrorKind::InvalidArgument,
                    "Cue " + std::to_string(i) + " has non-positive duration");
        }
        if (i > 0 && cues[i].startTime < cues[i - 1].endTime) {
            return Result<TimingModel>::err(
                    ErrorKind::InvalidArgument,
                    "Cues " + std::to_string(i - 1) + " and " +
                            std::to_string(i) + " overlap");
        }
    }

    if (!cues.empty()) {
        const f64 trackStart = track.startTime();
        const f64 trackEnd = track.endTime();
        const f64 cueStart = cues.front().startTime;
        const f64 cueEnd = cues.back().endTime;
        if (cueEnd <= trackStart || cueStart >= trackEnd) {
            std::ostringstream msg;
            msg << "Lyric cues [" << cueStart << ", " << cueEnd
                << "] do not overlap audio timing [" << trackStart << ", "
                << trackEnd << "]";
            return Result<TimingModel>::err(ErrorKind::TimingGap, msg.str());
        }
    }

    return Result<TimingModel>::ok(
            TimingModel(std::move(track), std::move(cues), options));
}

TimingModel::TimingModel(TimingTrack track,
                         std::vector<LyricCue> cues,
                         TimingOptions options)
    : track_(std::move(track)), cues_(std::move(cues)), options_(options) {
    if (options_.snapToBeats && !track_.beatTimes.empty()) {
        snapCuesToBeats();
    }
    for (auto& cue : cues_) {
        distributeWords(cue);
    }
    LOG_DEBUG("TimingModel: {} samples, {} beats, {} cues",
              track_.samples.size(),
              track_.beatTimes.size(),
              cues_.size());
}

std::pair<f64, f64> TimingModel::cueRange() const {
    if (cues_.empty())
        return {0.0, 0.0};
    return {cues_.front().startTime, cues_.back().endTime};
}

RenderContext TimingModel::contextAt(f64 timestamp) const {
    RenderContext ctx;
    ctx.timestamp = timestamp;

    sampleTrack(timestamp, ctx);
    ctx.onset = onsetNear(timestamp);

    if (auto idx = findCue(timestamp)) {
        const auto& cue = cues_[*idx];
        ctx.activeCue = idx;
        ctx.timeInCue = timestamp - cue.startTime;
        ctx.timeToCueEnd = cue.endTime - timestamp;
        ctx.cueProgress = clamp01(ctx.timeInCue / cue.duration());

        ctx.perWordProgress.reserve(cue.words.size());
        for (const auto& w : cue.words) {
            if (timestamp < w.start) {
                ctx.perWordProgress.push_back(0.0f);
            } else if (timestamp >= w.end || w.end <= w.start) {
                ctx.perWordProgress.push_back(1.0f);
            } else {
                ctx.perWordProgress.push_back(
                        clamp01((timestamp - w.start) / (w.end - w.start)));
            }
        }
    }
    return ctx;
}

std::optional<usize> TimingModel::findCue(f64 t) const {
    auto it = std::upper_bound(
            cues_.begin(), cues_.end(), t, [](f64 v, const LyricCue& c) {
                return v < c.startTime;
            });
    if (it == cues_.begin())
        return std::nullopt;
    --it;
    if (!it->contains(t))
        return std::nullopt;
    return static_cast<usize>(std::distance(cues_.begin(), it));
}

void TimingModel::sampleTrack(f64 t, RenderContext& ctx) const {
    const auto& samples = track_.samples;

    auto it = std::upper_bound(
            samples.begin(), samples.end(), t, [](f64 v, const TimingSample& s) {
                return v < s.time;
            });

    if (it == samples.begin()) {
        ctx.beatPhase = samples.front().beatPhase;
        ctx.bandEnergies = samples.front().bandEnergies;
    } else if (it == samples.end()) {
        ctx.beatPhase = samples.back().beatPhase;
        ctx.bandEnergies = samples.back().bandEnergies;
    } else {
        const auto& b = *it;
        const auto& a = *(it - 1);
        const f64 span = b.time - a.time;
        const f32 alpha =
                span > 0.0 ? static_cast<f32>((t - a.time) / span) : 0.0f;

        ctx.bandEnergies.resize(a.bandEnergies.size());
        for (usize i = 0; i < a.bandEnergies.size(); ++i) {
            ctx.bandEnergies[i] = a.bandEnergies[i] +
                                  (b.bandEnergies[i] - a.bandEnergies[i]) * alpha;
        }

        // Phase only moves forward; a smaller next value means it wrapped
        f32 pa = a.beatPhase;
        f32 pb = b.beatPhase;
        if (pb < pa)
            pb += 1.0f;
        f32 phase = pa + (pb - pa) * alpha;
        ctx.beatPhase = phase - std::floor(phase);
    }

    if (ctx.beatPhase >= 1.0f || ctx.beatPhase < 0.0f)
        ctx.beatPhase = ctx.beatPhase - std::floor(ctx.beatPhase);

    if (!ctx.bandEnergies.empty()) {
        f32 sum = 0.0f;
        for (f32 e : ctx.bandEnergies)
            sum += e;
        ctx.energy = std::clamp(sum / static_cast<f32>(ctx.bandEnergies.size()),
                                0.0f,
                                1.0f);
    }
}

bool TimingModel::onsetNear(f64 t) const {
    const auto& samples = track_.samples;
    auto first = std::lower_bound(samples.begin(),
                                  samples.end(),
                                  t - options_.onsetTolerance,
                                  [](const TimingSample& s, f64 v) {
                                      return s.time < v;
                                  });
    for (auto it = first; it != samples.end(); ++it) {
        if (it->time > t + options_.onsetTolerance)
            break;
        if (it->onset)
            return true;
    }
    return false;
}

f64 TimingModel::snapTime(f64 t) const {
    const auto& beats = track_.beatTimes;
    auto it = std::lower_bound(beats.begin(), beats.end(), t);

    f64 best = t;
    f64 bestDist = options_.maxSnapShift;
    if (it != beats.end() && std::abs(*it - t) <= bestDist) {
        best = *it;
        bestDist = std::abs(*it - t);
    }
    if (it != beats.begin() && std::abs(*(it - 1) - t) <= bestDist) {
        best = *(it - 1);
    }
    return best;
}

void TimingModel::snapCuesToBeats() {
    f64 previousEnd = -1.0;
    usize snapped = 0;
    for (auto& cue : cues_) {
        f64 start = std::max(snapTime(cue.startTime), previousEnd);
        f64 end = snapTime(cue.endTime);
        if (end <= start) {
            start = std::max(cue.startTime, previousEnd);
            end = cue.endTime;
        }
        if (start != cue.startTime || end != cue.endTime)
            ++snapped;
        cue.startTime = start;
        cue.endTime = end;
        for (auto& w : cue.words) {
            w.start = std::clamp(w.start, start, end);
            w.end = std::clamp(w.end, w.start, end);
        }
        previousEnd = end;
    }
    LOG_DEBUG("TimingModel: snapped {} of {} cues to beats",
              snapped,
              cues_.size());
}

void TimingModel::distributeWords(LyricCue& cue) {
    if (!cue.words.empty())
        return;

    auto tokens = splitWords(cue.text);
    if (tokens.empty())
        return;

    const f64 perWord = cue.duration() / static_cast<f64>(tokens.size());
    f64 t = cue.startTime;
    for (auto& token : tokens) {
        cue.words.push_back({std::move(token), t, t + perWord});
        t += perWord;
    }
    cue.words.back().end = cue.endTime;
}

} // namespace lf
