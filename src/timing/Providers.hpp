#pragma once
// Providers.hpp - Contracts for the collaborators that feed a render job
// Feature extraction and lyric tokenizing live outside this library

#include <filesystem>
#include <vector>
#include "TimingTypes.hpp"
#include "util/Result.hpp"

namespace lf {

namespace fs = std::filesystem;

class AudioFeatureProvider {
public:
    virtual ~AudioFeatureProvider() = default;

    virtual Result<TimingTrack> load(const fs::path& audioSource) = 0;
};

class LyricParser {
public:
    virtual ~LyricParser() = default;

    // Cues must come back ordered by start time
    virtual Result<std::vector<LyricCue>> parse(const fs::path& lyricSource) = 0;
};

} // namespace lf
