#pragma once
// FFmpegAudioDecoder.hpp - Decodes the job's audio track to interleaved float PCM
// Resampled to the output rate and channel count with libswresample

#include <filesystem>
#include <vector>
#include "util/Result.hpp"

namespace lf {

struct DecodedAudio {
    std::vector<f32> samples; // interleaved
    u32 sampleRate{48000};
    u32 channels{2};

    f64 duration() const {
        if (sampleRate == 0 || channels == 0)
            return 0.0;
        return static_cast<f64>(samples.size() / channels) / sampleRate;
    }
};

class FFmpegAudioDecoder {
public:
    // Decodes [offset, offset + duration); duration 0 reads to the end
    static Result<DecodedAudio> decode(const std::filesystem::path& path,
                                       u32 sampleRate,
                                       u32 channels,
                                       f64 offset = 0.0,
                                       f64 duration = 0.0);
};

} // namespace lf
