/**
 * @file EncoderSettings.hpp
 * @brief Resolved output settings for one encoding job.
 *
 * Built from RecordingConfig and VideoConfig before the job starts. Quality
 * presets map onto x264 preset/CRF and the hardware encoders' own presets.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "core/ConfigData.hpp"
#include "util/Result.hpp"

namespace lf {

namespace fs = std::filesystem;

struct EncoderSettings {
    fs::path outputPath;
    std::string container{"mp4"};

    u32 width{1920};
    u32 height{1080};
    u32 fps{30};

    bool preferHardware{true};
    std::string hardwareEncoder{"auto"};
    std::string softwareCodec{"libx264"};
    QualityPreset quality{QualityPreset::Balanced};
    std::string pixelFormat{"yuv420p"};
    u32 gopSize{0};

    // Audio muxed alongside the video; starts audioOffset seconds into the
    // source and runs for the video's duration
    std::optional<fs::path> audioSource;
    f64 audioOffset{0.0};
    f64 duration{0.0};
    AudioEncoderConfig audio;

    Result<void> validate() const;

    u32 effectiveGop() const {
        return gopSize > 0 ? gopSize : fps * 2;
    }

    // x264/x265
    std::string softwarePreset() const;
    u32 crf() const;

    // NVENC p1..p7, QSV/AMF/VideoToolbox use their own names
    std::string hardwarePreset(const std::string& encoder) const;

    static EncoderSettings fromConfig(const RecordingConfig& recording,
                                      const VideoConfig& video);

    // Expands {date}, {time} and {title} in the filename template and adds
    // the container extension
    static fs::path resolveOutputPath(const RecordingConfig& recording,
                                      std::string_view title = {});
};

} // namespace lf
