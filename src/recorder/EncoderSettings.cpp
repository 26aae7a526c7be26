#include "EncoderSettings.hpp"
#include <ctime>

namespace lf {

namespace {
void replaceAll(std::string& s, std::string_view from, std::string_view to) {
    for (usize pos = s.find(from); pos != std::string::npos;
         pos = s.find(from, pos + to.size())) {
        s.replace(pos, from.size(), to);
    }
}

std::string formatNow(const char* fmt) {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return buf;
}
} // namespace

Result<void> EncoderSettings::validate() const {
    if (outputPath.empty())
        return Result<void>::err(ErrorKind::InvalidArgument,
                                 "Output path is empty");
    if (width == 0 || height == 0)
        return Result<void>::err(ErrorKind::InvalidArgument,
                                 "Invalid video dimensions");
    if (width % 2 != 0 || height % 2 != 0)
        return Result<void>::err(ErrorKind::InvalidArgument,
                                 "Video dimensions must be even");
    if (fps == 0 || fps > 240)
        return Result<void>::err(ErrorKind::InvalidArgument, "Invalid frame rate");
    if (softwareCodec.empty())
        return Result<void>::err(ErrorKind::InvalidArgument,
                                 "No software codec configured");
    if (container.empty())
        return Result<void>::err(ErrorKind::InvalidArgument,
                                 "No container format configured");
    if (audioSource) {
        std::error_code ec;
        if (!fs::is_regular_file(*audioSource, ec))
            return Result<void>::err(ErrorKind::Io,
                                     "Audio source not found: " +
                                             audioSource->string());
        if (audio.channels == 0 || audio.sampleRate == 0)
            return Result<void>::err(ErrorKind::InvalidArgument,
                                     "Invalid audio format");
    }
    return Result<void>::ok();
}

std::string EncoderSettings::softwarePreset() const {
    switch (quality) {
    case QualityPreset::Fast:
        return "fast";
    case QualityPreset::Balanced:
        return "medium";
    case QualityPreset::HighQuality:
        return "slow";
    }
    return "medium";
}

u32 EncoderSettings::crf() const {
    switch (quality) {
    case QualityPreset::Fast:
        return 28;
    case QualityPreset::Balanced:
        return 23;
    case QualityPreset::HighQuality:
        return 18;
    }
    return 23;
}

std::string EncoderSettings::hardwarePreset(const std::string& encoder) const {
    if (encoder.find("nvenc") != std::string::npos) {
        switch (quality) {
        case QualityPreset::Fast:
            return "p2";
        case QualityPreset::Balanced:
            return "p4";
        case QualityPreset::HighQuality:
            return "p6";
        }
    }
    if (encoder.find("amf") != std::string::npos) {
        switch (quality) {
        case QualityPreset::Fast:
            return "speed";
        case QualityPreset::Balanced:
            return "balanced";
        case QualityPreset::HighQuality:
            return "quality";
        }
    }
    // qsv and videotoolbox follow the x264 names
    return softwarePreset();
}

EncoderSettings EncoderSettings::fromConfig(const RecordingConfig& recording,
                                            const VideoConfig& video) {
    EncoderSettings s;
    s.outputPath = resolveOutputPath(recording);
    s.container = recording.container;
    s.width = video.width;
    s.height = video.height;
    s.fps = video.fps;
    s.preferHardware = recording.video.preferHardware;
    s.hardwareEncoder = recording.video.hardwareEncoder;
    s.softwareCodec = recording.video.softwareCodec;
    s.quality = recording.video.quality;
    s.pixelFormat = recording.video.pixelFormat;
    s.gopSize = recording.video.gopSize;
    s.audioOffset = video.startTime;
    s.duration = video.duration;
    s.audio = recording.audio;
    return s;
}

fs::path EncoderSettings::resolveOutputPath(const RecordingConfig& recording,
                                            std::string_view title) {
    std::string name = recording.defaultFilename;
    replaceAll(name, "{date}", formatNow("%Y-%m-%d"));
    replaceAll(name, "{time}", formatNow("%H-%M-%S"));
    replaceAll(name, "{title}", title.empty() ? "untitled" : title);
    name += "." + recording.container;
    return recording.outputDirectory / name;
}

} // namespace lf
