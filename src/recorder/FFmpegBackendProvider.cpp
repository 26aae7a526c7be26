#include "FFmpegBackendProvider.hpp"
#include "FFmpegAudioDecoder.hpp"
#include "FFmpegVideoEncoder.hpp"
#include "HardwareDetection.hpp"
#include "core/Logger.hpp"

namespace lf {

Result<void> FFmpegBackendProvider::openOutput(const EncoderSettings& settings) {
    if (auto r = muxer_.open(settings.outputPath, settings.container); !r)
        return r;

    if (settings.audioSource) {
        if (auto r = prepareAudio(settings); !r) {
            muxer_.abort();
            return r;
        }
    }

    LOG_INFO("Output opened: {} ({})",
             settings.outputPath.string(),
             settings.container);
    return Result<void>::ok();
}

Result<void> FFmpegBackendProvider::prepareAudio(const EncoderSettings& settings) {
    auto decoded = FFmpegAudioDecoder::decode(*settings.audioSource,
                                              settings.audio.sampleRate,
                                              settings.audio.channels,
                                              settings.audioOffset,
                                              settings.duration);
    if (!decoded)
        return Result<void>::err(decoded.error());

    if (auto r = audioEncoder_.open(settings.audio, muxer_.wantsGlobalHeader());
        !r) {
        return r;
    }

    auto packets = audioEncoder_.encode(*decoded);
    if (!packets)
        return Result<void>::err(packets.error());

    audioPackets_ = std::move(packets).value();
    audioReady_ = true;
    LOG_DEBUG("Audio track prepared: {:.2f}s from {}",
              decoded->duration(),
              settings.audioSource->string());
    return Result<void>::ok();
}

std::optional<std::string> FFmpegBackendProvider::detectHardware(
        const EncoderSettings& settings) {
    return HardwareDetection::detect(settings);
}

Result<VideoEncoderBackendPtr> FFmpegBackendProvider::attach(
        Result<VideoEncoderBackendPtr> created) {
    if (!created || muxer_.headerWritten())
        return created;

    auto* encoder = static_cast<FFmpegVideoEncoder*>(created.value().get());
    if (auto r = muxer_.addVideoStream(encoder->context()); !r)
        return Result<VideoEncoderBackendPtr>::err(r.error());

    if (audioReady_) {
        auto r = muxer_.addAudioStream(audioEncoder_.context(),
                                       std::move(audioPackets_));
        if (!r)
            return Result<VideoEncoderBackendPtr>::err(r.error());
    }

    if (auto r = muxer_.writeHeader(); !r)
        return Result<VideoEncoderBackendPtr>::err(r.error());
    return created;
}

Result<VideoEncoderBackendPtr> FFmpegBackendProvider::createHardwareEncoder(
        const EncoderSettings& settings, const std::string& encoder) {
    return attach(HardwareEncoder::create(muxer_, settings, encoder));
}

Result<VideoEncoderBackendPtr> FFmpegBackendProvider::createSoftwareEncoder(
        const EncoderSettings& settings) {
    return attach(SoftwareEncoder::create(muxer_, settings));
}

Result<void> FFmpegBackendProvider::finalizeOutput() {
    auto r = muxer_.finish();
    if (r)
        LOG_INFO("Output finalized: {} bytes", muxer_.bytesWritten());
    return r;
}

void FFmpegBackendProvider::abortOutput() {
    muxer_.abort();
}

} // namespace lf
