#pragma once
// FFmpegBackendProvider.hpp - EncoderBackendProvider over libavformat/libavcodec
// Owns the muxer; the first encoder created defines the video stream

#include <deque>
#include "FFmpegAudioEncoder.hpp"
#include "FFmpegMuxer.hpp"
#include "VideoEncoderBackend.hpp"

namespace lf {

class FFmpegBackendProvider : public EncoderBackendProvider {
public:
    Result<void> openOutput(const EncoderSettings& settings) override;

    std::optional<std::string> detectHardware(
            const EncoderSettings& settings) override;

    Result<VideoEncoderBackendPtr> createHardwareEncoder(
            const EncoderSettings& settings, const std::string& encoder) override;
    Result<VideoEncoderBackendPtr> createSoftwareEncoder(
            const EncoderSettings& settings) override;

    Result<void> finalizeOutput() override;
    void abortOutput() override;

    const FFmpegMuxer& muxer() const {
        return muxer_;
    }

private:
    Result<void> prepareAudio(const EncoderSettings& settings);
    Result<VideoEncoderBackendPtr> attach(Result<VideoEncoderBackendPtr> created);

    FFmpegMuxer muxer_;
    FFmpegAudioEncoder audioEncoder_;
    std::deque<AVPacketPtr> audioPackets_;
    bool audioReady_{false};
};

} // namespace lf
