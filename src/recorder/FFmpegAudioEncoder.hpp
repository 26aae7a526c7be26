#pragma once
// FFmpegAudioEncoder.hpp - Encodes decoded PCM into packets for the muxer
// The whole track is encoded before the first video frame

#include <deque>
#include "FFmpegAudioDecoder.hpp"
#include "FFmpegUtils.hpp"
#include "core/ConfigData.hpp"

namespace lf {

class FFmpegAudioEncoder {
public:
    Result<void> open(const AudioEncoderConfig& config, bool globalHeader);

    // Encodes and flushes; pts are in context()->time_base
    Result<std::deque<AVPacketPtr>> encode(const DecodedAudio& audio);

    const AVCodecContext* context() const {
        return ctx_.get();
    }

private:
    Result<void> sendFrame(AVFrame* frame, std::deque<AVPacketPtr>& out);

    AVCodecContextPtr ctx_;
    SwrContextPtr swr_;
    AVFramePtr frame_;
};

} // namespace lf
