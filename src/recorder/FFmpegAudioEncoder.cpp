#include "FFmpegAudioEncoder.hpp"
#include <libavcodec/version.h>
#include <cstring>
#include "core/Logger.hpp"

extern "C" {
#include <libavutil/channel_layout.h>
}

#if LIBAVCODEC_VERSION_MAJOR >= 60
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace lf {

Result<void> FFmpegAudioEncoder::open(const AudioEncoderConfig& config,
                                      bool globalHeader) {
    const AVCodec* codec = avcodec_find_encoder_by_name(config.codec.c_str());
    if (!codec) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Audio codec not found: " + config.codec);
    }

    ctx_.reset(avcodec_alloc_context3(codec));
    if (!ctx_) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Failed to allocate audio codec context");
    }

    ctx_->sample_rate = static_cast<int>(config.sampleRate);
    ctx_->bit_rate = static_cast<i64>(config.bitrate) * 1000;
    av_channel_layout_default(&ctx_->ch_layout, static_cast<int>(config.channels));
    ctx_->sample_fmt =
            codec->sample_fmts ? codec->sample_fmts[0] : AV_SAMPLE_FMT_FLTP;
    ctx_->time_base = AVRational{1, static_cast<int>(config.sampleRate)};
    if (globalHeader)
        ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    int ret = avcodec_open2(ctx_.get(), codec, nullptr);
    if (ret < 0) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Failed to open audio codec: " +
                                         ffmpegError(ret));
    }

    frame_.reset(av_frame_alloc());
    frame_->format = ctx_->sample_fmt;
    av_channel_layout_copy(&frame_->ch_layout, &ctx_->ch_layout);
    frame_->sample_rate = ctx_->sample_rate;
    frame_->nb_samples = ctx_->frame_size > 0 ? ctx_->frame_size : 1024;
    if ((ret = av_frame_get_buffer(frame_.get(), 0)) < 0) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Failed to allocate audio frame: " +
                                         ffmpegError(ret));
    }

    SwrContext* s = nullptr;
    ret = swr_alloc_set_opts2(&s,
                              &ctx_->ch_layout,
                              ctx_->sample_fmt,
                              ctx_->sample_rate,
                              &ctx_->ch_layout,
                              AV_SAMPLE_FMT_FLT,
                              ctx_->sample_rate,
                              0,
                              nullptr);
    swr_.reset(s);
    if (ret < 0 || swr_init(swr_.get()) < 0) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Failed to initialize audio resampler");
    }

    LOG_DEBUG("Audio encoder {} opened: {} Hz, {} kbps, frame size {}",
              codec->name,
              config.sampleRate,
              config.bitrate,
              frame_->nb_samples);
    return Result<void>::ok();
}

Result<void> FFmpegAudioEncoder::sendFrame(AVFrame* frame,
                                           std::deque<AVPacketPtr>& out) {
    int ret = avcodec_send_frame(ctx_.get(), frame);
    if (ret < 0) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Audio encode failed: " + ffmpegError(ret));
    }

    while (true) {
        AVPacketPtr pkt(av_packet_alloc());
        ret = avcodec_receive_packet(ctx_.get(), pkt.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
            break;
        if (ret < 0) {
            return Result<void>::err(ErrorKind::Encoding,
                                     "Audio encode failed: " + ffmpegError(ret));
        }
        out.push_back(std::move(pkt));
    }
    return Result<void>::ok();
}

Result<std::deque<AVPacketPtr>> FFmpegAudioEncoder::encode(
        const DecodedAudio& audio) {
    using Out = Result<std::deque<AVPacketPtr>>;
    if (!ctx_)
        return Out::err(ErrorKind::Encoding, "Audio encoder not open");

    const usize channels = audio.channels;
    const auto frameSize = static_cast<usize>(frame_->nb_samples);
    const usize totalFrames = audio.samples.size() / channels;

    std::deque<AVPacketPtr> packets;
    std::vector<f32> chunk(frameSize * channels);
    i64 pts = 0;

    for (usize pos = 0; pos < totalFrames; pos += frameSize) {
        const usize n = std::min(frameSize, totalFrames - pos);
        std::fill(chunk.begin(), chunk.end(), 0.0f);
        std::memcpy(chunk.data(),
                    audio.samples.data() + pos * channels,
                    n * channels * sizeof(f32));

        int ret = av_frame_make_writable(frame_.get());
        if (ret < 0)
            return Out::err(ErrorKind::Encoding, "Audio frame not writable");

        const u8* src[1] = {reinterpret_cast<const u8*>(chunk.data())};
        ret = swr_convert(swr_.get(),
                          frame_->data,
                          static_cast<int>(frameSize),
                          src,
                          static_cast<int>(frameSize));
        if (ret < 0) {
            return Out::err(ErrorKind::Encoding,
                            "Audio resample error: " + ffmpegError(ret));
        }

        frame_->pts = pts;
        pts += static_cast<i64>(frameSize);
        if (auto r = sendFrame(frame_.get(), packets); !r)
            return Out::err(r.error());
    }

    if (auto r = sendFrame(nullptr, packets); !r)
        return Out::err(r.error());

    LOG_DEBUG("Audio encoded: {} packets", packets.size());
    return Out::ok(std::move(packets));
}

} // namespace lf

#if LIBAVCODEC_VERSION_MAJOR >= 60
#pragma GCC diagnostic pop
#endif
