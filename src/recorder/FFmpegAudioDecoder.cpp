#include "FFmpegAudioDecoder.hpp"
#include <limits>
#include "FFmpegUtils.hpp"
#include "core/Logger.hpp"

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
}

namespace lf {

namespace {
Result<DecodedAudio> fail(const std::string& msg) {
    return Result<DecodedAudio>::err(ErrorKind::Io, msg);
}
} // namespace

Result<DecodedAudio> FFmpegAudioDecoder::decode(const std::filesystem::path& path,
                                                u32 sampleRate,
                                                u32 channels,
                                                f64 offset,
                                                f64 duration) {
    AVFormatContext* rawFmt = nullptr;
    int ret = avformat_open_input(&rawFmt, path.c_str(), nullptr, nullptr);
    if (ret < 0)
        return fail("Could not open audio " + path.string() + ": " +
                    ffmpegError(ret));
    AVInputContextPtr fmt(rawFmt);

    if ((ret = avformat_find_stream_info(fmt.get(), nullptr)) < 0)
        return fail("Could not find stream info: " + ffmpegError(ret));

    const AVCodec* codec = nullptr;
    int streamIndex =
            av_find_best_stream(fmt.get(), AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
    if (streamIndex < 0 || !codec)
        return fail("No audio stream in " + path.string());

    AVCodecContextPtr dec(avcodec_alloc_context3(codec));
    if (!dec)
        return fail("Could not allocate audio decoder");
    avcodec_parameters_to_context(dec.get(),
                                  fmt->streams[streamIndex]->codecpar);
    if ((ret = avcodec_open2(dec.get(), codec, nullptr)) < 0)
        return fail("Could not open audio decoder: " + ffmpegError(ret));

    AVChannelLayout outLayout;
    av_channel_layout_default(&outLayout, static_cast<int>(channels));

    SwrContext* rawSwr = nullptr;
    ret = swr_alloc_set_opts2(&rawSwr,
                              &outLayout,
                              AV_SAMPLE_FMT_FLT,
                              static_cast<int>(sampleRate),
                              &dec->ch_layout,
                              dec->sample_fmt,
                              dec->sample_rate,
                              0,
                              nullptr);
    SwrContextPtr swr(rawSwr);
    av_channel_layout_uninit(&outLayout);
    if (ret < 0 || swr_init(swr.get()) < 0)
        return fail("Could not initialize resampler");

    AVFramePtr frame(av_frame_alloc());
    AVPacketPtr packet(av_packet_alloc());
    if (!frame || !packet)
        return fail("Could not allocate frame/packet");

    DecodedAudio out;
    out.sampleRate = sampleRate;
    out.channels = channels;

    const auto skip = static_cast<usize>(std::max(0.0, offset) * sampleRate);
    const usize limit = duration > 0.0
                                ? static_cast<usize>(duration * sampleRate)
                                : std::numeric_limits<usize>::max();
    usize produced = 0; // frames out of the resampler, before skipping

    auto append = [&](const f32* data, int frames) {
        for (int i = 0; i < frames; ++i, ++produced) {
            if (produced < skip)
                continue;
            if (out.samples.size() / channels >= limit)
                return;
            out.samples.insert(out.samples.end(),
                               data + static_cast<usize>(i) * channels,
                               data + static_cast<usize>(i + 1) * channels);
        }
    };

    std::vector<f32> buffer;
    auto convert = [&](AVFrame* in) -> bool {
        const int inSamples = in ? in->nb_samples : 0;
        const int maxOut = swr_get_out_samples(swr.get(), inSamples);
        if (maxOut <= 0)
            return true;
        buffer.resize(static_cast<usize>(maxOut) * channels);
        u8* outPtr = reinterpret_cast<u8*>(buffer.data());
        int converted = swr_convert(swr.get(),
                                    &outPtr,
                                    maxOut,
                                    in ? const_cast<const u8**>(in->extended_data)
                                       : nullptr,
                                    inSamples);
        if (converted < 0) {
            LOG_WARN("swr_convert failed: {}", ffmpegError(converted));
            return false;
        }
        append(buffer.data(), converted);
        return true;
    };

    auto drainDecoder = [&]() {
        while (avcodec_receive_frame(dec.get(), frame.get()) >= 0) {
            convert(frame.get());
            av_frame_unref(frame.get());
        }
    };

    while (av_read_frame(fmt.get(), packet.get()) >= 0) {
        if (packet->stream_index == streamIndex) {
            if (avcodec_send_packet(dec.get(), packet.get()) < 0) {
                LOG_WARN("Error sending audio packet to decoder");
            } else {
                drainDecoder();
            }
        }
        av_packet_unref(packet.get());
        if (out.samples.size() / channels >= limit)
            break;
    }

    avcodec_send_packet(dec.get(), nullptr);
    drainDecoder();
    convert(nullptr);

    if (out.samples.empty())
        return fail("No audio decoded in the requested range of " +
                    path.string());

    LOG_INFO("Decoded audio {}: {:.2f}s, {} Hz, {} ch",
             path.string(),
             out.duration(),
             sampleRate,
             channels);
    return Result<DecodedAudio>::ok(std::move(out));
}

} // namespace lf
