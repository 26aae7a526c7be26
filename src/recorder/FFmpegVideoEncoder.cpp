#include "FFmpegVideoEncoder.hpp"
#include <libavcodec/version.h>
#include "HardwareDetection.hpp"
#include "core/Logger.hpp"

extern "C" {
#include <libavutil/opt.h>
#include <libavutil/pixdesc.h>
}

#if LIBAVCODEC_VERSION_MAJOR >= 61
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace lf {

namespace {

AVPixelFormat choosePixelFormat(const AVCodec* codec, const std::string& wanted) {
    const AVPixelFormat preferred = av_get_pix_fmt(wanted.c_str());
    const AVPixelFormat* fmts = codec->pix_fmts;
    if (!fmts)
        return preferred != AV_PIX_FMT_NONE ? preferred : AV_PIX_FMT_YUV420P;

    auto supported = [fmts](AVPixelFormat f) {
        for (const AVPixelFormat* p = fmts; *p != AV_PIX_FMT_NONE; ++p) {
            if (*p == f)
                return true;
        }
        return false;
    };

    if (preferred != AV_PIX_FMT_NONE && supported(preferred))
        return preferred;
    if (supported(AV_PIX_FMT_NV12))
        return AV_PIX_FMT_NV12;
    if (supported(AV_PIX_FMT_YUV420P))
        return AV_PIX_FMT_YUV420P;
    return fmts[0];
}

// Rough bitrate for encoders without a constant-quality mode
i64 estimateBitrate(const EncoderSettings& settings) {
    const f64 bitsPerPixel = settings.quality == QualityPreset::Fast ? 0.07
                           : settings.quality == QualityPreset::HighQuality
                                   ? 0.15
                                   : 0.1;
    return static_cast<i64>(bitsPerPixel * settings.width * settings.height *
                            settings.fps);
}

} // namespace

FFmpegVideoEncoder::FFmpegVideoEncoder(FFmpegMuxer& muxer,
                                       std::string name,
                                       bool hardware)
    : muxer_(muxer), name_(std::move(name)), hardware_(hardware) {
}

Error FFmpegVideoEncoder::encodeError(std::string message) const {
    Error e(ErrorKind::Encoding, name_ + ": " + std::move(message));
    e.markRecoverable(hardware_);
    return e;
}

Result<void> FFmpegVideoEncoder::prepare(const EncoderSettings& settings) {
    codec_ = avcodec_find_encoder_by_name(name_.c_str());
    if (!codec_)
        return Result<void>::err(encodeError("encoder not available"));

    ctx_.reset(avcodec_alloc_context3(codec_));
    if (!ctx_)
        return Result<void>::err(encodeError("failed to allocate context"));

    ctx_->width = static_cast<int>(settings.width);
    ctx_->height = static_cast<int>(settings.height);
    ctx_->time_base = AVRational{1, static_cast<int>(settings.fps)};
    ctx_->framerate = AVRational{static_cast<int>(settings.fps), 1};
    ctx_->gop_size = static_cast<int>(settings.effectiveGop());
    ctx_->max_b_frames = 0;
    ctx_->pix_fmt = choosePixelFormat(codec_, settings.pixelFormat);
    return Result<void>::ok();
}

Result<void> FFmpegVideoEncoder::open(AVDictionary** options) {
    int ret = avcodec_open2(ctx_.get(), codec_, options);
    if (ret < 0)
        return Result<void>::err(encodeError("open failed: " + ffmpegError(ret)));

    frame_.reset(av_frame_alloc());
    packet_.reset(av_packet_alloc());
    if (!frame_ || !packet_)
        return Result<void>::err(encodeError("failed to allocate frame"));

    frame_->format = ctx_->pix_fmt;
    frame_->width = ctx_->width;
    frame_->height = ctx_->height;
    if ((ret = av_frame_get_buffer(frame_.get(), 0)) < 0) {
        return Result<void>::err(
                encodeError("frame buffer allocation failed: " + ffmpegError(ret)));
    }

    sws_.reset(sws_getContext(ctx_->width,
                              ctx_->height,
                              AV_PIX_FMT_RGBA,
                              ctx_->width,
                              ctx_->height,
                              ctx_->pix_fmt,
                              SWS_BILINEAR,
                              nullptr,
                              nullptr,
                              nullptr));
    if (!sws_)
        return Result<void>::err(encodeError("no RGBA conversion available"));

    LOG_INFO("Video encoder {} opened: {}x{} @ {} fps, {}",
             name_,
             ctx_->width,
             ctx_->height,
             ctx_->framerate.num,
             av_get_pix_fmt_name(ctx_->pix_fmt));
    return Result<void>::ok();
}

Result<void> FFmpegVideoEncoder::encode(const QImage& frame, u64 index) {
    if (!ctx_ || flushed_)
        return Result<void>::err(encodeError("encoder is not accepting frames"));
    if (frame.width() != ctx_->width || frame.height() != ctx_->height) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Frame size does not match the output size");
    }

    QImage rgba = frame.format() == QImage::Format_RGBA8888
                          ? frame
                          : frame.convertToFormat(QImage::Format_RGBA8888);

    int ret = av_frame_make_writable(frame_.get());
    if (ret < 0)
        return Result<void>::err(encodeError("frame not writable"));

    const u8* src[1] = {rgba.constBits()};
    int srcStride[1] = {static_cast<int>(rgba.bytesPerLine())};
    sws_scale(sws_.get(),
              src,
              srcStride,
              0,
              ctx_->height,
              frame_->data,
              frame_->linesize);

    frame_->pts = static_cast<i64>(index);

    ret = avcodec_send_frame(ctx_.get(), frame_.get());
    if (ret < 0) {
        return Result<void>::err(
                encodeError("send frame failed: " + ffmpegError(ret))
                        .atFrame(index));
    }

    if (auto r = drain(); !r) {
        r.error().atFrame(index);
        return r;
    }
    return Result<void>::ok();
}

Result<void> FFmpegVideoEncoder::drain() {
    while (true) {
        int ret = avcodec_receive_packet(ctx_.get(), packet_.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
            return Result<void>::ok();
        if (ret < 0) {
            return Result<void>::err(
                    encodeError("receive packet failed: " + ffmpegError(ret)));
        }

        // No B-frames: pts is the frame index
        const i64 pts = packet_->pts;
        auto written = muxer_.writeVideo(packet_.get(), ctx_->time_base);
        av_packet_unref(packet_.get());
        if (!written)
            return written;
        if (pts != AV_NOPTS_VALUE && pts >= 0)
            lastWritten_ = static_cast<u64>(pts);
    }
}

Result<void> FFmpegVideoEncoder::flush() {
    if (!ctx_ || flushed_)
        return Result<void>::ok();
    flushed_ = true;

    int ret = avcodec_send_frame(ctx_.get(), nullptr);
    if (ret < 0 && ret != AVERROR_EOF)
        return Result<void>::err(encodeError("flush failed: " + ffmpegError(ret)));
    return drain();
}

Result<VideoEncoderBackendPtr> HardwareEncoder::create(
        FFmpegMuxer& muxer,
        const EncoderSettings& settings,
        const std::string& encoder) {
    using Out = Result<VideoEncoderBackendPtr>;
    auto enc = std::make_unique<HardwareEncoder>(Key{}, muxer, encoder);
    if (auto r = enc->prepare(settings); !r)
        return Out::err(r.error());

    AVCodecContext* ctx = enc->ctx_.get();
    const std::string preset = settings.hardwarePreset(encoder);
    const std::string quality = std::to_string(settings.crf());

    AVDictionary* opts = nullptr;
    if (encoder == "h264_nvenc") {
        av_dict_set(&opts, "preset", preset.c_str(), 0);
        av_dict_set(&opts, "tune", "hq", 0);
        av_dict_set(&opts, "delay", "0", 0);
        av_dict_set(&opts, "zerolatency", "1", 0);
        av_dict_set(&opts, "rc", "vbr", 0);
        av_dict_set(&opts, "cq", quality.c_str(), 0);
    } else if (encoder == "h264_qsv") {
        av_dict_set(&opts, "preset", preset.c_str(), 0);
        ctx->global_quality = static_cast<int>(settings.crf());
    } else if (encoder == "h264_amf") {
        av_dict_set(&opts, "quality", preset.c_str(), 0);
        av_dict_set(&opts, "rc", "cqp", 0);
        av_dict_set(&opts, "qp_i", quality.c_str(), 0);
        av_dict_set(&opts, "qp_p", quality.c_str(), 0);
    } else {
        ctx->bit_rate = estimateBitrate(settings);
    }

    if (auto type = HardwareDetection::deviceTypeFor(encoder);
        type != AV_HWDEVICE_TYPE_NONE) {
        AVBufferRef* device = nullptr;
        if (av_hwdevice_ctx_create(&device, type, nullptr, nullptr, 0) < 0) {
            av_dict_free(&opts);
            return Out::err(enc->encodeError("hardware device unavailable"));
        }
        enc->device_.reset(device);
        ctx->hw_device_ctx = av_buffer_ref(device);
    }

    auto opened = enc->open(&opts);
    av_dict_free(&opts);
    if (!opened)
        return Out::err(opened.error());

    return Out::ok(std::move(enc));
}

Result<VideoEncoderBackendPtr> SoftwareEncoder::create(
        FFmpegMuxer& muxer, const EncoderSettings& settings) {
    using Out = Result<VideoEncoderBackendPtr>;
    auto enc = std::make_unique<SoftwareEncoder>(Key{}, muxer, settings.softwareCodec);
    if (auto r = enc->prepare(settings); !r)
        return Out::err(r.error());

    AVDictionary* opts = nullptr;
    av_dict_set(&opts, "preset", settings.softwarePreset().c_str(), 0);
    av_dict_set(&opts, "crf", std::to_string(settings.crf()).c_str(), 0);

    auto opened = enc->open(&opts);
    av_dict_free(&opts);
    if (!opened)
        return Out::err(opened.error());

    return Out::ok(std::move(enc));
}

} // namespace lf

#if LIBAVCODEC_VERSION_MAJOR >= 61
#pragma GCC diagnostic pop
#endif
