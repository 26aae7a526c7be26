/**
 * @file FFmpegVideoEncoder.hpp
 * @brief libavcodec video encoders writing into a shared FFmpegMuxer.
 *
 * Both flavours are configured without B-frames and without global headers
 * so parameter sets travel in-band; a software encoder can then continue
 * a stream a hardware encoder started.
 *
 * @section Dependencies
 * - FFmpeg (libavcodec, libswscale, libavutil hwcontext)
 */

#pragma once
#include "FFmpegMuxer.hpp"
#include "VideoEncoderBackend.hpp"

namespace lf {

class FFmpegVideoEncoder : public VideoEncoderBackend {
public:
    ~FFmpegVideoEncoder() override = default;

    std::string name() const override {
        return name_;
    }
    bool isHardware() const override {
        return hardware_;
    }

    Result<void> encode(const QImage& frame, u64 index) override;
    Result<void> flush() override;

    std::optional<u64> lastWrittenIndex() const override {
        return lastWritten_;
    }

    const AVCodecContext* context() const {
        return ctx_.get();
    }

protected:
    FFmpegVideoEncoder(FFmpegMuxer& muxer, std::string name, bool hardware);

    // Allocates the context with the settings both flavours share
    Result<void> prepare(const EncoderSettings& settings);
    Result<void> open(AVDictionary** options);

    Error encodeError(std::string message) const;

    FFmpegMuxer& muxer_;
    std::string name_;
    bool hardware_;
    const AVCodec* codec_{nullptr};
    AVCodecContextPtr ctx_;
    AVBufferRefPtr device_;

private:
    Result<void> drain();

    SwsContextPtr sws_;
    AVFramePtr frame_;
    AVPacketPtr packet_;
    bool flushed_{false};
    std::optional<u64> lastWritten_;
};

class HardwareEncoder : public FFmpegVideoEncoder {
    struct Key {
        explicit Key() = default;
    };

public:
    // Key keeps construction inside create()
    HardwareEncoder(Key, FFmpegMuxer& muxer, const std::string& encoder)
        : FFmpegVideoEncoder(muxer, encoder, true) {
    }

    static Result<VideoEncoderBackendPtr> create(FFmpegMuxer& muxer,
                                                 const EncoderSettings& settings,
                                                 const std::string& encoder);
};

class SoftwareEncoder : public FFmpegVideoEncoder {
    struct Key {
        explicit Key() = default;
    };

public:
    SoftwareEncoder(Key, FFmpegMuxer& muxer, const std::string& codec)
        : FFmpegVideoEncoder(muxer, codec, false) {
    }

    static Result<VideoEncoderBackendPtr> create(FFmpegMuxer& muxer,
                                                 const EncoderSettings& settings);
};

} // namespace lf
