#include "FFmpegMuxer.hpp"
#include <limits>
#include "core/Logger.hpp"

namespace lf {

FFmpegMuxer::~FFmpegMuxer() {
    if (ctx_)
        abort();
}

Result<void> FFmpegMuxer::open(const std::filesystem::path& path,
                               const std::string& container) {
    std::lock_guard lock(mutex_);
    path_ = path;

    AVFormatContext* ctx = nullptr;
    int ret = avformat_alloc_output_context2(
            &ctx, nullptr, container.c_str(), path.c_str());
    ctx_.reset(ctx);
    if (ret < 0 || !ctx_) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Failed to create output context: " +
                                         ffmpegError(ret));
    }

    if (!(ctx_->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(&ctx_->pb, path.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0) {
            ctx_.reset();
            return Result<void>::err(ErrorKind::Io,
                                     "Failed to open output file: " +
                                             ffmpegError(ret));
        }
    }
    return Result<void>::ok();
}

bool FFmpegMuxer::wantsGlobalHeader() const {
    return ctx_ && (ctx_->oformat->flags & AVFMT_GLOBALHEADER);
}

Result<void> FFmpegMuxer::addVideoStream(const AVCodecContext* codec) {
    std::lock_guard lock(mutex_);
    if (!ctx_ || headerWritten_ || videoStream_) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Video stream cannot be added now");
    }

    videoStream_ = avformat_new_stream(ctx_.get(), nullptr);
    if (!videoStream_) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Failed to create video stream");
    }
    avcodec_parameters_from_context(videoStream_->codecpar, codec);
    videoStream_->time_base = codec->time_base;
    videoStream_->avg_frame_rate = codec->framerate;
    return Result<void>::ok();
}

Result<void> FFmpegMuxer::addAudioStream(const AVCodecContext* codec,
                                         std::deque<AVPacketPtr> packets) {
    std::lock_guard lock(mutex_);
    if (!ctx_ || headerWritten_ || audioStream_) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Audio stream cannot be added now");
    }

    audioStream_ = avformat_new_stream(ctx_.get(), nullptr);
    if (!audioStream_) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Failed to create audio stream");
    }
    avcodec_parameters_from_context(audioStream_->codecpar, codec);
    audioStream_->time_base = codec->time_base;
    audioTimeBase_ = codec->time_base;
    audioQueue_ = std::move(packets);
    return Result<void>::ok();
}

Result<void> FFmpegMuxer::writeHeader() {
    std::lock_guard lock(mutex_);
    if (!ctx_ || !videoStream_) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Header needs a video stream");
    }

    AVDictionary* opts = nullptr;
    if (std::string(ctx_->oformat->name).find("mp4") != std::string::npos)
        av_dict_set(&opts, "movflags", "+faststart", 0);
    int ret = avformat_write_header(ctx_.get(), &opts);
    av_dict_free(&opts);
    if (ret < 0) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Failed to write header: " + ffmpegError(ret));
    }
    headerWritten_ = true;
    LOG_DEBUG("Muxer: header written to {} ({} audio packets queued)",
              path_.string(),
              audioQueue_.size());
    return Result<void>::ok();
}

Result<void> FFmpegMuxer::write(AVPacket* packet,
                                AVRational from,
                                AVStream* stream) {
    av_packet_rescale_ts(packet, from, stream->time_base);
    packet->stream_index = stream->index;
    const int size = packet->size;

    int ret = av_interleaved_write_frame(ctx_.get(), packet);
    if (ret < 0) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Failed to write packet: " + ffmpegError(ret));
    }
    bytesWritten_ += static_cast<u64>(size);
    return Result<void>::ok();
}

Result<void> FFmpegMuxer::writeAudioUntil(f64 seconds) {
    while (!audioQueue_.empty()) {
        AVPacket* pkt = audioQueue_.front().get();
        if (pkt->pts != AV_NOPTS_VALUE &&
            pkt->pts * av_q2d(audioTimeBase_) > seconds)
            break;
        if (auto r = write(pkt, audioTimeBase_, audioStream_); !r)
            return r;
        audioQueue_.pop_front();
    }
    return Result<void>::ok();
}

Result<void> FFmpegMuxer::writeVideo(AVPacket* packet,
                                     AVRational codecTimeBase) {
    std::lock_guard lock(mutex_);
    if (!headerWritten_) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Packet written before header");
    }

    if (audioStream_) {
        const i64 ts = packet->dts != AV_NOPTS_VALUE ? packet->dts : packet->pts;
        if (auto r = writeAudioUntil(ts * av_q2d(codecTimeBase)); !r)
            return r;
    }
    return write(packet, codecTimeBase, videoStream_);
}

Result<void> FFmpegMuxer::finish() {
    std::lock_guard lock(mutex_);
    if (!ctx_ || !headerWritten_) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Output was never started");
    }

    if (audioStream_) {
        if (auto r = writeAudioUntil(std::numeric_limits<f64>::max()); !r)
            return r;
    }

    int ret = av_write_trailer(ctx_.get());
    ctx_.reset();
    headerWritten_ = false;
    videoStream_ = nullptr;
    audioStream_ = nullptr;
    if (ret < 0) {
        return Result<void>::err(ErrorKind::Encoding,
                                 "Failed to write trailer: " + ffmpegError(ret));
    }
    LOG_DEBUG("Muxer: finished {} ({} bytes)", path_.string(), bytesWritten_);
    return Result<void>::ok();
}

void FFmpegMuxer::abort() {
    std::lock_guard lock(mutex_);
    if (!ctx_)
        return;
    ctx_.reset();
    audioQueue_.clear();
    headerWritten_ = false;
    videoStream_ = nullptr;
    audioStream_ = nullptr;

    std::error_code ec;
    if (std::filesystem::remove(path_, ec)) {
        LOG_DEBUG("Muxer: removed partial output {}", path_.string());
    }
}

} // namespace lf
