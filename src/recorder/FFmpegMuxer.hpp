/**
 * @file FFmpegMuxer.hpp
 * @brief Output container shared by every video encoder of a job.
 *
 * The audio track is encoded up front and queued here; each video packet
 * write first flushes the queued audio packets that precede it, so the
 * interleaver never has to hold more than a few packets.
 *
 * Video packets keep pts = frame index in the codec time base, which is
 * what allows a second encoder to continue the same stream after a
 * fallback.
 *
 * @section Dependencies
 * - FFmpeg (libavformat)
 */

#pragma once
#include <deque>
#include <filesystem>
#include <mutex>
#include "FFmpegUtils.hpp"
#include "util/Result.hpp"

namespace lf {

class FFmpegMuxer {
public:
    FFmpegMuxer() = default;
    ~FFmpegMuxer();

    FFmpegMuxer(const FFmpegMuxer&) = delete;
    FFmpegMuxer& operator=(const FFmpegMuxer&) = delete;

    Result<void> open(const std::filesystem::path& path,
                      const std::string& container);
    bool wantsGlobalHeader() const;

    Result<void> addVideoStream(const AVCodecContext* codec);
    Result<void> addAudioStream(const AVCodecContext* codec,
                                std::deque<AVPacketPtr> packets);
    Result<void> writeHeader();

    bool isOpen() const {
        return ctx_ != nullptr;
    }
    bool headerWritten() const {
        return headerWritten_;
    }
    bool hasAudio() const {
        return audioStream_ != nullptr;
    }

    // Takes the packet's payload; pts/dts are in codecTimeBase
    Result<void> writeVideo(AVPacket* packet, AVRational codecTimeBase);

    // Remaining audio, trailer, close
    Result<void> finish();

    // Close without a trailer and delete the partial file
    void abort();

    u64 bytesWritten() const {
        return bytesWritten_;
    }

private:
    Result<void> writeAudioUntil(f64 seconds);
    Result<void> write(AVPacket* packet, AVRational from, AVStream* stream);

    AVFormatContextPtr ctx_;
    std::filesystem::path path_;
    AVStream* videoStream_{nullptr};
    AVStream* audioStream_{nullptr};
    AVRational audioTimeBase_{1, 48000};
    std::deque<AVPacketPtr> audioQueue_;
    bool headerWritten_{false};
    u64 bytesWritten_{0};

    std::mutex mutex_;
};

} // namespace lf
