/**
 * @file VideoEncoderBackend.hpp
 * @brief Seams between the Encoder state machine and FFmpeg.
 *
 * VideoEncoderBackend is one open video encoder, hardware or software.
 * EncoderBackendProvider owns the output file and hands out backends; the
 * Encoder only ever talks to these two interfaces, which lets tests drive
 * fallback and failure paths without touching FFmpeg.
 */

#pragma once
#include <QImage>
#include <memory>
#include <optional>
#include <string>
#include "EncoderSettings.hpp"
#include "util/Result.hpp"

namespace lf {

class VideoEncoderBackend {
public:
    virtual ~VideoEncoderBackend() = default;

    virtual std::string name() const = 0;
    virtual bool isHardware() const = 0;

    // frame is RGBA8888 at output size. Hardware errors come back marked
    // recoverable so the caller can fall back.
    virtual Result<void> encode(const QImage& frame, u64 index) = 0;

    // Drains delayed packets into the output
    virtual Result<void> flush() = 0;

    // Highest frame index whose packet reached the output. Encoders with
    // pipeline delay lag behind the last index passed to encode().
    virtual std::optional<u64> lastWrittenIndex() const = 0;
};

using VideoEncoderBackendPtr = std::unique_ptr<VideoEncoderBackend>;

class EncoderBackendProvider {
public:
    virtual ~EncoderBackendProvider() = default;

    virtual Result<void> openOutput(const EncoderSettings& settings) = 0;

    // Name of a usable hardware encoder, if any
    virtual std::optional<std::string> detectHardware(
            const EncoderSettings& settings) = 0;

    virtual Result<VideoEncoderBackendPtr> createHardwareEncoder(
            const EncoderSettings& settings, const std::string& encoder) = 0;
    virtual Result<VideoEncoderBackendPtr> createSoftwareEncoder(
            const EncoderSettings& settings) = 0;

    // Remaining audio, trailer, close
    virtual Result<void> finalizeOutput() = 0;

    // Close and remove a partial output
    virtual void abortOutput() = 0;
};

} // namespace lf
