/**
 * @file Encoder.hpp
 * @brief Encoding job state machine with hardware-to-software fallback.
 *
 * The Encoder owns the EncodingJob record and drives it through
 * Queued -> Analyzing -> Rendering -> Encoding -> Done, or Failed. Frames
 * must arrive with consecutive indices starting at 0. A recoverable error
 * from a hardware backend, or a hardware backend that cannot be opened,
 * switches to the software backend exactly once. Frames the hardware
 * backend accepted but never wrote are re-submitted to software together
 * with the failing frame; frames already written are not encoded again.
 * If those frames can no longer be recovered the job fails.
 *
 * All methods except snapshot() run on the single consumer thread.
 *
 * @section Patterns
 * - State Machine
 * - Strategy: VideoEncoderBackend chosen by a capability check
 */

#pragma once
#include <QImage>
#include <deque>
#include <mutex>
#include "EncodingJob.hpp"
#include "VideoEncoderBackend.hpp"
#include "render/FrameBuffer.hpp"
#include "util/Signal.hpp"

namespace lf {

class Encoder {
public:
    // Frames kept for re-submission while a hardware backend holds them
    static constexpr usize kMaxUnacknowledgedFrames = 16;

    Encoder(EncoderSettings settings,
            u64 framesExpected,
            EncoderBackendProvider& provider);
    ~Encoder();

    Encoder(const Encoder&) = delete;
    Encoder& operator=(const Encoder&) = delete;

    // Queued -> Analyzing -> Rendering
    Result<void> start();

    // Analyzing only; lets the caller run its own checks before frames flow
    Result<void> beginAnalysis();
    Result<void> beginRendering();

    Result<void> submitFrame(const FrameBuffer& buffer);

    // Rendering -> Encoding -> Done
    Result<void> finalize();

    // Any non-terminal state -> Failed
    void fail(Error error);

    EncodingJob snapshot() const;
    JobState state() const;
    const EncoderSettings& settings() const {
        return settings_;
    }

    Signal<ProgressEvent> progress;
    Signal<JobState> stateChanged;

private:
    void setState(JobState state);
    void emitProgress();
    Result<void> openBackend();
    Result<void> fallBack(const Error& cause, u64 index);
    void retain(const QImage& frame, u64 index);
    void trimRetained();
    Result<void> failWith(Error error);

    EncoderSettings settings_;
    EncoderBackendProvider& provider_;
    VideoEncoderBackendPtr backend_;
    bool outputOpen_{false};
    u64 nextIndex_{0};

    struct RetainedFrame {
        u64 index;
        QImage image;
    };
    std::deque<RetainedFrame> unacknowledged_;

    mutable std::mutex jobMutex_;
    EncodingJob job_;
};

} // namespace lf
