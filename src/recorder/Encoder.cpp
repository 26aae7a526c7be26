#include "Encoder.hpp"
#include "core/Logger.hpp"

namespace lf {

Encoder::Encoder(EncoderSettings settings,
                 u64 framesExpected,
                 EncoderBackendProvider& provider)
    : settings_(std::move(settings)), provider_(provider) {
    job_.framesExpected = framesExpected;
    job_.outputPath = settings_.outputPath;
}

Encoder::~Encoder() {
    if (!isTerminal(state()) && state() != JobState::Queued) {
        fail(Error(ErrorKind::Cancelled, "Encoder destroyed before finalize"));
    }
}

JobState Encoder::state() const {
    std::lock_guard lock(jobMutex_);
    return job_.state;
}

EncodingJob Encoder::snapshot() const {
    std::lock_guard lock(jobMutex_);
    return job_;
}

void Encoder::setState(JobState state) {
    {
        std::lock_guard lock(jobMutex_);
        if (job_.state == state)
            return;
        job_.state = state;
    }
    LOG_DEBUG("Encoder: state -> {}", jobStateName(state));
    stateChanged.emitSignal(state);
    emitProgress();
}

void Encoder::emitProgress() {
    ProgressEvent ev;
    {
        std::lock_guard lock(jobMutex_);
        ev = {job_.framesEncoded, job_.framesExpected, job_.state};
    }
    progress.emitSignal(ev);
}

Result<void> Encoder::failWith(Error error) {
    fail(error);
    return Result<void>::err(std::move(error));
}

void Encoder::fail(Error error) {
    {
        std::lock_guard lock(jobMutex_);
        if (isTerminal(job_.state))
            return;
        job_.lastError = error;
    }

    if (error.kind == ErrorKind::Cancelled) {
        LOG_INFO("Encoding cancelled after {} frames", snapshot().framesEncoded);
    } else {
        LOG_ERROR("Encoding failed: {}", error.describe());
    }

    backend_.reset();
    unacknowledged_.clear();
    if (outputOpen_) {
        provider_.abortOutput();
        outputOpen_ = false;
    }
    setState(JobState::Failed);
}

Result<void> Encoder::beginAnalysis() {
    if (state() != JobState::Queued) {
        return Result<void>::err(ErrorKind::InvalidArgument,
                                 "Encoder already started");
    }
    setState(JobState::Analyzing);

    if (auto valid = settings_.validate(); !valid)
        return failWith(valid.error());
    return Result<void>::ok();
}

Result<void> Encoder::beginRendering() {
    if (state() != JobState::Analyzing) {
        return Result<void>::err(ErrorKind::InvalidArgument,
                                 "Encoder is not analyzing");
    }

    if (auto opened = provider_.openOutput(settings_); !opened)
        return failWith(opened.error());
    outputOpen_ = true;

    if (auto backend = openBackend(); !backend)
        return failWith(backend.error());

    setState(JobState::Rendering);
    const auto job = snapshot();
    LOG_INFO("Encoding {} frames to {} with {}",
             job.framesExpected,
             settings_.outputPath.string(),
             job.activeBackend);
    return Result<void>::ok();
}

Result<void> Encoder::start() {
    if (auto r = beginAnalysis(); !r)
        return r;
    return beginRendering();
}

Result<void> Encoder::openBackend() {
    std::optional<std::string> hardware;
    if (settings_.preferHardware)
        hardware = provider_.detectHardware(settings_);

    if (hardware) {
        auto hw = provider_.createHardwareEncoder(settings_, *hardware);
        if (hw) {
            backend_ = std::move(hw).value();
        } else {
            LOG_WARN("Hardware encoder {} unavailable ({}), using software",
                     *hardware,
                     hw.error().message);
            std::lock_guard lock(jobMutex_);
            job_.fellBack = true;
        }
    } else if (settings_.preferHardware) {
        LOG_INFO("No hardware encoder found, using software");
    }

    if (!backend_) {
        auto sw = provider_.createSoftwareEncoder(settings_);
        if (!sw)
            return Result<void>::err(sw.error());
        backend_ = std::move(sw).value();
    }

    std::lock_guard lock(jobMutex_);
    job_.activeBackend = backend_->name();
    return Result<void>::ok();
}

void Encoder::retain(const QImage& frame, u64 index) {
    unacknowledged_.push_back({index, frame.copy()});
    trimRetained();
    if (unacknowledged_.size() > kMaxUnacknowledgedFrames)
        unacknowledged_.pop_front();
}

void Encoder::trimRetained() {
    const auto written = backend_->lastWrittenIndex();
    if (!written)
        return;
    while (!unacknowledged_.empty() && unacknowledged_.front().index <= *written)
        unacknowledged_.pop_front();
}

Result<void> Encoder::fallBack(const Error& cause, u64 index) {
    LOG_WARN("Hardware encoder {} failed at frame {}: {}. Falling back to "
             "software",
             backend_->name(),
             index,
             cause.message);

    // Packets still queued in the hardware encoder belong to earlier frames
    if (auto drained = backend_->flush(); !drained) {
        LOG_WARN("Could not drain hardware encoder: {}", drained.error().message);
    }

    const auto written = backend_->lastWrittenIndex();
    const u64 resume = written ? *written + 1 : 0;
    const std::string hardwareName = backend_->name();
    backend_.reset();

    std::erase_if(unacknowledged_,
                  [resume](const RetainedFrame& f) { return f.index < resume; });
    const bool recoverable =
            resume == index ||
            (!unacknowledged_.empty() && unacknowledged_.front().index == resume);
    if (!recoverable) {
        unacknowledged_.clear();
        return Result<void>::err(
                Error(ErrorKind::Encoding,
                      hardwareName + " lost frames " + std::to_string(resume) +
                              ".." + std::to_string(index - 1) +
                              " that can no longer be re-encoded (" +
                              cause.message + ")")
                        .atFrame(resume));
    }

    auto sw = provider_.createSoftwareEncoder(settings_);
    if (!sw) {
        return Result<void>::err(
                Error(ErrorKind::Encoding,
                      "Hardware encoding failed (" + cause.message +
                              ") and software fallback failed (" +
                              sw.error().message + ")")
                        .atFrame(index));
    }
    backend_ = std::move(sw).value();

    auto pending = std::move(unacknowledged_);
    unacknowledged_.clear();
    if (!pending.empty()) {
        LOG_INFO("Re-encoding frames {}..{} the hardware encoder never wrote",
                 pending.front().index,
                 pending.back().index);
    }
    for (const auto& retained : pending) {
        if (auto r = backend_->encode(retained.image, retained.index); !r) {
            return Result<void>::err(
                    Error(ErrorKind::Encoding,
                          "Software encoder failed after fallback: " +
                                  r.error().message)
                            .atFrame(retained.index));
        }
    }

    std::lock_guard lock(jobMutex_);
    job_.fellBack = true;
    job_.fallbackFrame = resume;
    job_.activeBackend = backend_->name();
    return Result<void>::ok();
}

Result<void> Encoder::submitFrame(const FrameBuffer& buffer) {
    if (state() != JobState::Rendering) {
        return Result<void>::err(
                Error(ErrorKind::InvalidArgument,
                      "Frame submitted while encoder is not rendering")
                        .atFrame(buffer.index));
    }
    if (buffer.index != nextIndex_) {
        return failWith(Error(ErrorKind::InvalidArgument,
                              "Out of order frame, expected " +
                                      std::to_string(nextIndex_))
                                .atFrame(buffer.index));
    }

    auto encoded = backend_->encode(buffer.frame, buffer.index);
    if (!encoded) {
        Error cause = encoded.error();
        const bool canFallBack =
                backend_->isHardware() && cause.recoverable && !snapshot().fellBack;
        if (!canFallBack) {
            cause.kind = ErrorKind::Encoding;
            return failWith(std::move(cause.atFrame(buffer.index)));
        }

        if (auto switched = fallBack(cause, buffer.index); !switched)
            return failWith(switched.error());

        encoded = backend_->encode(buffer.frame, buffer.index);
        if (!encoded) {
            return failWith(Error(ErrorKind::Encoding,
                                  "Software encoder failed after fallback: " +
                                          encoded.error().message)
                                    .atFrame(buffer.index));
        }
    }

    if (backend_->isHardware())
        retain(buffer.frame, buffer.index);

    ++nextIndex_;
    {
        std::lock_guard lock(jobMutex_);
        ++job_.framesEncoded;
    }
    emitProgress();
    return Result<void>::ok();
}

Result<void> Encoder::finalize() {
    if (state() != JobState::Rendering) {
        return Result<void>::err(ErrorKind::InvalidArgument,
                                 "Finalize called while not rendering");
    }

    const auto job = snapshot();
    if (job.framesEncoded != job.framesExpected) {
        return failWith(Error(ErrorKind::Encoding,
                              "Expected " + std::to_string(job.framesExpected) +
                                      " frames, encoded " +
                                      std::to_string(job.framesEncoded))
                                .atFrame(job.framesEncoded));
    }

    setState(JobState::Encoding);

    if (auto flushed = backend_->flush(); !flushed) {
        Error err = flushed.error();
        err.kind = ErrorKind::Encoding;
        return failWith(std::move(err));
    }
    backend_.reset();
    unacknowledged_.clear();

    if (auto done = provider_.finalizeOutput(); !done)
        return failWith(done.error());
    outputOpen_ = false;

    setState(JobState::Done);
    LOG_INFO("Encoding finished: {} frames, backend {}{}",
             job.framesEncoded,
             job.activeBackend,
             job.fellBack ? " (after fallback)" : "");
    return Result<void>::ok();
}

} // namespace lf
