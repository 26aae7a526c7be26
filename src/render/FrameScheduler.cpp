#include "FrameScheduler.hpp"
#include <thread>
#include "core/Logger.hpp"

namespace lf {

FrameScheduler::FrameScheduler(SchedulerConfig config, BufferPool& pool)
    : config_(config), pool_(pool) {
    workers_ = config_.workers;
    if (workers_ == 0) {
        workers_ = std::max(1u, std::thread::hardware_concurrency());
    }
    window_ = std::min<usize>(std::max(1u, config_.reorderCapacity),
                              pool_.capacity());
}

void FrameScheduler::recordError(Error error, std::stop_source& jobStop) {
    {
        std::lock_guard lock(errorMutex_);
        if (!firstError_) {
            LOG_ERROR("FrameScheduler: {}", error.describe());
            firstError_ = std::move(error);
        }
    }
    jobStop.request_stop();
}

void FrameScheduler::workerLoop(FrameRange range,
                                const RenderFn& render,
                                ReorderBuffer& reorder,
                                std::stop_source& jobStop) {
    auto stop = jobStop.get_token();
    const u32 maxAttempts = std::max(1u, config_.maxRenderAttempts);
    const auto timeout = Duration(config_.frameTimeoutMs);

    while (!stop.stop_requested()) {
        const u64 index = nextClaim_.fetch_add(1);
        if (index >= range.end())
            break;

        if (!reorder.waitForSlot(index, stop))
            break;

        for (u32 attempt = 1; attempt <= maxAttempts; ++attempt) {
            if (stop.stop_requested())
                return;

            RenderAttempt ctx{attempt, Clock::now() + timeout, stop};
            auto result = render(index, ctx);
            if (result) {
                FrameBufferPtr buffer = std::move(result).value();
                buffer->index = index;
                if (auto pushed = reorder.push(std::move(buffer)); !pushed) {
                    recordError(pushed.error(), jobStop);
                    return;
                }
                break;
            }

            Error err = result.error();
            // A renderer may report Cancelled on its own; without a stop
            // request that frame would never arrive, so it fails the run
            if (err.kind == ErrorKind::Cancelled && stop.stop_requested())
                return;

            if (err.kind == ErrorKind::FrameRenderTimeout &&
                attempt < maxAttempts) {
                ++retries_;
                LOG_WARN("Frame {} timed out (attempt {}/{}), retrying",
                         index,
                         attempt,
                         maxAttempts);
                continue;
            }

            recordError(std::move(err.atFrame(index)), jobStop);
            return;
        }
    }
}

Result<void> FrameScheduler::run(FrameRange range,
                                 const RenderFn& render,
                                 const ConsumeFn& consume,
                                 std::stop_token stop) {
    if (range.count == 0)
        return Result<void>::ok();

    {
        std::lock_guard lock(errorMutex_);
        firstError_.reset();
    }
    nextClaim_ = range.first;
    retries_ = 0;

    std::stop_source jobStop;
    std::stop_callback forward(stop, [&jobStop] { jobStop.request_stop(); });

    ReorderBuffer reorder(window_, range.first);
    const auto workerCount =
            static_cast<u32>(std::min<u64>(workers_, range.count));

    LOG_DEBUG("FrameScheduler: {} frames from {}, {} workers, window {}",
              range.count,
              range.first,
              workerCount,
              window_);

    {
        std::vector<std::jthread> threads;
        threads.reserve(workerCount);
        for (u32 i = 0; i < workerCount; ++i) {
            threads.emplace_back([&, this] {
                workerLoop(range, render, reorder, jobStop);
            });
        }

        auto token = jobStop.get_token();
        for (u64 index = range.first; index < range.end(); ++index) {
            FrameBufferPtr buffer = reorder.pop(token);
            if (!buffer)
                break;

            auto consumed = consume(*buffer);
            pool_.release(std::move(buffer));
            reorder.advance();

            if (!consumed) {
                recordError(std::move(consumed.error().atFrame(index)), jobStop);
                break;
            }
        }

        // Wake anything still blocked in acquire/waitForSlot
        jobStop.request_stop();
    }

    for (auto& leftover : reorder.drain())
        pool_.release(std::move(leftover));

    std::lock_guard lock(errorMutex_);
    if (firstError_)
        return Result<void>::err(*firstError_);
    if (stop.stop_requested()) {
        return Result<void>::err(ErrorKind::Cancelled, "Render cancelled");
    }
    return Result<void>::ok();
}

} // namespace lf
