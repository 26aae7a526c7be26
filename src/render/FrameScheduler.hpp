/**
 * @file FrameScheduler.hpp
 * @brief Parallel frame production with in-order delivery.
 *
 * A fixed set of workers claims frame indices in increasing order, renders
 * them into pooled buffers and parks the results in a ReorderBuffer. The
 * calling thread is the single consumer: it receives frames strictly in
 * index order, with no gaps and no duplicates, and the scheduler returns
 * each buffer to the pool once the consumer is done with it.
 *
 * A worker may only start frame i once i < next + window, where window is
 * min(reorderCapacity, poolSize). Claimed but unconsumed frames therefore
 * never exceed the pool size, so the worker holding the oldest frame can
 * always get a buffer.
 *
 * Timed-out frames are retried up to maxRenderAttempts. Any other failure,
 * or exhausting the retries, stops the run and is reported with the frame
 * index.
 *
 * @section Patterns
 * - Producer-Consumer with bounded window
 * - Cooperative cancellation via std::stop_token
 */

#pragma once
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include "BufferPool.hpp"
#include "ReorderBuffer.hpp"
#include "core/ConfigData.hpp"

namespace lf {

struct FrameRange {
    u64 first{0};
    u64 count{0};

    u64 end() const {
        return first + count;
    }
};

struct RenderAttempt {
    u32 attempt{1};
    TimePoint deadline;
    std::stop_token stop;
};

class FrameScheduler {
public:
    using RenderFn =
            std::function<Result<FrameBufferPtr>(u64 index, const RenderAttempt&)>;
    using ConsumeFn = std::function<Result<void>(const FrameBuffer& frame)>;

    FrameScheduler(SchedulerConfig config, BufferPool& pool);

    Result<void> run(FrameRange range,
                     const RenderFn& render,
                     const ConsumeFn& consume,
                     std::stop_token stop = {});

    u32 workerCount() const {
        return workers_;
    }
    usize window() const {
        return window_;
    }
    u64 retries() const {
        return retries_.load();
    }

private:
    void workerLoop(FrameRange range,
                    const RenderFn& render,
                    ReorderBuffer& reorder,
                    std::stop_source& jobStop);
    void recordError(Error error, std::stop_source& jobStop);

    SchedulerConfig config_;
    BufferPool& pool_;
    u32 workers_;
    usize window_;

    std::atomic<u64> nextClaim_{0};
    std::atomic<u64> retries_{0};
    std::mutex errorMutex_;
    std::optional<Error> firstError_;
};

} // namespace lf
