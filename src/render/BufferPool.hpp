/**
 * @file BufferPool.hpp
 * @brief Bounded pool of reusable frame buffers.
 *
 * All buffers are allocated up front. acquire() blocks while the pool is
 * empty, which is what throttles the render workers when the encoder falls
 * behind; a stop request makes it fail fast with Cancelled.
 *
 * @section Patterns
 * - Object Pool
 * - Backpressure via blocking acquire
 */

#pragma once
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <vector>
#include "FrameBuffer.hpp"
#include "util/Result.hpp"

namespace lf {

class BufferPool {
public:
    BufferPool(usize capacity, u32 width, u32 height, u32 pad);

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    Result<FrameBufferPtr> acquire(std::stop_token stop = {});
    void release(FrameBufferPtr buffer);

    usize capacity() const {
        return capacity_;
    }
    usize available() const;
    usize outstanding() const;
    usize peakOutstanding() const;

private:
    usize capacity_;
    u32 width_;
    u32 height_;
    u32 pad_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::vector<FrameBufferPtr> free_;
    usize peak_{0};
};

} // namespace lf
