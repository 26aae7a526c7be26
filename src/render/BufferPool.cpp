#include "BufferPool.hpp"
#include "core/Logger.hpp"

namespace lf {

BufferPool::BufferPool(usize capacity, u32 width, u32 height, u32 pad)
    : capacity_(std::max<usize>(1, capacity)),
      width_(width),
      height_(height),
      pad_(pad) {
    free_.reserve(capacity_);
    for (usize i = 0; i < capacity_; ++i) {
        free_.push_back(std::make_unique<FrameBuffer>(width, height, pad));
    }
    LOG_DEBUG("BufferPool: {} buffers, canvas {}x{}",
              capacity_,
              width + 2 * pad,
              height + 2 * pad);
}

Result<FrameBufferPtr> BufferPool::acquire(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    if (stop.stop_requested()) {
        return Result<FrameBufferPtr>::err(ErrorKind::Cancelled,
                                           "Buffer acquire cancelled");
    }

    if (!cv_.wait(lock, stop, [this] { return !free_.empty(); })) {
        return Result<FrameBufferPtr>::err(ErrorKind::Cancelled,
                                           "Buffer acquire cancelled");
    }

    FrameBufferPtr buffer = std::move(free_.back());
    free_.pop_back();
    peak_ = std::max(peak_, capacity_ - free_.size());
    return Result<FrameBufferPtr>::ok(std::move(buffer));
}

void BufferPool::release(FrameBufferPtr buffer) {
    if (!buffer)
        return;

    if (buffer->frame.width() != static_cast<int>(width_) ||
        buffer->frame.height() != static_cast<int>(height_) ||
        buffer->pad != pad_) {
        LOG_ERROR("BufferPool: foreign buffer released, dropping it");
        return;
    }

    {
        std::lock_guard lock(mutex_);
        if (free_.size() >= capacity_) {
            LOG_ERROR("BufferPool: release beyond capacity, dropping buffer");
            return;
        }
        buffer->index = 0;
        buffer->timestamp = 0.0;
        free_.push_back(std::move(buffer));
    }
    cv_.notify_one();
}

usize BufferPool::available() const {
    std::lock_guard lock(mutex_);
    return free_.size();
}

usize BufferPool::outstanding() const {
    std::lock_guard lock(mutex_);
    return capacity_ - free_.size();
}

usize BufferPool::peakOutstanding() const {
    std::lock_guard lock(mutex_);
    return peak_;
}

} // namespace lf
