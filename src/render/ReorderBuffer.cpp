#include "ReorderBuffer.hpp"

namespace lf {

ReorderBuffer::ReorderBuffer(usize capacity, u64 firstIndex)
    : capacity_(std::max<usize>(1, capacity)), next_(firstIndex) {
}

bool ReorderBuffer::waitForSlot(u64 index, std::stop_token stop) {
    std::unique_lock lock(mutex_);
    return slotCv_.wait(
            lock, stop, [&] { return index < next_ + capacity_; });
}

Result<void> ReorderBuffer::push(FrameBufferPtr buffer) {
    if (!buffer)
        return Result<void>::err(ErrorKind::InvalidArgument, "Null frame buffer");

    const u64 index = buffer->index;
    {
        std::lock_guard lock(mutex_);
        if (index < next_ || (index == next_ && popped_)) {
            return Result<void>::err(
                    Error(ErrorKind::InvalidArgument,
                          "Frame already emitted").atFrame(index));
        }
        if (index >= next_ + capacity_) {
            return Result<void>::err(
                    Error(ErrorKind::InvalidArgument,
                          "Frame outside reorder window").atFrame(index));
        }
        if (frames_.contains(index)) {
            return Result<void>::err(
                    Error(ErrorKind::InvalidArgument,
                          "Duplicate frame").atFrame(index));
        }
        frames_.emplace(index, std::move(buffer));
    }
    readyCv_.notify_all();
    return Result<void>::ok();
}

FrameBufferPtr ReorderBuffer::pop(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    bool ready = readyCv_.wait(lock, stop, [this] {
        return !popped_ && frames_.contains(next_);
    });
    if (!ready)
        return nullptr;

    auto node = frames_.extract(next_);
    popped_ = true;
    return std::move(node.mapped());
}

void ReorderBuffer::advance() {
    {
        std::lock_guard lock(mutex_);
        ++next_;
        popped_ = false;
    }
    slotCv_.notify_all();
    readyCv_.notify_all();
}

std::vector<FrameBufferPtr> ReorderBuffer::drain() {
    std::lock_guard lock(mutex_);
    std::vector<FrameBufferPtr> out;
    out.reserve(frames_.size());
    for (auto& [index, buffer] : frames_)
        out.push_back(std::move(buffer));
    frames_.clear();
    return out;
}

u64 ReorderBuffer::next() const {
    std::lock_guard lock(mutex_);
    return next_;
}

usize ReorderBuffer::pending() const {
    std::lock_guard lock(mutex_);
    return frames_.size();
}

} // namespace lf
