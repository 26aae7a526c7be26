#pragma once
// ReorderBuffer.hpp - Holds early frames until their predecessors are emitted
// The window [next, next + capacity) bounds how far ahead workers may render

#include <condition_variable>
#include <map>
#include <mutex>
#include <stop_token>
#include <vector>
#include "FrameBuffer.hpp"
#include "util/Result.hpp"

namespace lf {

class ReorderBuffer {
public:
    explicit ReorderBuffer(usize capacity, u64 firstIndex = 0);

    // Blocks until index < next + capacity; false when stopped
    bool waitForSlot(u64 index, std::stop_token stop);

    // Rejects duplicates and indices outside the window
    Result<void> push(FrameBufferPtr buffer);

    // Blocks until the frame at next() is present and hands it out.
    // next() only moves on advance(), so the slot stays taken until the
    // consumer is done with the buffer. nullptr when stopped.
    FrameBufferPtr pop(std::stop_token stop);
    void advance();

    // Remaining buffers, for returning them to the pool after a stop
    std::vector<FrameBufferPtr> drain();

    u64 next() const;
    usize pending() const;
    usize capacity() const {
        return capacity_;
    }

private:
    usize capacity_;
    u64 next_;
    bool popped_{false};
    std::map<u64, FrameBufferPtr> frames_;

    mutable std::mutex mutex_;
    std::condition_variable_any slotCv_;
    std::condition_variable_any readyCv_;
};

} // namespace lf
