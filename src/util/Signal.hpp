#pragma once
// Signal.hpp - Minimal thread-safe signal/slot for non-Qt components
// Slots run on the emitting thread

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace lf {

template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using ConnectionId = std::size_t;

    ConnectionId connect(Slot slot) {
        std::lock_guard lock(mutex_);
        slots_.emplace_back(nextId_, std::move(slot));
        return nextId_++;
    }

    void disconnect(ConnectionId id) {
        std::lock_guard lock(mutex_);
        std::erase_if(slots_, [id](const auto& s) { return s.first == id; });
    }

    void disconnectAll() {
        std::lock_guard lock(mutex_);
        slots_.clear();
    }

    void emitSignal(Args... args) const {
        std::vector<std::pair<ConnectionId, Slot>> copy;
        {
            std::lock_guard lock(mutex_);
            copy = slots_;
        }
        for (const auto& [id, slot] : copy) {
            slot(args...);
        }
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<ConnectionId, Slot>> slots_;
    ConnectionId nextId_{0};
};

} // namespace lf
