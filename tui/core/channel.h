#ifndef DRIVE_TUI_CORE_CHANNEL_H
#define DRIVE_TUI_CORE_CHANNEL_H

#include <cstddef>
#include <deque>
#include <mutex>

namespace drive {

// Single-producer/single-consumer queue of progress snapshots. The
// transfer thread produces, the UI thread drains once per tick.
template <typename T>
class Channel {
public:
    Channel() = default;

    // Adds a snapshot to the back of the queue
    void produce(const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(value);
    }

    // Retrieves and removes the oldest snapshot
    bool consume(T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return false;
        }
        value = queue_.front();
        queue_.pop_front();
        return true;
    }

    // Empties the queue keeping only the most recent snapshot in `value`.
    // Returns false if nothing was queued.
    bool drainLatest(T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return false;
        }
        value = queue_.back();
        queue_.clear();
        return true;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<T> queue_;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
};

}  // namespace drive

#endif  // DRIVE_TUI_CORE_CHANNEL_H
