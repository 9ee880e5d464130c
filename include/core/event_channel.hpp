#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace voicestream {
namespace core {

/**
 * Unbounded thread-safe FIFO with blocking receive. Producers never block.
 * After shutdown() no new items are accepted; queued items can still be drained.
 */
template <typename T>
class EventChannel {
public:
    EventChannel() = default;
    ~EventChannel() { shutdown(); }

    // Non-copyable, non-movable
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /**
     * Add an item. Returns false when the channel is shut down.
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) {
                return false;
            }
            queue_.push_back(std::move(item));
        }
        condition_.notify_one();
        return true;
    }

    /**
     * Wait for the next item. Returns false once the channel is shut down
     * and empty.
     */
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait(lock, [this] { return !queue_.empty() || shutdown_; });
        return takeFront(out);
    }

    template <class Rep, class Period>
    bool popFor(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait_for(lock, timeout, [this] { return !queue_.empty() || shutdown_; });
        return takeFront(out);
    }

    bool tryPop(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        return takeFront(out);
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        condition_.notify_all();
    }

    bool isShuttingDown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

private:
    bool takeFront(T& out) {
        if (queue_.empty()) {
            return false;
        }
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<T> queue_;
    bool shutdown_ = false;
};

} // namespace core
} // namespace voicestream
