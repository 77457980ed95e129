#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace livescribe {

// Thread-safe FIFO handing items from one thread to another.
// Producers never block: push() fails when the queue is at capacity and the
// caller decides whether that is worth a warning. capacity == 0 means unbounded.
template <typename T>
class MessageQueue {
public:
    explicit MessageQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (capacity_ != 0 && items_.size() >= capacity_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    // Waits up to `timeout` for an item. Returns false on timeout.
    template <typename Rep, typename Period>
    bool pop_for(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !items_.empty(); })) {
            return false;
        }
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    bool try_pop(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) return false;
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    // Discards everything queued; returns how many items were dropped.
    std::size_t clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::size_t n = items_.size();
        items_.clear();
        return n;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }
    std::size_t capacity() const { return capacity_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    std::size_t capacity_;
};

} // namespace livescribe
