#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>

namespace livegate {

/**
 * @brief Bounded single-consumer queue that serializes delivery into a session
 *
 * The capture side pushes from its own thread; the session thread pops in FIFO
 * order. Nothing is dropped: push() waits for space. After close() the consumer
 * still drains what is queued, then pop() returns nullopt.
 */
template<typename T>
class AsyncQueue {
public:
    explicit AsyncQueue(size_t max_size = 100) : max_size_(max_size) {}

    // Blocking push; false if the queue was closed
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return queue_.size() < max_size_ || closed_; });
        if (closed_) {
            rejected_++;
            return false;
        }
        queue_.push(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Blocking pop with timeout; nullopt on timeout or once closed and drained
    std::optional<T> pop(int timeout_ms = 100) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                 [this] { return !queue_.empty() || closed_; })) {
            return std::nullopt;
        }
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        not_full_.notify_one();
        return item;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_drained() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && queue_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    uint64_t rejected_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rejected_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::queue<T> queue_;
    size_t max_size_;
    bool closed_ = false;
    uint64_t rejected_ = 0;
};

} // namespace livegate
