#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace ferry::concurrency {

// Multi-producer queue drained by a single consumer. Once closed, pushes are
// dropped and pops return whatever is still queued, then nullopt.
template <typename T>
class BlockingQueue {
public:
    bool push(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return false;
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> popFor(const std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); })) return std::nullopt;
        if (queue_.empty()) return std::nullopt;

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<T> queue_;
    bool closed_{false};
};

}
