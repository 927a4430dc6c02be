#pragma once

#include <deque>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <stop_token>

namespace emp {

/*
 * Blocking multi-producer, multi-consumer FIFO.
 * The reactor pushes, workers pop.
 */
template <typename T>
class WorkQueue {
public:
    void push_back(T task) {
        {
            std::lock_guard lock(mutex_);
            queue_.push_back(std::move(task));
        }
        cv_.notify_one();
    }

    // Blocks until an item is available.
    // Returns std::nullopt once stop is requested.
    std::optional<T> wait_and_pop_front(std::stop_token stop_token) {
        std::unique_lock lock(mutex_);
        bool ready = cv_.wait(lock, stop_token, [this]() {
            return !queue_.empty();
        });

        if (!ready)
            return std::nullopt;

        T task = std::move(queue_.front());
        queue_.pop_front();
        return task;
    }

    bool empty() const {
        std::lock_guard lock(mutex_);
        return queue_.empty();
    }

private:
    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

} // namespace emp
