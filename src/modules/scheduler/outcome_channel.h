// modules/scheduler/outcome_channel.h
#ifndef BLOCKFLOW_MODULES_SCHEDULER_OUTCOME_CHANNEL_H
#define BLOCKFLOW_MODULES_SCHEDULER_OUTCOME_CHANNEL_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace blockflow {

// Many producers (workers), one consumer (the scheduler).
template <typename T>
class OutcomeChannel {
public:
    void send(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    // Waits up to `timeout`; nullopt if nothing arrived.
    std::optional<T> receive(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !queue_.empty(); })) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
};

} // namespace blockflow

#endif // BLOCKFLOW_MODULES_SCHEDULER_OUTCOME_CHANNEL_H
