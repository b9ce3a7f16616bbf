#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace termdock {

// Multi-producer queue drained by a single owner thread. Producers are the
// process host I/O threads; the owner is whoever calls InstancePool::process_events.
template<typename T>
class EventQueue {
public:
    void push(T event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(event));
        }
        cv_.notify_one();
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T event = std::move(queue_.front());
        queue_.pop_front();
        return event;
    }

    template<typename Rep, typename Period>
    std::optional<T> wait_pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
            return std::nullopt;
        }
        T event = std::move(queue_.front());
        queue_.pop_front();
        return event;
    }

    // Takes everything queued so far in one lock acquisition.
    std::vector<T> drain() {
        std::deque<T> taken;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            taken.swap(queue_);
        }
        return std::vector<T>(std::make_move_iterator(taken.begin()),
                              std::make_move_iterator(taken.end()));
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
};

}
