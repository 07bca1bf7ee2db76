#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace orca {

/**
 * @brief Blocking FIFO feeding one evaluation shard or the action workers
 *
 * Any number of producers may push. After close() pushes are refused and
 * consumers drain what is left before pop() returns nullopt, so a stopping
 * service still evaluates every event it accepted.
 */
template<typename T>
class WorkQueue {
public:
    WorkQueue() = default;

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    // False once the queue is closed; the item is dropped
    bool push(T item) {
        std::unique_lock lock(mutex_);
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        lock.unlock();
        ready_.notify_one();
        return true;
    }

    // Blocks until an item arrives; nullopt when closed and drained
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this]() { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        return item;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace orca
