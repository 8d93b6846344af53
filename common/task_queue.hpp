#pragma once

// ============================================================
// task_queue.hpp -- Blocking multi-consumer queue with
//   acknowledgement counting (join waits until every item
//   that was put has been marked done)
// ============================================================

#include <queue>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <cstddef>

template<typename T>
class TaskQueue {
public:
    TaskQueue() = default;

    void put(T item) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            queue_.push(std::move(item));
            ++unfinished_;
        }
        cv_.notify_one();
    }

    // Blocks until an item is available
    T get() {
        std::unique_lock<std::mutex> lk(mutex_);
        cv_.wait(lk, [this] { return !queue_.empty(); });
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    // Acknowledge one item obtained from get()
    void task_done() {
        std::lock_guard<std::mutex> lk(mutex_);
        if (unfinished_ == 0) {
            throw std::logic_error("TaskQueue::task_done() called too many times");
        }
        if (--unfinished_ == 0) {
            done_cv_.notify_all();
        }
    }

    // Blocks until every item put so far has been acknowledged
    void join() {
        std::unique_lock<std::mutex> lk(mutex_);
        done_cv_.wait(lk, [this] { return unfinished_ == 0; });
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return queue_.size();
    }

    size_t unfinished() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return unfinished_;
    }

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

private:
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::condition_variable done_cv_;
    std::queue<T>           queue_;
    size_t                  unfinished_{0};
};
