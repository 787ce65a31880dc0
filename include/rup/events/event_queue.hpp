/**
 * @file event_queue.hpp
 * @brief Thread-safe FIFO used as the scheduler's command channel
 *
 * Producers (manager calls, worker threads reporting unit results, the
 * conflict negotiator) push; the single scheduling loop pops. pop_until()
 * lets the loop sleep until the next grace-period deadline.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace rup::events {

template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Push item to queue
     *
     * Items pushed after shutdown() are dropped.
     * @return false if the queue is shut down
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (shutdown_) {
                return false;
            }
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        return take_front();
    }

    /**
     * @brief Pop item (blocking)
     *
     * RETURNS: item, or nullopt once shut down and drained
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() {
            return !queue_.empty() || shutdown_;
        });
        return take_front();
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        return pop_until(std::chrono::steady_clock::now() + timeout);
    }

    /**
     * @brief Pop item, waiting at most until the given deadline
     *
     * RETURNS: nullopt on timeout or on shutdown with an empty queue
     */
    template<typename Clock, typename Duration>
    std::optional<T> pop_until(const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock lock(mutex_);
        cv_.wait_until(lock, deadline, [this]() {
            return !queue_.empty() || shutdown_;
        });
        return take_front();
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    bool is_shutdown() const {
        std::unique_lock lock(mutex_);
        return shutdown_;
    }

    /**
     * @brief Refuse new items and wake every waiting consumer
     *
     * Items already queued can still be popped.
     */
    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    void reset() {
        std::unique_lock lock(mutex_);
        shutdown_ = false;
    }

private:
    std::optional<T> take_front() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

} // namespace rup::events
