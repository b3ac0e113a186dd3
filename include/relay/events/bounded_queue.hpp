/**
 * @file bounded_queue.hpp
 * @brief Thread-safe FIFO with a fixed capacity
 *
 * WHY THIS FILE EXISTS:
 * Progress events cross from upload workers to the single consumer that
 * edits the user's status message. The capacity keeps a slow consumer from
 * growing the queue without bound.
 *
 * EXAMPLE:
 * BoundedQueue<Event> queue(64);
 * queue.try_push(event);      // Producer, drops when full
 * auto event = queue.pop();   // Consumer (blocks until available)
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace relay::events {

/**
 * @brief Bounded multi-producer / multi-consumer queue
 *
 * THREAD SAFETY:
 * - Multiple producers and consumers may run concurrently
 * - shutdown() wakes every blocked producer and consumer
 */
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    // Non-copyable
    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Push, waiting while the queue is full
     *
     * RETURNS: false if the queue was shut down before room appeared
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            not_full_.wait(lock, [this]() {
                return queue_.size() < capacity_ || shutdown_;
            });
            if (shutdown_) {
                return false;
            }
            queue_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Push without waiting
     *
     * RETURNS: false when full or shut down; the item is dropped
     */
    bool try_push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (shutdown_ || queue_.size() >= capacity_) {
                return false;
            }
            queue_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::optional<T> item;
        {
            std::unique_lock lock(mutex_);
            if (queue_.empty()) {
                return std::nullopt;
            }
            item = std::move(queue_.front());
            queue_.pop_front();
        }
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Pop, waiting until an item arrives
     *
     * RETURNS: nullopt once shut down and drained
     */
    std::optional<T> pop() {
        std::optional<T> item;
        {
            std::unique_lock lock(mutex_);
            not_empty_.wait(lock, [this]() {
                return !queue_.empty() || shutdown_;
            });
            if (queue_.empty()) {
                return std::nullopt;
            }
            item = std::move(queue_.front());
            queue_.pop_front();
        }
        not_full_.notify_one();
        return item;
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::optional<T> item;
        {
            std::unique_lock lock(mutex_);
            if (!not_empty_.wait_for(lock, timeout, [this]() {
                return !queue_.empty() || shutdown_;
            })) {
                return std::nullopt;  // Timeout
            }
            if (queue_.empty()) {
                return std::nullopt;
            }
            item = std::move(queue_.front());
            queue_.pop_front();
        }
        not_full_.notify_one();
        return item;
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    std::size_t capacity() const noexcept { return capacity_; }

    /**
     * @brief Stop accepting items; consumers drain what is left
     */
    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_shutdown() const {
        std::unique_lock lock(mutex_);
        return shutdown_;
    }

private:
    const std::size_t capacity_;
    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool shutdown_ = false;
};

} // namespace relay::events
