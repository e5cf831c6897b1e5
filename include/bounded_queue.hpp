#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

/**
 * @file bounded_queue.hpp
 * @brief Fixed-capacity, closable FIFO for producer/consumer hand-off.
 */

namespace tickets {

/**
 * @brief Thread-safe FIFO with a fixed capacity.
 *
 * @details
 * - push() blocks while the queue is full.
 * - pop() blocks while the queue is empty.
 * - close() wakes everybody: pending and future pushes fail, pops drain
 *   what is left and then fail.
 * - abort() is close() that also drops queued items, so pops fail at once.
 *
 * Each pushed item is handed to exactly one pop() caller, in FIFO order.
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    ~BoundedQueue() { abort(); }

    /**
     * @brief Appends an item, waiting for room.
     * @return True if queued; false if the queue was closed first.
     */
    bool push(T item) {
        {
            std::unique_lock<std::mutex> lock(mut_);
            not_full_.wait(lock, [&] { return closed_ || buffer_.size() < capacity_; });
            if (closed_) return false;
            buffer_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Removes the oldest item, waiting for one.
     *
     * @param out_item Receives the item on success.
     * @return True on success; false once the queue is closed and drained.
     */
    bool pop(T& out_item) {
        {
            std::unique_lock<std::mutex> lock(mut_);
            not_empty_.wait(lock, [&] { return closed_ || !buffer_.empty(); });
            if (buffer_.empty()) return false;
            out_item = std::move(buffer_.front());
            buffer_.pop_front();
        }
        not_full_.notify_one();
        return true;
    }

    /** @brief Stops accepting items; queued items can still be popped. */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mut_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    /** @brief Closes the queue and discards anything still queued. */
    void abort() {
        {
            std::lock_guard<std::mutex> lock(mut_);
            closed_ = true;
            buffer_.clear();
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mut_);
        return closed_;
    }

    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mut_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> buffer_;
    bool closed_ = false;
};

} // namespace tickets
