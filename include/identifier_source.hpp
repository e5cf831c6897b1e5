#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <thread>

#include "bounded_queue.hpp"
#include "ticket_types.hpp"

/**
 * @file identifier_source.hpp
 * @brief The "roll of tickets": unique, gapless ticket numbers 1, 2, 3, ...
 */

namespace tickets {

/**
 * @brief Hands out ticket numbers 1..capacity, each exactly once.
 *
 * @details
 * A background producer thread pushes 1, 2, 3, ... into a small bounded queue
 * and closes the queue after pushing @p capacity. Consumers call take_next()
 * from any number of threads without extra locking: the queue gives every
 * number to exactly one caller, in order.
 *
 * Once the numbers run out, or after shutdown(), take_next() returns false.
 * For the engine that is the fatal "exhausted source" condition.
 */
class IdentifierSource {
public:
    /**
     * @brief Default size of the hand-off buffer.
     */
    static constexpr std::size_t kDefaultBufferSize = 5;

    /**
     * @param capacity Number of ticket numbers that may ever be issued.
     * @param buffer_size Size of the producer/consumer queue.
     */
    explicit IdentifierSource(TicketId capacity, std::size_t buffer_size = kDefaultBufferSize);

    /** @brief Shuts down and joins the producer. */
    ~IdentifierSource();

    IdentifierSource(const IdentifierSource&) = delete;
    IdentifierSource& operator=(const IdentifierSource&) = delete;

    /**
     * @brief Starts the producer thread. Calling it again has no effect.
     */
    void start();

    /**
     * @brief Takes the next ticket number, waiting if the buffer is momentarily empty.
     *
     * @param out_id Receives the ticket number on success.
     * @return True on success; false if the source is exhausted or shut down.
     *
     * @note Waits until start() has been called; calling take_next() on a
     * source that is never started blocks until shutdown().
     */
    bool take_next(TicketId& out_id);

    /**
     * @brief Makes pending and future take_next() calls fail, then joins the producer.
     *
     * Idempotent.
     */
    void shutdown();

    /** @brief Highest number this source will ever hand out. */
    TicketId capacity() const { return capacity_; }

    /** @brief Number of successful take_next() calls so far. */
    TicketId issued() const { return issued_.load(); }

private:
    const TicketId capacity_;
    BoundedQueue<TicketId> roll_;
    std::mutex lifecycle_mut_;  /**< Serialises start() and shutdown(). */
    std::thread producer_;
    bool started_ = false;
    std::atomic<TicketId> issued_{0};

    void produce();
};

} // namespace tickets
