#pragma once

#include <atomic>
#include <memory>

/**
 * @file seat_ledger.hpp
 * @brief Per-(movie, showing) counters of seats consumed so far.
 */

namespace tickets {

/**
 * @brief Result of consuming one seat.
 */
struct SeatConsumption {
    int consumed;        /**< Counter value after this consumption. */
    bool over_capacity;  /**< True if @ref consumed exceeds the seat capacity (sold out). */
};

/**
 * @brief Matrix of lock-free seat counters, one per (movie, showing).
 *
 * @details
 * There is deliberately no read-only "seats left" query. Checking and taking a
 * seat is one atomic increment, so two callers can never both see the last
 * seat as free.
 *
 * Counters only go up. A counter above capacity is the sold-out signal, not an
 * error, and a consumed seat is never given back.
 */
class SeatLedger {
public:
    /**
     * @param movies Number of movies (>= 1).
     * @param showings Number of showings per movie (>= 1).
     * @param seats Seat capacity of every showing (>= 1).
     */
    SeatLedger(int movies, int showings, int seats);

    SeatLedger(const SeatLedger&) = delete;
    SeatLedger& operator=(const SeatLedger&) = delete;

    /**
     * @brief Atomically consumes one seat of (movie, showing).
     *
     * @pre 0 <= movie < movies() and 0 <= showing < showings(); the engine
     * validates requests before calling.
     */
    SeatConsumption consume_seat(int movie, int showing);

    int movies() const { return movies_; }
    int showings() const { return showings_; }
    int seats() const { return seats_; }

private:
    const int movies_;
    const int showings_;
    const int seats_;

    /**
     * @brief Row-major counters: index = movie * showings_ + showing.
     *
     * @details
     * std::atomic is neither copyable nor movable, so the matrix is one
     * fixed-size array allocated up front.
     */
    std::unique_ptr<std::atomic<int>[]> sold_;
};

} // namespace tickets
