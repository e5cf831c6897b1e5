#include <gtest/gtest.h>

#include "seat_ledger.hpp"

#include <atomic>
#include <thread>
#include <vector>

using tickets::SeatConsumption;
using tickets::SeatLedger;

// ---------- Tests: capacity ----------
TEST(SeatLedger, FirstNSeatsFitThenOverCapacity) {
    SeatLedger ledger(2, 3, 5);

    for (int n = 1; n <= 5; ++n) {
        SeatConsumption c = ledger.consume_seat(1, 2);
        EXPECT_EQ(c.consumed, n);
        EXPECT_FALSE(c.over_capacity);
    }
    for (int n = 6; n <= 9; ++n) {
        SeatConsumption c = ledger.consume_seat(1, 2);
        EXPECT_EQ(c.consumed, n); // keeps counting past capacity
        EXPECT_TRUE(c.over_capacity);
    }
}

TEST(SeatLedger, EveryCounterStartsAtZero) {
    SeatLedger ledger(40, 25, 3);
    for (int m = 0; m < 40; ++m) {
        for (int s = 0; s < 25; ++s) {
            EXPECT_EQ(ledger.consume_seat(m, s).consumed, 1) << m << ":" << s;
        }
    }
}

TEST(SeatLedger, CountersAreIndependent) {
    SeatLedger ledger(2, 2, 1);

    EXPECT_FALSE(ledger.consume_seat(0, 0).over_capacity);
    EXPECT_TRUE(ledger.consume_seat(0, 0).over_capacity);

    // Other (movie, showing) pairs are untouched
    EXPECT_FALSE(ledger.consume_seat(0, 1).over_capacity);
    EXPECT_FALSE(ledger.consume_seat(1, 0).over_capacity);
    EXPECT_FALSE(ledger.consume_seat(1, 1).over_capacity);
    EXPECT_EQ(ledger.consume_seat(1, 1).consumed, 2);
}

TEST(SeatLedger, Dimensions) {
    SeatLedger ledger(6, 7, 8);
    EXPECT_EQ(ledger.movies(), 6);
    EXPECT_EQ(ledger.showings(), 7);
    EXPECT_EQ(ledger.seats(), 8);
}

// ---------- Concurrency test ----------
TEST(Concurrency, ExactlyCapacitySeatsFitUnderContention) {
    constexpr int kSeats = 100;
    constexpr int kThreads = 16;
    constexpr int kPerThread = 20; // 320 attempts for 100 seats
    SeatLedger ledger(1, 1, kSeats);

    std::atomic<bool> start{false};
    std::atomic<int> fitted{0};
    std::atomic<int> max_seen{0};

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            while (!start.load()) {
                // spin until start
            }
            for (int n = 0; n < kPerThread; ++n) {
                SeatConsumption c = ledger.consume_seat(0, 0);
                if (!c.over_capacity) fitted.fetch_add(1);
                int prev = max_seen.load();
                while (c.consumed > prev && !max_seen.compare_exchange_weak(prev, c.consumed)) {
                }
            }
        });
    }

    start.store(true);
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(fitted.load(), kSeats);
    EXPECT_EQ(max_seen.load(), kThreads * kPerThread); // no lost increments
}
