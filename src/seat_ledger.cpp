#include "seat_ledger.hpp"

#include <cstddef>
#include <memory>

namespace tickets {

SeatLedger::SeatLedger(int movies, int showings, int seats)
    : movies_(movies), showings_(showings), seats_(seats),
      sold_(std::make_unique<std::atomic<int>[]>(static_cast<std::size_t>(movies) *
                                                 static_cast<std::size_t>(showings))) {}

SeatConsumption SeatLedger::consume_seat(int movie, int showing) {
    const std::size_t idx = static_cast<std::size_t>(movie) * static_cast<std::size_t>(showings_)
                          + static_cast<std::size_t>(showing);
    const int consumed = sold_[idx].fetch_add(1) + 1; // fetch_add returns the previous value
    return SeatConsumption{consumed, consumed > seats_};
}

} // namespace tickets
