#include "identifier_source.hpp"

namespace tickets {

IdentifierSource::IdentifierSource(TicketId capacity, std::size_t buffer_size)
    : capacity_(capacity < 0 ? 0 : capacity), roll_(buffer_size) {}

IdentifierSource::~IdentifierSource() {
    shutdown();
}

void IdentifierSource::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mut_);
    if (started_ || roll_.closed()) return;
    started_ = true;
    producer_ = std::thread([this] { produce(); });
}

// Numbers start at 1: a record whose stamped number is 0 is "not allocated"
void IdentifierSource::produce() {
    for (TicketId id = 1; id <= capacity_; ++id) {
        if (!roll_.push(id)) return; // shut down while waiting for room
    }
    roll_.close(); // consumers drain the remainder, then see exhaustion
}

bool IdentifierSource::take_next(TicketId& out_id) {
    TicketId id = 0;
    if (!roll_.pop(id)) return false;
    issued_.fetch_add(1);
    out_id = id;
    return true;
}

void IdentifierSource::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mut_);
    roll_.abort();
    if (producer_.joinable()) {
        producer_.join();
    }
}

} // namespace tickets
