#include "record_store.hpp"

namespace tickets {

RecordStore::RecordStore(TicketId max_id)
    : slots_(static_cast<std::size_t>(max_id < 0 ? 0 : max_id) + 1) {}

bool RecordStore::create(TicketId id, Ticket& out_ticket) {
    // Each number reaches exactly one caller, but the lock still orders the
    // stamp against readers probing the same slot.
    std::lock_guard<std::mutex> lock(mut_);
    if (id < 1 || id > max_id()) return false;
    Ticket& slot = slots_[static_cast<std::size_t>(id)];
    if (slot.id != 0) return false; // stamped twice: numbers are no longer unique
    slot.id = id;
    out_ticket = slot;
    return true;
}

bool RecordStore::read(TicketId id, Ticket& out_ticket, std::string& out_error) const {
    out_error.clear();
    if (id < 1 || id > max_id()) {
        out_error = "ticket " + std::to_string(id) + " is outside the table (1.." +
                    std::to_string(max_id()) + ")";
        return false;
    }

    std::lock_guard<std::mutex> lock(mut_);
    const Ticket& slot = slots_[static_cast<std::size_t>(id)];
    if (slot.id != id) {
        out_error = "ticket " + std::to_string(id) + " is not allocated";
        return false;
    }
    out_ticket = slot; // copy, never a reference into the table
    return true;
}

bool RecordStore::update_sale(const Ticket& ticket) {
    std::lock_guard<std::mutex> lock(mut_);
    if (!allocated_locked(ticket.id)) return false;
    Ticket& slot = slots_[static_cast<std::size_t>(ticket.id)];
    slot.movie = ticket.movie;
    slot.showing = ticket.showing;
    slot.price = ticket.price;
    slot.sold_out = ticket.sold_out;
    slot.goodies = ticket.goodies;
    slot.window = ticket.window;
    return true;
}

bool RecordStore::update_exchange(const Ticket& ticket) {
    std::lock_guard<std::mutex> lock(mut_);
    if (!allocated_locked(ticket.id)) return false;
    Ticket& slot = slots_[static_cast<std::size_t>(ticket.id)];
    slot.exchanged = ticket.exchanged;
    slot.old_good = ticket.old_good;
    slot.new_good = ticket.new_good;
    return true;
}

bool RecordStore::allocated_locked(TicketId id) const {
    if (id < 1 || id > max_id()) return false;
    return slots_[static_cast<std::size_t>(id)].id == id;
}

} // namespace tickets
