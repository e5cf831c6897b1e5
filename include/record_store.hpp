#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "ticket_types.hpp"

/**
 * @file record_store.hpp
 * @brief In-memory ticket table, indexed by ticket number.
 */

namespace tickets {

/**
 * @brief Fixed-size table of Ticket records.
 *
 * @details
 * Slot 0 is never used, so a slot whose stamped number is 0 is "not
 * allocated". Slots 1..max_id() hold tickets.
 *
 * The table exposes only four operations: create, read, and two disjoint
 * partial updates (sale fields and exchange fields). All of them run under
 * one table-wide mutex, so a sale update and an exchange update of the same
 * record can never interleave field by field. Readers always get copies.
 *
 * Records are never deleted.
 */
class RecordStore {
public:
    /**
     * @brief Creates a zeroed table with @p max_id usable slots (plus slot 0).
     */
    explicit RecordStore(TicketId max_id);

    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    /**
     * @brief Marks slot @p id as allocated by stamping its number.
     *
     * @param id A freshly issued ticket number.
     * @param out_ticket Receives a copy of the new (zero-valued) record.
     * @return False if @p id is outside 1..max_id() or was already stamped.
     *
     * @details
     * A false return means ticket numbers can no longer be issued uniquely;
     * the engine treats it as fatal.
     */
    bool create(TicketId id, Ticket& out_ticket);

    /**
     * @brief Copies record @p id.
     *
     * @param id Ticket number.
     * @param out_ticket Receives the copy on success.
     * @param out_error Filled with the reason on failure; cleared on entry.
     * @return False if @p id is out of range (including 0) or not allocated.
     */
    bool read(TicketId id, Ticket& out_ticket, std::string& out_error) const;

    /**
     * @brief Overwrites the sale fields (movie, showing, price, sold_out, goodies, window)
     * of record @p ticket.id. Exchange fields are left untouched.
     *
     * @return False if the record does not exist.
     */
    bool update_sale(const Ticket& ticket);

    /**
     * @brief Overwrites the exchange fields (exchanged, old_good, new_good)
     * of record @p ticket.id. Sale fields are left untouched.
     *
     * @return False if the record does not exist.
     */
    bool update_exchange(const Ticket& ticket);

    /** @brief Highest valid ticket number. */
    TicketId max_id() const { return static_cast<TicketId>(slots_.size()) - 1; }

    /** @brief Number of slots, including the unused slot 0. */
    std::size_t size() const { return slots_.size(); }

private:
    mutable std::mutex mut_;   /**< Guards every slot. */
    std::vector<Ticket> slots_;

    /** @brief Checks range and allocation; caller holds @ref mut_. */
    bool allocated_locked(TicketId id) const;
};

} // namespace tickets
