#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "identifier_source.hpp"
#include "logging.hpp"
#include "record_store.hpp"
#include "seat_ledger.hpp"
#include "ticket_types.hpp"

/**
 * @file inventory_engine.hpp
 * @brief Public API of the ticket inventory and allocation engine.
 *
 * Concurrency model:
 * - Ticket numbers come from one IdentifierSource; every number reaches
 *   exactly one caller, in issue order.
 * - Seat availability is one lock-free counter per (movie, showing).
 * - Ticket records live in a RecordStore guarded by one table-wide mutex.
 * - Initialize runs its real work once; concurrent callers wait for it and
 *   all receive the first call's result.
 */

namespace tickets {

/**
 * @brief Capacity limits fixed by a successful Initialize.
 */
struct EngineLimits {
    int exchange_stock = 0;  /**< Goodie exchanges the theatre can make (>= 0). */
    int movies = 0;          /**< Movies shown (>= 1); valid movie: 0..movies-1. */
    int showings = 0;        /**< Showings per movie (>= 1); valid showing: 0..showings-1. */
    int seats = 0;           /**< Seats per showing (>= 1). */
    int windows = 0;         /**< Ticket windows (>= 1); valid window: 1..windows. */
};

/**
 * @brief Snapshot of engine counters.
 *
 * Counters are read one by one, so a snapshot taken while sales run is not
 * guaranteed to be mutually consistent.
 */
struct EngineStats {
    int tickets_issued = 0;     /**< Ticket numbers drawn from the source. */
    int tickets_sold = 0;       /**< Tickets actually sold. */
    int sold_out_requests = 0;  /**< Sold-out placeholders recorded (lost opportunities). */
    int exchanges_done = 0;     /**< Successful goodie exchanges. */
    int exchange_stock_left = 0;
    long long revenue = 0;      /**< Sum of all receipt totals, in pennies. */
};

/**
 * @brief Issues tickets, tracks seats and goodie exchanges.
 *
 * @details
 * Lifecycle: construct, initialize() once, then sell() / exchange() from any
 * number of threads, then shutdown() (also done by the destructor).
 *
 * ### Errors
 * Every operation returns a result carrying an ErrorCode; nothing throws.
 * ErrorCode::exhausted_source is fatal: the engine logs it, stops issuing
 * tickets and reports it for every later sale or exchange. Terminating the
 * process is the host's decision.
 *
 * ### Known gaps (kept on purpose)
 * - A seat consumed by a sale that fails afterwards is not given back.
 * - Two concurrent exchanges of the SAME ticket may both pass the
 *   eligibility checks, because the read and the write are separate store
 *   calls. Exchange stock itself never goes negative.
 */
class InventoryEngine {
public:
    /**
     * @param log Logger to use; null creates a stdout logger at warn level.
     */
    explicit InventoryEngine(std::shared_ptr<logging::Logger> log = nullptr);

    /** @brief Calls shutdown(). */
    ~InventoryEngine();

    InventoryEngine(const InventoryEngine&) = delete;
    InventoryEngine& operator=(const InventoryEngine&) = delete;

    /**
     * @brief Validates the limits, builds the tables and opens sales.
     *
     * @param exchange_stock Goodie exchanges available (>= 0).
     * @param movies Number of movies (>= 1).
     * @param showings Showings per movie (>= 1).
     * @param seats Seats per showing (>= 1).
     * @param windows Number of ticket windows (>= 1).
     * @return The result of the first call, for every caller.
     *
     * @details
     * Only the first call does any work. Callers arriving while it runs wait
     * and receive the same result; later callers receive it immediately.
     * A failed first call leaves the engine closed for good.
     * On failure the code is ErrorCode::configuration_error and the message
     * names the offending field, or says the tables could not be allocated.
     * If shutdown() ran first, the call fails with ErrorCode::service_not_open
     * and sales never open.
     */
    OpResult initialize(int exchange_stock, int movies, int showings, int seats, int windows);

    /**
     * @brief Sells one ticket per request, in request order.
     *
     * @param window Selling window, 1..windows.
     * @param requests (movie, showing) pairs.
     * @param payment Opaque payment data (ignored).
     * @param local_time Copied into the receipt as-is.
     * @return Tickets (sold or sold-out placeholders) and the receipt.
     *
     * @details
     * - All requests are validated before any ticket number or seat is used;
     *   one bad request rejects the whole call (ErrorCode::validation_error).
     * - Each ticket costs kTicketPrice. Sold-out placeholders are returned at
     *   their request position but add nothing to the receipt.
     * - Tickets sold at window kGoodiesWindow carry a goodie entitlement.
     * - If a step fails midway, the tickets and receipt built so far are
     *   returned with the error.
     */
    SellResult sell(int window,
                    const std::vector<TicketRequest>& requests,
                    const PaymentInfo& payment,
                    const std::string& local_time);

    /**
     * @brief Exchanges the goodie received with ticket @p id.
     *
     * @details
     * Checked in order: sold out -> not_entitled, no goodies -> not_entitled,
     * already exchanged -> already_exchanged, stock used up -> out_of_goods.
     * A ticket that cannot be read fails with not_allocated. Once the engine
     * has halted, every exchange fails with exhausted_source.
     */
    OpResult exchange(TicketId id, const std::string& old_good, const std::string& new_good);

    /**
     * @brief Copies ticket record @p id.
     * @return not_allocated if the ticket was never issued or is out of range.
     */
    OpResult read_ticket(TicketId id, Ticket& out_ticket) const;

    /**
     * @brief Stops the engine: closes the ticket source and sales.
     *
     * @details
     * Pending and later ticket draws fail; later sell() and exchange() calls
     * fail with ErrorCode::service_not_open. Idempotent.
     */
    void shutdown();

    /** @brief True after a successful initialize() and before shutdown(). */
    bool sales_open() const { return sales_open_.load(); }

    /** @brief True once ticket numbers ran out. */
    bool halted() const { return halted_.load(); }

    /** @brief Limits set by initialize(); all zero until it succeeds. */
    EngineLimits limits() const;

    EngineStats stats() const;

private:
    enum class InitState { uninitialized, initializing, done };

    std::shared_ptr<logging::Logger> log_;

    // Init gate
    mutable std::mutex init_mut_;
    std::condition_variable init_cv_;
    InitState init_state_ = InitState::uninitialized;
    OpResult init_result_;

    // Set once by the first initialize(), published by sales_open_
    EngineLimits limits_;
    std::unique_ptr<SeatLedger> ledger_;
    std::unique_ptr<RecordStore> store_;
    std::unique_ptr<IdentifierSource> source_;

    std::atomic<bool> sales_open_{false};
    std::atomic<bool> halted_{false};
    std::atomic<bool> shut_down_{false};

    std::atomic<int> exchanges_done_{0};
    std::atomic<int> tickets_sold_{0};
    std::atomic<int> sold_out_requests_{0};
    std::atomic<long long> revenue_{0};

    OpResult initialize_once(int exchange_stock, int movies, int showings, int seats, int windows);
    static OpResult validate_limits(const EngineLimits& limits);

    /** @brief Draws a ticket number and creates its record. */
    OpResult next_ticket(Ticket& out_ticket, int request_no);

    /** @brief Logs and latches the fatal out-of-ticket-numbers condition. */
    OpResult exhausted(const std::string& context);

    static std::string describe(const Ticket& t);
};

} // namespace tickets
