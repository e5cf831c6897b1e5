#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

/**
 * @file ticket_types.hpp
 * @brief Domain types shared by the ticket inventory engine.
 *
 * This header defines:
 * - Ticket: one record per issued ticket number
 * - Receipt / ReceiptItem: what a customer gets back from a sale
 * - ErrorCode and the result types returned by the engine API
 */

namespace tickets {

/**
 * @brief Ticket number type.
 *
 * Positive for issued tickets. 0 is reserved and means "not allocated".
 */
using TicketId = int;

/**
 * @brief Amount of money in minor currency units (pennies).
 */
using Pennies = int;

/**
 * @brief Flat price of every ticket, in pennies.
 */
constexpr Pennies kTicketPrice = 1000;

/**
 * @brief The only window that hands out free goodies with a sale.
 */
constexpr int kGoodiesWindow = 1;

/**
 * @brief A ticket request: (movie index, showing index).
 */
using TicketRequest = std::pair<int, int>;

/**
 * @brief Payment data supplied with a sale.
 *
 * Opaque to the engine: it is accepted but neither validated nor stored.
 */
using PaymentInfo = std::map<std::string, std::string>;

/**
 * @brief A ticket record.
 *
 * @details
 * Sold-out placeholders are tickets too: they keep their number, movie,
 * showing and window, with @ref sold_out set. Their price is meaningless.
 */
struct Ticket {
    TicketId id = 0;           /**< Ticket number, 0 until allocated. */
    int movie = 0;             /**< Movie index. */
    int showing = 0;           /**< Showing index. */
    Pennies price = 0;         /**< Price paid (invalid when sold_out). */
    bool sold_out = false;     /**< The showing was full when requested. */
    bool goodies = false;      /**< Entitled to one goodie exchange. */
    bool exchanged = false;    /**< The goodie exchange has been made. */
    std::string old_good;      /**< Item handed back at exchange. */
    std::string new_good;      /**< Item received at exchange. */
    int window = 0;            /**< Selling window. */
};

/**
 * @brief One line of a receipt.
 */
struct ReceiptItem {
    std::string description;   /**< E.g. "Movie 1, Showing 2". */
    Pennies price = 0;         /**< Amount charged for this line. */
};

/**
 * @brief Itemized receipt for tickets actually sold by one Sell call.
 */
struct Receipt {
    std::string time;                /**< Caller supplied timestamp, copied as-is. */
    int window = 0;                  /**< Selling window. */
    std::vector<ReceiptItem> items;  /**< Sold tickets only, in request order. */
    Pennies total = 0;               /**< Sum of item prices. */
};

/**
 * @brief Failure classification reported by the engine.
 *
 * Adapters must relay these as-is instead of collapsing them into one kind.
 */
enum class ErrorCode {
    none,                 /**< Success. */
    configuration_error,  /**< Invalid Initialize parameter. */
    service_not_open,     /**< Initialize has not succeeded (or engine shut down). */
    validation_error,     /**< Malformed Sell request; nothing was consumed. */
    not_allocated,        /**< Ticket number never issued or out of range. */
    not_entitled,         /**< Ticket carries no goodie entitlement. */
    already_exchanged,    /**< The ticket's exchange was already made. */
    out_of_goods,         /**< Exchange stock is used up. */
    exhausted_source      /**< No more unique ticket numbers. Fatal. */
};

/**
 * @brief Stable lowercase token for an error code (e.g. "not_entitled").
 */
const char* error_code_name(ErrorCode code);

/**
 * @brief Result of Initialize / Exchange and other operations without payload.
 */
struct OpResult {
    bool success = true;                /**< True if the operation succeeded. */
    ErrorCode code = ErrorCode::none;   /**< Failure classification. */
    std::string message;                /**< Human-readable description. */

    static OpResult ok(std::string message = {}) {
        return OpResult{true, ErrorCode::none, std::move(message)};
    }
    static OpResult fail(ErrorCode code, std::string message) {
        return OpResult{false, code, std::move(message)};
    }
};

/**
 * @brief Result of a Sell call.
 *
 * @details
 * On failure, @ref tickets and @ref receipt hold whatever was assembled before
 * the failing step.
 */
struct SellResult {
    bool success = true;
    ErrorCode code = ErrorCode::none;
    std::string message;
    std::vector<Ticket> tickets;  /**< One per request, in request order. */
    Receipt receipt;
};

} // namespace tickets
