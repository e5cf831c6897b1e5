#include "inventory_engine.hpp"

#include <climits>
#include <new>
#include <sstream>
#include <system_error>
#include <utility>

namespace tickets {

InventoryEngine::InventoryEngine(std::shared_ptr<logging::Logger> log)
    : log_(log ? std::move(log) : std::make_shared<logging::Logger>(logging::LogLevel::warn)) {}

InventoryEngine::~InventoryEngine() {
    shutdown();
}

OpResult InventoryEngine::initialize(int exchange_stock, int movies, int showings, int seats, int windows) {
    std::unique_lock<std::mutex> lock(init_mut_);
    if (init_state_ == InitState::uninitialized) {
        init_state_ = InitState::initializing;
        lock.unlock();

        OpResult result;
        try {
            result = initialize_once(exchange_stock, movies, showings, seats, windows);
        } catch (const std::exception& e) {
            // Waiters must still be released with an outcome
            result = OpResult::fail(ErrorCode::configuration_error,
                                    std::string("initialization aborted: ") + e.what());
        }

        lock.lock();
        init_result_ = result;
        init_state_ = InitState::done;
        lock.unlock();
        init_cv_.notify_all();
        return result;
    }

    // Someone else got here first: wait for their outcome
    init_cv_.wait(lock, [&] { return init_state_ == InitState::done; });
    return init_result_;
}

OpResult InventoryEngine::validate_limits(const EngineLimits& l) {
    auto bad = [](const std::string& field, int value, const char* rule) {
        return OpResult::fail(ErrorCode::configuration_error,
                              field + " " + std::to_string(value) + " " + rule);
    };
    if (l.exchange_stock < 0) return bad("exchange_stock", l.exchange_stock, "must not be negative");
    if (l.movies < 1) return bad("movies", l.movies, "must be greater than zero");
    if (l.showings < 1) return bad("showings", l.showings, "must be greater than zero");
    if (l.seats < 1) return bad("seats", l.seats, "must be greater than zero");
    if (l.windows < 1) return bad("windows", l.windows, "must be greater than zero");

    // The ticket table needs movies * showings * seats + 1 slots, addressed by int
    const long long slots = static_cast<long long>(l.movies) * l.showings * l.seats;
    if (slots > static_cast<long long>(INT_MAX) - 1) {
        return OpResult::fail(ErrorCode::configuration_error,
                              "movies * showings * seats = " + std::to_string(slots) +
                              " exceeds the largest ticket table (" + std::to_string(INT_MAX - 1) + ")");
    }
    return OpResult::ok();
}

// Runs on the first initialize() only. Everything is built into locals and
// committed at the end, so a rejected configuration leaves the engine untouched.
OpResult InventoryEngine::initialize_once(int exchange_stock, int movies, int showings, int seats, int windows) {
    const EngineLimits limits{exchange_stock, movies, showings, seats, windows};

    OpResult valid = validate_limits(limits);
    if (!valid.success) {
        log_->error("Ticketing system initialization failed:", valid.message);
        return valid;
    }

    const TicketId capacity = movies * showings * seats;
    std::unique_ptr<SeatLedger> ledger;
    std::unique_ptr<RecordStore> store;
    std::unique_ptr<IdentifierSource> source;
    try {
        ledger = std::make_unique<SeatLedger>(movies, showings, seats);
        store = std::make_unique<RecordStore>(capacity);
        source = std::make_unique<IdentifierSource>(capacity);
        source->start();
    } catch (const std::bad_alloc&) {
        OpResult r = OpResult::fail(ErrorCode::configuration_error,
                                    "cannot allocate a ticket table of " + std::to_string(capacity) + " tickets");
        log_->error("Ticketing system initialization failed:", r.message);
        return r;
    } catch (const std::system_error& e) {
        OpResult r = OpResult::fail(ErrorCode::configuration_error,
                                    std::string("cannot start the ticket number producer: ") + e.what());
        log_->error("Ticketing system initialization failed:", r.message);
        return r;
    }

    {
        std::lock_guard<std::mutex> lock(init_mut_);
        if (shut_down_.load()) {
            // shutdown() ran first; the local source is stopped by its destructor
            log_->warn("Ticketing system shut down before initialization finished");
            return OpResult::fail(ErrorCode::service_not_open, "ticketing system was shut down");
        }
        limits_ = limits;
        ledger_ = std::move(ledger);
        store_ = std::move(store);
        source_ = std::move(source);
        sales_open_.store(true); // publishes the tables to sell() / exchange()
    }

    log_->info("Ticketing system open for sales and exchanges:",
               "exchange_stock =", exchange_stock,
               "movies =", movies,
               "showings =", showings,
               "seats =", seats,
               "windows =", windows,
               "ticket capacity =", capacity);
    return OpResult::ok("initialized");
}

OpResult InventoryEngine::exhausted(const std::string& context) {
    if (shut_down_.load()) {
        log_->warn(context, "- ticket source closed by shutdown");
        return OpResult::fail(ErrorCode::exhausted_source, context + ": ticket source has been shut down");
    }

    halted_.store(true);
    std::ostringstream msg;
    msg << context << ": no more unique ticket numbers (capacity " << source_->capacity()
        << ", issued " << source_->issued() << ", table slots " << store_->size()
        << " incl. unused slot 0). The ticket table is too small for the demand;"
        << " ticket sales cannot continue safely";
    log_->fatal(msg.str());
    return OpResult::fail(ErrorCode::exhausted_source, msg.str());
}

OpResult InventoryEngine::next_ticket(Ticket& out_ticket, int request_no) {
    const std::string context = "ticket request " + std::to_string(request_no);

    TicketId id = 0;
    if (!source_->take_next(id)) {
        return exhausted(context);
    }
    // Nobody else holds this number yet, so stamping it cannot collide
    if (!store_->create(id, out_ticket)) {
        return exhausted(context + " (ticket " + std::to_string(id) + " cannot be recorded)");
    }
    return OpResult::ok();
}

SellResult InventoryEngine::sell(int window,
                                 const std::vector<TicketRequest>& requests,
                                 const PaymentInfo& /* payment: accepted, not validated */,
                                 const std::string& local_time) {
    SellResult out;
    out.receipt.time = local_time;
    out.receipt.window = window;

    auto fail = [&out](ErrorCode code, std::string message) -> SellResult& {
        out.success = false;
        out.code = code;
        out.message = "Sell failed: " + std::move(message);
        return out;
    };

    if (!sales_open_.load()) {
        return fail(ErrorCode::service_not_open, "ticketing system is not open");
    }
    if (halted_.load()) {
        return fail(ErrorCode::exhausted_source, "ticketing system halted: ticket numbers exhausted");
    }

    // Validate everything before consuming any ticket number or seat
    if (window < 1 || window > limits_.windows) {
        return fail(ErrorCode::validation_error,
                    "window " + std::to_string(window) + " out of range 1.." + std::to_string(limits_.windows));
    }
    for (std::size_t i = 0; i < requests.size(); ++i) {
        const int movie = requests[i].first;
        const int showing = requests[i].second;
        if (movie < 0 || movie >= limits_.movies) {
            return fail(ErrorCode::validation_error,
                        "ticket request " + std::to_string(i + 1) + ": movie " + std::to_string(movie) +
                        " out of range 0.." + std::to_string(limits_.movies - 1));
        }
        if (showing < 0 || showing >= limits_.showings) {
            return fail(ErrorCode::validation_error,
                        "ticket request " + std::to_string(i + 1) + ": showing " + std::to_string(showing) +
                        " out of range 0.." + std::to_string(limits_.showings - 1));
        }
    }

    out.tickets.reserve(requests.size());
    for (std::size_t i = 0; i < requests.size(); ++i) {
        const int request_no = static_cast<int>(i + 1);

        Ticket t;
        OpResult drawn = next_ticket(t, request_no);
        if (!drawn.success) {
            return fail(drawn.code, drawn.message);
        }

        t.movie = requests[i].first;
        t.showing = requests[i].second;
        t.window = window;

        // Taking the seat is the availability check; it is not given back
        const SeatConsumption seat = ledger_->consume_seat(t.movie, t.showing);
        t.price = kTicketPrice;
        t.sold_out = seat.over_capacity;

        if (!t.sold_out) {
            out.receipt.total += t.price;
            if (window == kGoodiesWindow) {
                t.goodies = true;
            }
            out.receipt.items.push_back(ReceiptItem{
                "Movie " + std::to_string(t.movie) + ", Showing " + std::to_string(t.showing), t.price});
        }
        out.tickets.push_back(t);

        if (!store_->update_sale(t)) {
            return fail(ErrorCode::not_allocated,
                        "ticket request " + std::to_string(request_no) + ": ticket " +
                        std::to_string(t.id) + " vanished from the ticket table");
        }

        if (t.sold_out) {
            sold_out_requests_.fetch_add(1);
        } else {
            tickets_sold_.fetch_add(1);
            revenue_.fetch_add(t.price);
        }
    }

    if (log_->level() <= logging::LogLevel::debug) {
        std::ostringstream ss;
        for (const auto& t : out.tickets) ss << "\n\t" << describe(t);
        log_->debug("Sell for window", window, "returning", out.tickets.size(), "tickets, total",
                    out.receipt.total, ss.str());
    }
    return out;
}

OpResult InventoryEngine::exchange(TicketId id, const std::string& old_good, const std::string& new_good) {
    if (!sales_open_.load()) {
        return OpResult::fail(ErrorCode::service_not_open, "Exchange failed: ticketing system is not open");
    }
    if (halted_.load()) {
        return OpResult::fail(ErrorCode::exhausted_source,
                              "Exchange failed: ticketing system halted: ticket numbers exhausted");
    }

    Ticket t;
    std::string err;
    if (!store_->read(id, t, err)) {
        return OpResult::fail(ErrorCode::not_allocated, "Exchange failed: " + err);
    }

    auto deny = [&](ErrorCode code, const std::string& why) {
        log_->info("Exchange denied for ticket", id, "-", why);
        return OpResult::fail(code, "Exchange denied: " + why);
    };
    if (t.sold_out) {
        return deny(ErrorCode::not_entitled, "ticket " + std::to_string(id) + " was for a sold-out showing");
    }
    if (!t.goodies) {
        return deny(ErrorCode::not_entitled,
                    "ticket " + std::to_string(id) + " was not sold at a goodie-granting window");
    }
    if (t.exchanged) {
        return deny(ErrorCode::already_exchanged,
                    "ticket " + std::to_string(id) + " was already used for an exchange");
    }

    // Reserve one unit of stock; the counter never passes exchange_stock
    int done = exchanges_done_.load();
    do {
        if (done >= limits_.exchange_stock) {
            return deny(ErrorCode::out_of_goods, "the theatre has run out of exchange goods");
        }
    } while (!exchanges_done_.compare_exchange_weak(done, done + 1));

    // TODO: hold a per-ticket lock from read() to here to serialise exchanges of the same ticket
    t.exchanged = true;
    t.old_good = old_good;
    t.new_good = new_good;
    if (!store_->update_exchange(t)) {
        exchanges_done_.fetch_sub(1);
        return OpResult::fail(ErrorCode::not_allocated,
                              "Exchange failed: ticket " + std::to_string(id) + " vanished from the ticket table");
    }

    log_->debug("Exchange on ticket", id, ":", old_good, "->", new_good);
    return OpResult::ok("exchanged");
}

OpResult InventoryEngine::read_ticket(TicketId id, Ticket& out_ticket) const {
    if (!sales_open_.load()) {
        return OpResult::fail(ErrorCode::service_not_open, "Read failed: ticketing system is not open");
    }
    std::string err;
    if (!store_->read(id, out_ticket, err)) {
        return OpResult::fail(ErrorCode::not_allocated, "Read failed: " + err);
    }
    return OpResult::ok();
}

void InventoryEngine::shutdown() {
    bool was_open = false;
    IdentifierSource* source = nullptr;
    {
        // Ordered against the commit in initialize_once()
        std::lock_guard<std::mutex> lock(init_mut_);
        if (shut_down_.exchange(true)) return;
        was_open = sales_open_.exchange(false);
        source = source_.get();
    }
    if (source) {
        source->shutdown();
    }
    if (was_open) {
        const EngineStats s = stats();
        log_->info("Ticketing system shut down:",
                   "issued =", s.tickets_issued,
                   "sold =", s.tickets_sold,
                   "sold out =", s.sold_out_requests,
                   "exchanges =", s.exchanges_done,
                   "revenue =", s.revenue);
    }
}

EngineLimits InventoryEngine::limits() const {
    std::lock_guard<std::mutex> lock(init_mut_);
    return limits_;
}

EngineStats InventoryEngine::stats() const {
    EngineStats s;
    {
        std::lock_guard<std::mutex> lock(init_mut_);
        s.tickets_issued = source_ ? source_->issued() : 0;
        s.exchange_stock_left = limits_.exchange_stock;
    }
    s.tickets_sold = tickets_sold_.load();
    s.sold_out_requests = sold_out_requests_.load();
    s.exchanges_done = exchanges_done_.load();
    s.exchange_stock_left -= s.exchanges_done;
    s.revenue = revenue_.load();
    return s;
}

std::string InventoryEngine::describe(const Ticket& t) {
    std::ostringstream ss;
    ss << "ticket " << t.id << ": movie " << t.movie << ", showing " << t.showing
       << ", window " << t.window;
    if (t.sold_out) {
        ss << ", SOLD OUT";
    } else {
        ss << ", price " << t.price << (t.goodies ? ", goodies" : "");
    }
    if (t.exchanged) {
        ss << ", exchanged " << t.old_good << " for " << t.new_good;
    }
    return ss.str();
}

} // namespace tickets
