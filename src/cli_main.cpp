#include "engine_options.hpp"
#include "inventory_engine.hpp"
#include "logging.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

static void print_help() {
    std::cout
        << "Commands:\n"
        << "  sell <window> <movie>:<showing> [<movie>:<showing> ...]\n"
        << "  exchange <ticket> <old_good> <new_good>\n"
        << "  ticket <ticket>\n"
        << "  stats\n"
        << "  exit \n";
}

static void print_failure(tickets::ErrorCode code, const std::string& message) {
    std::cout << "FAIL [" << tickets::error_code_name(code) << "]: " << message << "\n";
}

// Running out of ticket numbers ends the session whichever command saw it.
static bool is_fatal(const tickets::ErrorCode code) {
    return code == tickets::ErrorCode::exhausted_source;
}

static void print_ticket(const tickets::Ticket& t) {
    std::cout << "#" << t.id << "  movie " << t.movie << ", showing " << t.showing
              << ", window " << t.window;
    if (t.sold_out) {
        std::cout << "  SOLD OUT";
    } else {
        std::cout << "  " << t.price << "p" << (t.goodies ? "  +goodies" : "");
    }
    if (t.exchanged) {
        std::cout << "  exchanged " << t.old_good << " -> " << t.new_good;
    }
    std::cout << "\n";
}

// "m:s" -> (m, s)
static bool parse_request(const std::string& token, tickets::TicketRequest& out) {
    const std::size_t colon = token.find(':');
    if (colon == std::string::npos) return false;
    int movie = 0, showing = 0;
    if (!tickets::try_parse_int(token.substr(0, colon), movie)) return false;
    if (!tickets::try_parse_int(token.substr(colon + 1), showing)) return false;
    out = tickets::TicketRequest{movie, showing};
    return true;
}

static std::string local_time_now() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return buf;
}

int main(int argc, char** argv) {
    tickets::EngineOptions opts;
    std::string err;
    if (!tickets::parse_engine_options(argc, argv, opts, err)) {
        std::cerr << err << "\n" << tickets::engine_options_usage(argv[0]);
        return 2;
    }
    if (opts.show_help) {
        std::cout << tickets::engine_options_usage(argv[0]);
        return 0;
    }

    auto log = std::make_shared<tickets::logging::Logger>(opts.log_level);
    if (!opts.log_file.empty()) {
        auto file = std::make_unique<std::ofstream>(opts.log_file, std::ios::app);
        if (!file->is_open()) {
            std::cerr << "Cannot open log file " << opts.log_file << "\n";
            return 2;
        }
        log->set_sink(std::move(file));
        log->set_stdout_enabled(false); // keep the console for the dialogue
    }

    tickets::InventoryEngine engine(log);
    const tickets::OpResult init = engine.initialize(opts.exchange_stock, opts.movies, opts.showings,
                                                     opts.seats, opts.windows);
    if (!init.success) {
        print_failure(init.code, init.message);
        return 2;
    }

    std::cout << "Ticket Engine CLI\n";
    print_help();

    std::string line;
    while (true) {
        std::cout << "\n> ";
        if (!std::getline(std::cin, line)) break;
        if (line == "exit") break;
        if (line.empty()) continue;

        std::istringstream iss(line);
        std::string cmd;
        iss >> cmd;

        if (cmd == "help") {
            print_help();
        } else if (cmd == "sell") {
            int window = -1;
            iss >> window;

            std::vector<tickets::TicketRequest> requests;
            std::string tok;
            bool ok = true;
            while (iss >> tok) {
                tickets::TicketRequest r;
                if (!parse_request(tok, r)) {
                    std::cout << "Bad request '" << tok << "', expected <movie>:<showing>\n";
                    ok = false;
                    break;
                }
                requests.push_back(r);
            }
            if (!ok) continue;

            tickets::SellResult r = engine.sell(window, requests, tickets::PaymentInfo{}, local_time_now());
            for (const auto& t : r.tickets) print_ticket(t);
            if (!r.receipt.items.empty()) {
                std::cout << "Receipt (window " << r.receipt.window << ", " << r.receipt.time << ")\n";
                for (const auto& item : r.receipt.items) {
                    std::cout << "  " << item.description << "  " << item.price << "p\n";
                }
                std::cout << "  Total  " << r.receipt.total << "p\n";
            }
            if (!r.success) {
                print_failure(r.code, r.message);
                if (is_fatal(r.code)) {
                    engine.shutdown();
                    return 1;
                }
            }
        } else if (cmd == "exchange") {
            int id = 0;
            std::string old_good, new_good;
            if (!(iss >> id >> old_good >> new_good)) {
                std::cout << "Usage: exchange <ticket> <old_good> <new_good>\n";
                continue;
            }
            tickets::OpResult r = engine.exchange(id, old_good, new_good);
            if (r.success) {
                std::cout << "OK: " << r.message << "\n";
            } else {
                print_failure(r.code, r.message);
                if (is_fatal(r.code)) {
                    engine.shutdown();
                    return 1;
                }
            }
        } else if (cmd == "ticket") {
            int id = 0;
            iss >> id;
            tickets::Ticket t;
            tickets::OpResult r = engine.read_ticket(id, t);
            if (r.success) {
                print_ticket(t);
            } else {
                print_failure(r.code, r.message);
                if (is_fatal(r.code)) {
                    engine.shutdown();
                    return 1;
                }
            }
        } else if (cmd == "stats") {
            const tickets::EngineStats s = engine.stats();
            std::cout << "issued " << s.tickets_issued << ", sold " << s.tickets_sold
                      << ", sold out " << s.sold_out_requests << ", exchanges " << s.exchanges_done
                      << " (" << s.exchange_stock_left << " left), revenue " << s.revenue << "p\n";
        } else {
            std::cout << "Unknown command. Type 'help'.\n";
        }
    }

    engine.shutdown();
    return 0;
}
