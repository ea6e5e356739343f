#include "showseat/booking_engine.hpp"
#include "showseat/errors.hpp"

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

namespace {

// Stands in for the payment collaborator: the method "decline" is refused,
// anything else succeeds. Repeated keys return the first transaction.
class SimulatedGateway final : public showseat::IPaymentGateway {
public:
    showseat::PaymentOutcome charge(const showseat::ChargeRequest& req) override {
        std::lock_guard<std::mutex> g(mutex_);
        auto it = settled_.find(req.idempotency_key);
        if (it != settled_.end()) {
            return showseat::PaymentOutcome::success(it->second);
        }
        if (req.method == "decline") {
            return showseat::PaymentOutcome::failure("card declined");
        }
        const std::string txn = "TXN-" + std::to_string(++sequence_);
        settled_.emplace(req.idempotency_key, txn);
        return showseat::PaymentOutcome::success(txn);
    }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::string> settled_;
    std::uint64_t sequence_{0};
};

std::string format_money(showseat::Money cents) {
    char buf[32];
    const long long v = static_cast<long long>(cents);
    std::snprintf(buf, sizeof(buf), "%s%lld.%02lld", v < 0 ? "-" : "", (v < 0 ? -v : v) / 100,
                  (v < 0 ? -v : v) % 100);
    return buf;
}

std::string format_time(showseat::TimePoint tp) {
    const std::time_t t = showseat::WallClock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M UTC", &tm);
    return buf;
}

void seed_demo_catalog(showseat::BookingEngine& engine) {
    std::vector<showseat::Seat> seats = showseat::ShowCatalog::make_grid(5, 8);
    for (auto& s : seats) {
        if (s.label[0] == 'E') {
            s.tier = showseat::SeatTier::Premium;
            s.price_delta = 300;
        }
    }
    const showseat::ScreenId screen = engine.add_screen("Screen 1", seats);
    const showseat::TimePoint now = showseat::WallClock::now();
    engine.add_show("Inception", screen, now + std::chrono::hours(72), 1200);
    engine.add_show("Interstellar", screen, now + std::chrono::hours(5), 1400);
    engine.add_show("Tenet", screen, now + std::chrono::minutes(90), 1000);
}

void print_help() {
    std::cout
        << "Commands:\n"
        << "  shows\n"
        << "  seats <show_id>\n"
        << "  hold <show_id> <actor> A1 A2 ...\n"
        << "  pay <hold_token> <method> [promo]\n"
        << "  release <hold_token>\n"
        << "  cancel <booking_id> <actor>\n"
        << "  booking <booking_id>\n"
        << "  sweep\n"
        << "  outbox\n"
        << "  exit\n";
}

void print_booking(const showseat::Booking& b) {
    std::cout << "Booking " << b.id << " [" << b.code << "] " << showseat::to_string(b.status)
              << "\n  show " << b.show_id << ", customer " << b.actor << "\n  seats:";
    for (const auto& s : b.seats) {
        std::cout << " " << s.label << "(" << format_money(s.price) << ")";
    }
    std::cout << "\n  subtotal " << format_money(b.price.subtotal)
              << ", fee " << format_money(b.price.convenience_fee)
              << ", discount " << format_money(b.price.discount)
              << ", total " << format_money(b.price.final_amount) << "\n";
    if (b.status == showseat::BookingStatus::Cancelled || b.status == showseat::BookingStatus::Expired) {
        std::cout << "  refund " << format_money(b.refund_amount) << "\n";
    }
}

bool parse_u64(const std::string& text, std::uint64_t& out) {
    if (text.empty()) return false;
    try {
        std::size_t pos = 0;
        out = std::stoull(text, &pos, 0);
        return pos == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

int main(int argc, char** argv) {
    showseat::EngineConfig config;
    try {
        if (argc > 1) {
            config = showseat::load_engine_config(argv[1]);
        }
    } catch (const showseat::ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    showseat::BookingEngine engine(config, std::make_shared<SimulatedGateway>());
    try {
        if (argc > 2) {
            engine.load_catalog(argv[2]);
        } else {
            seed_demo_catalog(engine);
        }
    } catch (const showseat::ConfigError& e) {
        std::cerr << "Catalog error: " << e.what() << "\n";
        return 1;
    }
    engine.start();

    std::cout << "Showseat booking CLI\n";
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
        } else if (cmd == "shows") {
            for (const auto& s : engine.list_shows()) {
                std::cout << s.id << ": " << s.title << " at " << format_time(s.scheduled_at)
                          << ", from " << format_money(s.base_price)
                          << ", " << engine.available_count(s.id) << "/" << s.total_seats << " free\n";
            }
        } else if (cmd == "seats") {
            showseat::ShowId show_id = 0;
            iss >> show_id;
            const std::vector<showseat::SeatView> map = engine.seat_map(show_id);
            if (map.empty()) {
                std::cout << "No such show\n";
                continue;
            }
            char row = 0;
            for (const auto& v : map) {
                if (v.label[0] != row) {
                    if (row != 0) std::cout << "\n";
                    row = v.label[0];
                }
                const char mark = v.state == showseat::SeatState::Available ? ' '
                                : v.state == showseat::SeatState::Held ? 'h' : 'X';
                std::cout << v.label << "[" << mark << "] ";
            }
            std::cout << "\n(" << engine.available_count(show_id) << " available; h = held, X = booked)\n";
        } else if (cmd == "hold") {
            showseat::ShowId show_id = 0;
            std::string actor;
            iss >> show_id >> actor;
            std::vector<std::string> labels;
            std::string s;
            while (iss >> s) labels.push_back(s);
            if (actor.empty() || labels.empty()) {
                std::cout << "Usage: hold <show_id> <actor> A1 A2 ...\n";
                continue;
            }

            const showseat::HoldResult r = engine.hold_labels(show_id, labels, actor);
            if (r.success()) {
                std::cout << "OK: hold " << r.hold->token << " expires at "
                          << format_time(r.hold->expires_at) << "\n";
            } else {
                std::cout << "FAIL: " << r.message << "\n";
            }
        } else if (cmd == "pay") {
            std::string token_text, method, promo;
            iss >> token_text >> method >> promo;
            std::uint64_t token = 0;
            if (!parse_u64(token_text, token) || method.empty()) {
                std::cout << "Usage: pay <hold_token> <method> [promo]\n";
                continue;
            }
            try {
                const showseat::BookingResult r = engine.submit(token, method, promo);
                std::cout << (r.success ? "OK: " : "FAIL: ") << r.message << "\n";
                if (r.booking) print_booking(*r.booking);
            } catch (const showseat::StorageError& e) {
                std::cout << "ERROR: " << e.what() << "\n";
            }
        } else if (cmd == "release") {
            std::string token_text;
            iss >> token_text;
            std::uint64_t token = 0;
            if (!parse_u64(token_text, token)) {
                std::cout << "Usage: release <hold_token>\n";
                continue;
            }
            const showseat::HoldResult r = engine.release(token);
            std::cout << (r.success() ? "OK: " : "FAIL: ") << r.message << "\n";
        } else if (cmd == "cancel") {
            showseat::BookingId id = 0;
            std::string actor;
            iss >> id >> actor;
            try {
                const showseat::CancellationResult r = engine.cancel(id, actor);
                std::cout << (r.success ? "OK: " : "FAIL: ") << r.message << "\n";
                if (r.success) std::cout << "Refund: " << format_money(r.refund_amount) << "\n";
            } catch (const showseat::StorageError& e) {
                std::cout << "ERROR: " << e.what() << "\n";
            }
        } else if (cmd == "booking") {
            showseat::BookingId id = 0;
            iss >> id;
            const std::optional<showseat::Booking> b = engine.booking(id);
            if (!b) {
                std::cout << "No such booking\n";
            } else {
                print_booking(*b);
            }
        } else if (cmd == "sweep") {
            std::cout << "Released " << engine.sweep_now() << " expired hold(s)\n";
        } else if (cmd == "outbox") {
            engine.flush_events();
            const std::vector<nlohmann::json> docs = engine.outbox().drain();
            if (docs.empty()) std::cout << "Outbox empty\n";
            for (const auto& d : docs) std::cout << d.dump() << "\n";
        } else {
            std::cout << "Unknown command. Type 'help'.\n";
        }
    }

    engine.stop();
    return 0;
}
