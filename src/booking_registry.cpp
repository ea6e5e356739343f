#include "showseat/booking_registry.hpp"
#include "showseat/errors.hpp"
#include "showseat/log.hpp"

#include <algorithm>
#include <chrono>

namespace showseat {

namespace {

std::string base36(std::uint64_t v, std::size_t min_width) {
    static const char kDigits[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    std::string out;
    do {
        out.push_back(kDigits[v % 36]);
        v /= 36;
    } while (v != 0);
    while (out.size() < min_width) out.push_back('0');
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace

std::vector<SeatId> Booking::seat_ids() const {
    std::vector<SeatId> ids;
    ids.reserve(seats.size());
    for (const auto& s : seats) ids.push_back(s.seat_id);
    return ids;
}

BookingCodeGenerator::BookingCodeGenerator() : rng_(std::random_device{}()) {}

std::string BookingCodeGenerator::next(TimePoint now) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    const std::uint64_t seq = counter_.fetch_add(1) % (36ull * 36ull * 36ull);

    std::uint64_t suffix = 0;
    {
        std::lock_guard<std::mutex> g(rng_mutex_);
        suffix = rng_() % (36ull * 36ull * 36ull * 36ull);
    }
    return "BK-" + base36(static_cast<std::uint64_t>(ms), 8) + "-" + base36(seq, 3) + "-" + base36(suffix, 4);
}

bool BookingRegistry::insert(const Booking& booking) {
    std::lock_guard<std::mutex> g(mutex_);
    if (rows_.count(booking.id) != 0 || by_code_.count(booking.code) != 0) {
        return false;
    }
    rows_.emplace(booking.id, booking);
    by_code_.emplace(booking.code, booking.id);
    return true;
}

std::optional<Booking> BookingRegistry::get(BookingId id) const {
    std::lock_guard<std::mutex> g(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end()) return std::nullopt;
    return it->second;
}

std::optional<Booking> BookingRegistry::find_by_code(const std::string& code) const {
    std::lock_guard<std::mutex> g(mutex_);
    auto it = by_code_.find(code);
    if (it == by_code_.end()) return std::nullopt;
    return rows_.at(it->second);
}

std::vector<Booking> BookingRegistry::list_for_show(ShowId show_id) const {
    std::vector<Booking> out;
    {
        std::lock_guard<std::mutex> g(mutex_);
        for (const auto& kv : rows_) {
            if (kv.second.show_id == show_id) out.push_back(kv.second);
        }
    }
    std::sort(out.begin(), out.end(), [](const Booking& a, const Booking& b) { return a.id < b.id; });
    return out;
}

std::vector<Booking> BookingRegistry::list_all() const {
    std::vector<Booking> out;
    {
        std::lock_guard<std::mutex> g(mutex_);
        out.reserve(rows_.size());
        for (const auto& kv : rows_) out.push_back(kv.second);
    }
    std::sort(out.begin(), out.end(), [](const Booking& a, const Booking& b) { return a.id < b.id; });
    return out;
}

std::vector<Booking> BookingRegistry::list_by_status(BookingStatus status) const {
    std::vector<Booking> out;
    {
        std::lock_guard<std::mutex> g(mutex_);
        for (const auto& kv : rows_) {
            if (kv.second.status == status) out.push_back(kv.second);
        }
    }
    std::sort(out.begin(), out.end(), [](const Booking& a, const Booking& b) { return a.id < b.id; });
    return out;
}

std::size_t BookingRegistry::size() const {
    std::lock_guard<std::mutex> g(mutex_);
    return rows_.size();
}

bool BookingRegistry::erase_pending(BookingId id) {
    std::lock_guard<std::mutex> g(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end() || it->second.status != BookingStatus::Pending) {
        return false;
    }
    by_code_.erase(it->second.code);
    rows_.erase(it);
    return true;
}

// Caller holds mutex_.
Booking& BookingRegistry::transition(BookingId id, BookingStatus from, BookingStatus to) {
    auto it = rows_.find(id);
    if (it == rows_.end() || it->second.status != from) {
        const std::string have = (it == rows_.end()) ? "missing" : to_string(it->second.status);
        SHOWSEAT_WARN("bookings: illegal transition of " << id << " from " << have << " to " << to_string(to));
        throw InvariantViolation("Booking " + std::to_string(id) + " cannot go from " + have +
                                 " to " + to_string(to));
    }
    it->second.status = to;
    return it->second;
}

Booking BookingRegistry::confirm(BookingId id, const std::string& transaction_id, TimePoint at) {
    std::lock_guard<std::mutex> g(mutex_);
    Booking& b = transition(id, BookingStatus::Pending, BookingStatus::Confirmed);
    b.transaction_id = transaction_id;
    b.confirmed_at = at;
    return b;
}

Booking BookingRegistry::expire(BookingId id, const std::string& transaction_id, TimePoint at) {
    std::lock_guard<std::mutex> g(mutex_);
    Booking& b = transition(id, BookingStatus::Pending, BookingStatus::Expired);
    b.transaction_id = transaction_id;
    b.cancelled_at = at;
    b.refund_amount = b.price.final_amount;
    return b;
}

std::optional<Booking> BookingRegistry::cancel(BookingId id, Money refund, TimePoint at) {
    std::lock_guard<std::mutex> g(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end() || it->second.status != BookingStatus::Confirmed) {
        return std::nullopt;
    }
    Booking& b = it->second;
    b.status = BookingStatus::Cancelled;
    b.cancelled_at = at;
    b.refund_amount = refund;
    return b;
}

void BookingRegistry::restore_confirmed(BookingId id) {
    std::lock_guard<std::mutex> g(mutex_);
    Booking& b = transition(id, BookingStatus::Cancelled, BookingStatus::Confirmed);
    b.cancelled_at.reset();
    b.refund_amount = 0;
}

} // namespace showseat
