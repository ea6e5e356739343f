#pragma once

#include "showseat/pricing.hpp"
#include "showseat/types.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace showseat {

/**
 * @brief The durable record of a paid (or being-paid) seat set.
 */
struct Booking {
    BookingId id{0};
    std::string code;                /**< Human-readable, globally unique. */
    ShowId show_id{};
    ActorId actor;
    HoldToken hold_token{0};
    std::vector<BookedSeat> seats;   /**< Per-seat price frozen at booking time. */
    PriceBreakdown price;
    std::string promo_code;
    std::string idempotency_key;
    std::string transaction_id;
    BookingStatus status{BookingStatus::Pending};
    TimePoint created_at{};
    std::optional<TimePoint> confirmed_at;
    std::optional<TimePoint> cancelled_at;
    Money refund_amount{0};

    std::vector<SeatId> seat_ids() const;
};

/**
 * @brief Generates booking codes like "BK-LZ3K9Q1A-00F-7XKD".
 *
 * Layout: base36 milliseconds, a base36 monotonic counter, and a random
 * suffix. The registry still rejects duplicates; generation alone is not
 * trusted for uniqueness.
 */
class BookingCodeGenerator {
public:
    BookingCodeGenerator();
    std::string next(TimePoint now);

private:
    std::atomic<std::uint64_t> counter_{0};
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

/**
 * @brief Storage of Booking rows.
 *
 * @details
 * - Booking codes and ids are unique at this layer: insert() refuses a row
 *   whose id or code already exists.
 * - Status changes go through named transitions that accept only their legal
 *   source state: Pending -> Confirmed, Pending -> Expired, Confirmed ->
 *   Cancelled. Anything else throws InvariantViolation.
 * - A Pending row whose payment failed is erased, never left behind.
 *
 * Reporting collaborators read through get()/list_*() without going through
 * the orchestrator. All methods are thread-safe.
 */
class BookingRegistry {
public:
    BookingId next_id() { return next_id_.fetch_add(1); }

    /** @return False if a booking with the same id or code already exists. */
    bool insert(const Booking& booking);

    std::optional<Booking> get(BookingId id) const;
    std::optional<Booking> find_by_code(const std::string& code) const;
    std::vector<Booking> list_for_show(ShowId show_id) const;
    std::vector<Booking> list_all() const;
    std::vector<Booking> list_by_status(BookingStatus status) const;
    std::size_t size() const;

    /** @brief Removes a Pending row. @return False if absent or not Pending. */
    bool erase_pending(BookingId id);

    Booking confirm(BookingId id, const std::string& transaction_id, TimePoint at);
    Booking expire(BookingId id, const std::string& transaction_id, TimePoint at);

    /**
     * @brief Confirmed -> Cancelled, recording the refund.
     * @return Empty if the booking is missing or not Confirmed (a concurrent
     *         cancel won); this is not an invariant violation.
     */
    std::optional<Booking> cancel(BookingId id, Money refund, TimePoint at);

    /** @brief Undoes cancel() when releasing the seats failed on a storage fault. */
    void restore_confirmed(BookingId id);

private:
    Booking& transition(BookingId id, BookingStatus from, BookingStatus to);

    mutable std::mutex mutex_;
    std::unordered_map<BookingId, Booking> rows_;
    std::unordered_map<std::string, BookingId> by_code_;
    std::atomic<BookingId> next_id_{1};
};

} // namespace showseat
