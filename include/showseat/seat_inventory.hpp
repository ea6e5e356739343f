#pragma once

#include "showseat/clock.hpp"
#include "showseat/types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file seat_inventory.hpp
 * @brief The authoritative per-(show, seat) state store.
 *
 * Concurrency model:
 * - Each (show, seat) slot has its own mutex; there is no per-show or global
 *   lock on the write path.
 * - A multi-seat operation locks its slots in ascending seat order (so two
 *   overlapping requests cannot deadlock), validates every seat, then applies
 *   every transition before unlocking. Either all seats transition or none do.
 * - The per-show booked counter only changes inside that same critical
 *   section, so "available = total - booked" never drifts from seat state.
 */

namespace showseat {

enum class InventoryStatus : std::uint8_t {
    Ok,
    Conflict,      /**< reserve: one or more seats are not Available. */
    NotFound,      /**< release/finalize: seats are not held (or booked) by this owner. */
    Expired,       /**< finalize: the backing hold deadline has passed. */
    UnknownShow,
    InvalidSeats   /**< empty request, out-of-range or duplicate seat ids. */
};

/**
 * @brief Typed outcome of an inventory operation.
 *
 * Conflicts are an expected, frequent outcome under load, so they are
 * reported here rather than thrown.
 */
struct InventoryResult {
    InventoryStatus status{InventoryStatus::Ok};
    std::vector<SeatId> conflicting;  /**< Seats that blocked the operation, ascending. */
    std::string message;

    bool ok() const { return status == InventoryStatus::Ok; }
};

/** @brief One seat-state transition, as recorded in the journal. */
struct JournalEntry {
    ShowId show_id{};
    SeatId seat_id{};
    SeatState from{SeatState::Available};
    SeatState to{SeatState::Available};
    std::uint64_t owner{0};  /**< Hold token (to Held / from Held) or booking id (Booked). */
    TimePoint at{};
};

class SeatInventory {
public:
    /**
     * @brief Called once per seat right before its transition is applied.
     *
     * Test hook standing in for a storage layer that can fail mid-write. If it
     * throws, every seat already applied by the same call is restored and the
     * call throws StorageError.
     */
    using FaultHook = std::function<void(ShowId, SeatId, SeatState /*to*/)>;

    static constexpr std::size_t kDefaultJournalCapacity = 100000;

    /** @param journal_capacity Transitions kept in memory; the oldest are dropped beyond it. */
    explicit SeatInventory(std::shared_ptr<const Clock> clock,
                           std::size_t journal_capacity = kDefaultJournalCapacity);
    SeatInventory(const SeatInventory&) = delete;
    SeatInventory& operator=(const SeatInventory&) = delete;

    /**
     * @brief Creates the slots of a show, all Available. Idempotent.
     * @throws InvariantViolation if the show exists with a different seat count.
     */
    void add_show(ShowId show_id, std::uint32_t seat_count);

    bool has_show(ShowId show_id) const;

    /**
     * @brief Available -> Held for every seat, owned by @p token until @p expires_at.
     * @return Ok, or Conflict listing every seat that is not Available.
     */
    InventoryResult reserve(ShowId show_id, const std::vector<SeatId>& seats,
                            HoldToken token, TimePoint expires_at);

    /**
     * @brief Held -> Available for seats held by @p token.
     * @return NotFound if any seat is not held by @p token (nothing changes).
     */
    InventoryResult release(ShowId show_id, const std::vector<SeatId>& seats, HoldToken token);

    /**
     * @brief Moves the deadline of seats held by @p token (Held -> Held).
     * @return NotFound if any seat is not held by @p token.
     */
    InventoryResult extend(ShowId show_id, const std::vector<SeatId>& seats,
                           HoldToken token, TimePoint new_expires_at);

    /**
     * @brief Held -> Booked for seats held by @p token; increments the booked counter.
     * @return NotFound if any seat is not held by @p token, Expired if the hold
     *         deadline has passed. Nothing changes on failure.
     */
    InventoryResult finalize(ShowId show_id, const std::vector<SeatId>& seats,
                             HoldToken token, BookingId booking_id);

    /**
     * @brief Booked -> Available for seats booked by @p booking_id; decrements
     * the booked counter. Used by cancellation, which has no hold step.
     */
    InventoryResult release_booked(ShowId show_id, const std::vector<SeatId>& seats,
                                   BookingId booking_id);

    SeatState seat_state(ShowId show_id, SeatId seat_id) const;

    /** @brief Per-seat states of a show, indexed by SeatId. Empty for unknown shows. */
    std::vector<SeatState> snapshot(ShowId show_id) const;

    std::uint32_t total_seats(ShowId show_id) const;
    std::uint32_t booked_count(ShowId show_id) const;
    std::uint32_t available_count(ShowId show_id) const;

    std::vector<JournalEntry> journal() const;
    std::vector<JournalEntry> journal_for_show(ShowId show_id) const;

    /** @brief Hands the journal to a reporting collaborator and empties it. */
    std::vector<JournalEntry> drain_journal();

    /** @brief Entries discarded because the journal was full. */
    std::uint64_t journal_dropped() const;

    void set_fault_hook(FaultHook hook);

private:
    struct Slot {
        mutable std::mutex mutex;
        SeatState state{SeatState::Available};
        std::uint64_t owner{0};
        TimePoint hold_deadline{};
    };

    struct ShowSlots {
        explicit ShowSlots(std::uint32_t n) : seat_count(n), slots(std::make_unique<Slot[]>(n)) {}
        const std::uint32_t seat_count;
        std::unique_ptr<Slot[]> slots;
        std::atomic<std::uint32_t> booked{0};
    };

    /** @brief Per-seat check; anything but Ok blocks the whole operation. */
    using SeatCheck = std::function<InventoryStatus(const Slot&)>;
    /** @brief Applies one seat transition; the slot is locked by the caller. */
    using SeatApply = std::function<void(Slot&)>;

    ShowSlots* find(ShowId show_id) const;

    /**
     * @brief Validates and normalizes a seat request.
     * @return Sorted seat ids, or empty with @p out_error set.
     */
    static std::vector<SeatId> normalize(const ShowSlots& show, const std::vector<SeatId>& seats,
                                         std::string& out_error);

    /**
     * @brief The single write path: lock in seat order, check all, apply all.
     *
     * @param target State every seat is in after @p apply.
     * @param owner Hold token or booking id written to the journal.
     */
    InventoryResult transact(ShowId show_id, const std::vector<SeatId>& seats,
                             SeatState target, std::uint64_t owner,
                             const SeatCheck& check, const SeatApply& apply);

    void record(const std::vector<JournalEntry>& entries);

    std::shared_ptr<const Clock> clock_;

    mutable std::shared_mutex shows_mutex_;
    std::unordered_map<ShowId, std::unique_ptr<ShowSlots>> shows_;

    const std::size_t journal_capacity_;
    mutable std::mutex journal_mutex_;
    std::deque<JournalEntry> journal_;
    std::uint64_t journal_dropped_{0};

    mutable std::mutex hook_mutex_;
    FaultHook fault_hook_;
};

} // namespace showseat
