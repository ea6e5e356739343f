#include "showseat/seat_inventory.hpp"
#include "showseat/errors.hpp"
#include "showseat/log.hpp"

#include <algorithm>

namespace showseat {

SeatInventory::SeatInventory(std::shared_ptr<const Clock> clock, std::size_t journal_capacity)
    : clock_(std::move(clock)), journal_capacity_(journal_capacity) {}

void SeatInventory::add_show(ShowId show_id, std::uint32_t seat_count) {
    std::unique_lock<std::shared_mutex> lock(shows_mutex_);
    auto it = shows_.find(show_id);
    if (it != shows_.end()) {
        if (it->second->seat_count != seat_count) {
            SHOWSEAT_WARN("inventory: show " << show_id << " re-registered with " << seat_count
                          << " seats, has " << it->second->seat_count);
            throw InvariantViolation("Show " + std::to_string(show_id) + " re-registered with a different seat count");
        }
        return;
    }
    shows_.emplace(show_id, std::make_unique<ShowSlots>(seat_count));
}

bool SeatInventory::has_show(ShowId show_id) const {
    return find(show_id) != nullptr;
}

// Shows are never removed, so the returned pointer stays valid after the map lock is dropped.
SeatInventory::ShowSlots* SeatInventory::find(ShowId show_id) const {
    std::shared_lock<std::shared_mutex> lock(shows_mutex_);
    auto it = shows_.find(show_id);
    if (it == shows_.end()) return nullptr;
    return it->second.get();
}

std::vector<SeatId> SeatInventory::normalize(const ShowSlots& show, const std::vector<SeatId>& seats,
                                             std::string& out_error) {
    out_error.clear();
    if (seats.empty()) {
        out_error = "No seats provided";
        return {};
    }

    std::vector<SeatId> sorted(seats);
    std::sort(sorted.begin(), sorted.end());
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        if (sorted[i] >= show.seat_count) {
            out_error = "Seat " + std::to_string(sorted[i]) + " is out of range";
            return {};
        }
        if (i > 0 && sorted[i] == sorted[i - 1]) {
            out_error = "Duplicate seat " + std::to_string(sorted[i]);
            return {};
        }
    }
    return sorted;
}

InventoryResult SeatInventory::transact(ShowId show_id, const std::vector<SeatId>& seats,
                                        SeatState target, std::uint64_t owner,
                                        const SeatCheck& check, const SeatApply& apply) {
    InventoryResult result;

    ShowSlots* show = find(show_id);
    if (!show) {
        result.status = InventoryStatus::UnknownShow;
        result.message = "Invalid show id";
        return result;
    }

    std::string err;
    const std::vector<SeatId> ordered = normalize(*show, seats, err);
    if (!err.empty()) {
        result.status = InventoryStatus::InvalidSeats;
        result.message = err;
        return result;
    }

    // Ascending order: any two requests contend on their lowest shared seat first.
    std::vector<std::unique_lock<std::mutex>> locks;
    locks.reserve(ordered.size());
    for (SeatId seat : ordered) {
        locks.emplace_back(show->slots[seat].mutex);
    }

    // Check phase: nothing has been written yet.
    for (SeatId seat : ordered) {
        const InventoryStatus st = check(show->slots[seat]);
        if (st == InventoryStatus::Ok) continue;
        result.conflicting.push_back(seat);
        // NotFound outranks Expired: a seat we do not own is the stronger failure.
        if (result.status == InventoryStatus::Ok || st == InventoryStatus::NotFound) {
            result.status = st;
        }
    }
    if (!result.ok()) {
        return result;
    }

    // Apply phase.
    struct Saved {
        SeatId seat;
        SeatState state;
        std::uint64_t owner;
        TimePoint deadline;
    };
    std::vector<Saved> applied;
    applied.reserve(ordered.size());

    FaultHook hook;
    {
        std::lock_guard<std::mutex> g(hook_mutex_);
        hook = fault_hook_;
    }

    auto rollback = [&]() {
        for (auto it = applied.rbegin(); it != applied.rend(); ++it) {
            Slot& slot = show->slots[it->seat];
            slot.state = it->state;
            slot.owner = it->owner;
            slot.hold_deadline = it->deadline;
        }
    };

    try {
        for (SeatId seat : ordered) {
            if (hook) hook(show_id, seat, target);
            Slot& slot = show->slots[seat];
            applied.push_back(Saved{seat, slot.state, slot.owner, slot.hold_deadline});
            apply(slot);
            if (slot.state != target) {
                throw InvariantViolation("Seat " + std::to_string(seat) + " of show " +
                                         std::to_string(show_id) + " did not reach " + to_string(target));
            }
        }
    } catch (const InvariantViolation& e) {
        rollback();
        SHOWSEAT_WARN("inventory: invariant violation: " << e.what());
        throw;
    } catch (const std::exception& e) {
        rollback();
        SHOWSEAT_WARN("inventory: storage fault on show " << show_id << ", rolled back "
                      << applied.size() << " seat(s): " << e.what());
        throw StorageError(std::string("Seat inventory write failed: ") + e.what());
    }

    // Counter moves inside the same critical section as the seat states.
    std::int64_t delta = 0;
    const TimePoint now = clock_->now();
    std::vector<JournalEntry> entries;
    entries.reserve(applied.size());
    for (const Saved& s : applied) {
        if (target == SeatState::Booked) ++delta;
        if (s.state == SeatState::Booked) --delta;
        entries.push_back(JournalEntry{show_id, s.seat, s.state, target, owner, now});
    }
    if (delta > 0) {
        show->booked.fetch_add(static_cast<std::uint32_t>(delta));
    } else if (delta < 0) {
        const std::uint32_t dec = static_cast<std::uint32_t>(-delta);
        if (show->booked.load() < dec) {
            rollback();
            SHOWSEAT_WARN("inventory: booked counter underflow on show " << show_id);
            throw InvariantViolation("Booked counter underflow on show " + std::to_string(show_id));
        }
        show->booked.fetch_sub(dec);
    }

    record(entries);
    return result;
}

InventoryResult SeatInventory::reserve(ShowId show_id, const std::vector<SeatId>& seats,
                                       HoldToken token, TimePoint expires_at) {
    InventoryResult r = transact(
        show_id, seats, SeatState::Held, token,
        [](const Slot& slot) {
            return slot.state == SeatState::Available ? InventoryStatus::Ok : InventoryStatus::Conflict;
        },
        [&](Slot& slot) {
            slot.state = SeatState::Held;
            slot.owner = token;
            slot.hold_deadline = expires_at;
        });

    if (r.status == InventoryStatus::Conflict) {
        r.message = std::to_string(r.conflicting.size()) + " seat(s) already taken";
    }
    SHOWSEAT_LOG("inventory: reserve show=" << show_id << " token=" << token << " seats=" << seats.size()
                 << " ok=" << r.ok());
    return r;
}

InventoryResult SeatInventory::release(ShowId show_id, const std::vector<SeatId>& seats, HoldToken token) {
    InventoryResult r = transact(
        show_id, seats, SeatState::Available, token,
        [&](const Slot& slot) {
            return (slot.state == SeatState::Held && slot.owner == token) ? InventoryStatus::Ok
                                                                           : InventoryStatus::NotFound;
        },
        [](Slot& slot) {
            slot.state = SeatState::Available;
            slot.owner = 0;
            slot.hold_deadline = TimePoint{};
        });

    if (r.status == InventoryStatus::NotFound) {
        r.message = "Seats are not held by this hold";
    }
    SHOWSEAT_LOG("inventory: release show=" << show_id << " token=" << token << " ok=" << r.ok());
    return r;
}

InventoryResult SeatInventory::extend(ShowId show_id, const std::vector<SeatId>& seats,
                                      HoldToken token, TimePoint new_expires_at) {
    InventoryResult r = transact(
        show_id, seats, SeatState::Held, token,
        [&](const Slot& slot) {
            return (slot.state == SeatState::Held && slot.owner == token) ? InventoryStatus::Ok
                                                                           : InventoryStatus::NotFound;
        },
        [&](Slot& slot) { slot.hold_deadline = new_expires_at; });

    if (r.status == InventoryStatus::NotFound) {
        r.message = "Seats are not held by this hold";
    }
    return r;
}

InventoryResult SeatInventory::finalize(ShowId show_id, const std::vector<SeatId>& seats,
                                        HoldToken token, BookingId booking_id) {
    const TimePoint now = clock_->now();
    InventoryResult r = transact(
        show_id, seats, SeatState::Booked, booking_id,
        [&](const Slot& slot) {
            if (slot.state != SeatState::Held || slot.owner != token) return InventoryStatus::NotFound;
            if (slot.hold_deadline <= now) return InventoryStatus::Expired;
            return InventoryStatus::Ok;
        },
        [&](Slot& slot) {
            slot.state = SeatState::Booked;
            slot.owner = booking_id;
            slot.hold_deadline = TimePoint{};
        });

    if (r.status == InventoryStatus::NotFound) {
        r.message = "Seats are not held by this hold";
    } else if (r.status == InventoryStatus::Expired) {
        r.message = "Hold expired before finalize";
    }
    SHOWSEAT_LOG("inventory: finalize show=" << show_id << " token=" << token << " booking=" << booking_id
                 << " ok=" << r.ok());
    return r;
}

InventoryResult SeatInventory::release_booked(ShowId show_id, const std::vector<SeatId>& seats,
                                              BookingId booking_id) {
    InventoryResult r = transact(
        show_id, seats, SeatState::Available, booking_id,
        [&](const Slot& slot) {
            return (slot.state == SeatState::Booked && slot.owner == booking_id) ? InventoryStatus::Ok
                                                                                  : InventoryStatus::NotFound;
        },
        [](Slot& slot) {
            slot.state = SeatState::Available;
            slot.owner = 0;
        });

    if (r.status == InventoryStatus::NotFound) {
        r.message = "Seats are not booked by this booking";
    }
    SHOWSEAT_LOG("inventory: release_booked show=" << show_id << " booking=" << booking_id << " ok=" << r.ok());
    return r;
}

SeatState SeatInventory::seat_state(ShowId show_id, SeatId seat_id) const {
    const ShowSlots* show = find(show_id);
    if (!show || seat_id >= show->seat_count) return SeatState::Available;
    std::lock_guard<std::mutex> g(show->slots[seat_id].mutex);
    return show->slots[seat_id].state;
}

std::vector<SeatState> SeatInventory::snapshot(ShowId show_id) const {
    std::vector<SeatState> out;
    const ShowSlots* show = find(show_id);
    if (!show) return out;

    // Per-seat reads; the map is advisory for viewers, not a transaction.
    out.reserve(show->seat_count);
    for (std::uint32_t i = 0; i < show->seat_count; ++i) {
        std::lock_guard<std::mutex> g(show->slots[i].mutex);
        out.push_back(show->slots[i].state);
    }
    return out;
}

std::uint32_t SeatInventory::total_seats(ShowId show_id) const {
    const ShowSlots* show = find(show_id);
    return show ? show->seat_count : 0u;
}

std::uint32_t SeatInventory::booked_count(ShowId show_id) const {
    const ShowSlots* show = find(show_id);
    return show ? show->booked.load() : 0u;
}

std::uint32_t SeatInventory::available_count(ShowId show_id) const {
    const ShowSlots* show = find(show_id);
    if (!show) return 0u;
    return show->seat_count - show->booked.load();
}

std::vector<JournalEntry> SeatInventory::journal() const {
    std::lock_guard<std::mutex> g(journal_mutex_);
    return std::vector<JournalEntry>(journal_.begin(), journal_.end());
}

std::vector<JournalEntry> SeatInventory::journal_for_show(ShowId show_id) const {
    std::vector<JournalEntry> out;
    std::lock_guard<std::mutex> g(journal_mutex_);
    for (const auto& e : journal_) {
        if (e.show_id == show_id) out.push_back(e);
    }
    return out;
}

std::vector<JournalEntry> SeatInventory::drain_journal() {
    std::deque<JournalEntry> taken;
    {
        std::lock_guard<std::mutex> g(journal_mutex_);
        taken.swap(journal_);
    }
    return std::vector<JournalEntry>(taken.begin(), taken.end());
}

std::uint64_t SeatInventory::journal_dropped() const {
    std::lock_guard<std::mutex> g(journal_mutex_);
    return journal_dropped_;
}

void SeatInventory::set_fault_hook(FaultHook hook) {
    std::lock_guard<std::mutex> g(hook_mutex_);
    fault_hook_ = std::move(hook);
}

void SeatInventory::record(const std::vector<JournalEntry>& entries) {
    std::lock_guard<std::mutex> g(journal_mutex_);
    journal_.insert(journal_.end(), entries.begin(), entries.end());
    while (journal_.size() > journal_capacity_) {
        journal_.pop_front();
        ++journal_dropped_;
    }
}

} // namespace showseat
