#include "showseat/cancellation_service.hpp"
#include "showseat/errors.hpp"
#include "showseat/log.hpp"

#include <chrono>

namespace showseat {

namespace {

CancellationResult make_result(CancellationStatus status, std::string message) {
    CancellationResult r;
    r.success = (status == CancellationStatus::Cancelled);
    r.status = status;
    r.message = std::move(message);
    return r;
}

} // namespace

CancellationService::CancellationService(std::shared_ptr<BookingRegistry> registry,
                                         std::shared_ptr<SeatInventory> inventory,
                                         std::shared_ptr<IEventPublisher> publisher,
                                         std::shared_ptr<const Clock> clock,
                                         const ShowCatalog& catalog,
                                         RefundPolicy policy)
    : registry_(std::move(registry)),
      inventory_(std::move(inventory)),
      publisher_(std::move(publisher)),
      clock_(std::move(clock)),
      catalog_(catalog),
      policy_(std::move(policy)) {}

CancellationResult CancellationService::cancel_booking(BookingId booking_id, const ActorId& actor) {
    const std::optional<Booking> existing = registry_->get(booking_id);
    if (!existing) {
        return make_result(CancellationStatus::NotFound, "Booking not found");
    }
    if (existing->actor != actor) {
        return make_result(CancellationStatus::Forbidden, "Booking belongs to another customer");
    }
    if (existing->status != BookingStatus::Confirmed) {
        return make_result(CancellationStatus::NotConfirmed,
                           std::string("Booking is ") + to_string(existing->status));
    }

    const std::optional<Show> show = catalog_.find_show(existing->show_id);
    if (!show) {
        SHOWSEAT_WARN("cancel: booking " << booking_id << " references unknown show " << existing->show_id);
        throw InvariantViolation("Booking " + std::to_string(booking_id) + " references an unknown show");
    }

    const TimePoint now = clock_->now();
    const Duration time_to_show = std::chrono::duration_cast<Duration>(show->scheduled_at - now);
    const RefundDecision decision = policy_.evaluate(existing->price.final_amount, time_to_show);
    if (!decision.allowed) {
        return make_result(CancellationStatus::TooLateToCancel,
                           "Cancellations close " + std::to_string(policy_.cutoff().count()) +
                           " minutes before the show");
    }

    // A concurrent cancel may have won between get() and here.
    const std::optional<Booking> cancelled = registry_->cancel(booking_id, decision.refund, now);
    if (!cancelled) {
        return make_result(CancellationStatus::NotConfirmed, "Booking is no longer confirmed");
    }

    InventoryResult released;
    try {
        released = inventory_->release_booked(cancelled->show_id, cancelled->seat_ids(), cancelled->id);
    } catch (const StorageError&) {
        registry_->restore_confirmed(booking_id);
        throw;
    }
    if (!released.ok()) {
        SHOWSEAT_WARN("cancel: booking " << booking_id << " was Confirmed but its seats were not Booked by it: "
                      << released.message);
        throw InvariantViolation("Seats of booking " + std::to_string(booking_id) + " are not booked by it");
    }

    SeatEvent ev;
    ev.type = EventType::BookingCancelled;
    ev.show_id = cancelled->show_id;
    ev.seat_ids = cancelled->seat_ids();
    ev.booking_id = cancelled->id;
    ev.amount = decision.refund;
    ev.reason = "cancelled by customer";
    ev.reference = cancelled->code;
    ev.ts = now;
    publisher_->publish(ev);

    SHOWSEAT_LOG("cancel: booking " << booking_id << " cancelled, refund " << decision.refund
                 << " (" << decision.percent << "%)");

    CancellationResult r = make_result(CancellationStatus::Cancelled,
                                       "Cancelled, refund " + std::to_string(decision.percent) + "%");
    r.refund_amount = decision.refund;
    r.booking = cancelled;
    return r;
}

const char* to_string(CancellationStatus status) {
    switch (status) {
        case CancellationStatus::Cancelled: return "cancelled";
        case CancellationStatus::NotFound: return "not found";
        case CancellationStatus::Forbidden: return "forbidden";
        case CancellationStatus::NotConfirmed: return "not confirmed";
        case CancellationStatus::TooLateToCancel: return "too late to cancel";
    }
    return "unknown";
}

} // namespace showseat
