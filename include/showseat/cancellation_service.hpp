#pragma once

#include "showseat/booking_registry.hpp"
#include "showseat/catalog.hpp"
#include "showseat/clock.hpp"
#include "showseat/event_publisher.hpp"
#include "showseat/refund_policy.hpp"
#include "showseat/seat_inventory.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace showseat {

enum class CancellationStatus : std::uint8_t {
    Cancelled,
    NotFound,
    Forbidden,        /**< The booking belongs to another actor. */
    NotConfirmed,     /**< Pending, Expired or already Cancelled. */
    TooLateToCancel   /**< Inside the cancellation cutoff. */
};

struct CancellationResult {
    bool success{false};
    CancellationStatus status{CancellationStatus::NotFound};
    std::string message;
    Money refund_amount{0};
    std::optional<Booking> booking;
};

/**
 * @brief Cancels confirmed bookings and frees their seats.
 *
 * @details
 * Seats go straight from Booked to Available; there is no hold step. The
 * booking row is flipped to Cancelled before the seats are released, so no
 * observer can see a free seat still referenced by a Confirmed booking. If
 * the release hits a storage fault the row is restored to Confirmed and the
 * StorageError propagates.
 *
 * The payment collaborator is never called here: the refund amount travels
 * on the BookingCancelled event for settlement to pay out.
 */
class CancellationService {
public:
    CancellationService(std::shared_ptr<BookingRegistry> registry,
                        std::shared_ptr<SeatInventory> inventory,
                        std::shared_ptr<IEventPublisher> publisher,
                        std::shared_ptr<const Clock> clock,
                        const ShowCatalog& catalog,
                        RefundPolicy policy);

    CancellationResult cancel_booking(BookingId booking_id, const ActorId& actor);

    const RefundPolicy& policy() const { return policy_; }

private:
    std::shared_ptr<BookingRegistry> registry_;
    std::shared_ptr<SeatInventory> inventory_;
    std::shared_ptr<IEventPublisher> publisher_;
    std::shared_ptr<const Clock> clock_;
    const ShowCatalog& catalog_;
    RefundPolicy policy_;
};

const char* to_string(CancellationStatus status);

} // namespace showseat
