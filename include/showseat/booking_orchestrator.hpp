#pragma once

#include "showseat/booking_registry.hpp"
#include "showseat/catalog.hpp"
#include "showseat/clock.hpp"
#include "showseat/config.hpp"
#include "showseat/event_publisher.hpp"
#include "showseat/hold_manager.hpp"
#include "showseat/payment.hpp"
#include "showseat/pricing.hpp"
#include "showseat/seat_inventory.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace showseat {

enum class BookingOutcome : std::uint8_t {
    Confirmed,
    HoldExpired,        /**< Hold missing or elapsed; the customer must re-select seats. */
    PaymentFailed,      /**< Declined or timed out; seats released. A timed-out attempt is kept as Expired with refund_due. */
    PaymentInProgress,  /**< Another submit for the same hold is still charging. */
    InvalidRequest      /**< Empty payment method or unknown promo code; hold kept. */
};

/**
 * @brief Result of a booking attempt.
 */
struct BookingResult {
    bool success{false};
    BookingOutcome status{BookingOutcome::InvalidRequest};
    std::string message;
    std::optional<Booking> booking;  /**< Confirmed booking, or the Expired record when refund_due. */
    bool refund_due{false};          /**< Money was taken but no seats were booked. */
};

/**
 * @brief Drives hold -> pay -> confirm/rollback for one hold at a time.
 *
 * @details
 * Per attempt: HoldAcquired -> AwaitingPayment -> {Confirmed | ReleasedOnFailure}.
 * Exactly one of the success and failure paths runs for a given hold:
 * the hold is claimed before charging, so a duplicate submit gets
 * PaymentInProgress, and a resubmit after the outcome finds no hold.
 *
 * The payment call is the only blocking step. It runs outside every
 * inventory lock, bounded by EngineConfig::payment_timeout; a timeout is a
 * failure, but since the charge may still land its booking is kept as
 * Expired with the full amount due back. The idempotency key is derived from the hold token, so any retry
 * for the same hold reaches the gateway with the same key.
 *
 * If the hold expires while the charge is succeeding, liveness is
 * re-checked after payment and before finalize: the seats are not booked,
 * the booking becomes Expired, a RefundRequired event is emitted and the
 * result is HoldExpired with refund_due set.
 */
class BookingOrchestrator {
public:
    BookingOrchestrator(std::shared_ptr<HoldManager> holds,
                        std::shared_ptr<SeatInventory> inventory,
                        std::shared_ptr<BookingRegistry> registry,
                        std::shared_ptr<IPaymentGateway> gateway,
                        std::shared_ptr<IEventPublisher> publisher,
                        std::shared_ptr<const Clock> clock,
                        const ShowCatalog& catalog,
                        const EngineConfig& config);

    /**
     * @brief Pays for a hold and turns it into a Confirmed booking.
     *
     * @param token Hold token from HoldManager::create_hold.
     * @param payment_method Opaque method reference passed to the gateway.
     * @param promo_code Optional promo code; unknown codes are rejected before charging.
     *
     * @throws StorageError if the inventory fails; any charge already taken
     *         is reported through a RefundRequired event first.
     */
    BookingResult submit_booking(HoldToken token, const std::string& payment_method,
                                 const std::string& promo_code = std::string());

    static std::string idempotency_key_for(HoldToken token);

    std::size_t charges_in_flight() const { return payments_.in_flight(); }

private:
    bool insert_pending(Booking& booking);
    BookingResult on_payment_success(const Hold& hold, Booking booking, const PaymentOutcome& outcome);
    BookingResult on_payment_failure(const Hold& hold, const Booking& booking, const PaymentOutcome& outcome);
    BookingResult expire_charged(const Hold& hold, const Booking& booking,
                                 const std::string& transaction_id, const std::string& why);
    void publish_refund(const Booking& booking, const std::string& reason);

    std::shared_ptr<HoldManager> holds_;
    std::shared_ptr<SeatInventory> inventory_;
    std::shared_ptr<BookingRegistry> registry_;
    std::shared_ptr<IEventPublisher> publisher_;
    std::shared_ptr<const Clock> clock_;

    PriceCalculator pricing_;
    BookingCodeGenerator codes_;
    PaymentCaller payments_;
};

const char* to_string(BookingOutcome outcome);

} // namespace showseat
