#include "showseat/booking_orchestrator.hpp"
#include "showseat/errors.hpp"
#include "showseat/log.hpp"

#include <cstdio>

namespace showseat {

namespace {

constexpr int kMaxCodeAttempts = 8;

BookingResult make_result(BookingOutcome status, std::string message) {
    BookingResult r;
    r.success = (status == BookingOutcome::Confirmed);
    r.status = status;
    r.message = std::move(message);
    return r;
}

} // namespace

BookingOrchestrator::BookingOrchestrator(std::shared_ptr<HoldManager> holds,
                                         std::shared_ptr<SeatInventory> inventory,
                                         std::shared_ptr<BookingRegistry> registry,
                                         std::shared_ptr<IPaymentGateway> gateway,
                                         std::shared_ptr<IEventPublisher> publisher,
                                         std::shared_ptr<const Clock> clock,
                                         const ShowCatalog& catalog,
                                         const EngineConfig& config)
    : holds_(std::move(holds)),
      inventory_(std::move(inventory)),
      registry_(std::move(registry)),
      publisher_(std::move(publisher)),
      clock_(std::move(clock)),
      pricing_(catalog, config),
      payments_(std::move(gateway), config.payment_timeout, config.max_charges_in_flight) {}

std::string BookingOrchestrator::idempotency_key_for(HoldToken token) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "hold-%016llx", static_cast<unsigned long long>(token));
    return buf;
}

BookingResult BookingOrchestrator::submit_booking(HoldToken token, const std::string& payment_method,
                                                  const std::string& promo_code) {
    if (payment_method.empty()) {
        return make_result(BookingOutcome::InvalidRequest, "No payment method provided");
    }

    // Price from current catalog data before claiming, so a bad promo code
    // leaves the hold untouched for another try.
    const std::optional<Hold> peek = holds_->find_hold(token);
    if (!peek) {
        return make_result(BookingOutcome::HoldExpired, "Hold not found or already expired");
    }
    Quote quote;
    std::string err;
    if (!pricing_.quote(peek->show_id, peek->seats, promo_code, quote, err)) {
        return make_result(BookingOutcome::InvalidRequest, err);
    }

    // 1. Claim: from here on this call owns the hold.
    const HoldResult claim = holds_->claim_for_payment(token);
    switch (claim.status) {
        case HoldStatus::Ok:
            break;
        case HoldStatus::PaymentInProgress:
            return make_result(BookingOutcome::PaymentInProgress, claim.message);
        case HoldStatus::Expired:
        case HoldStatus::NotFound:
        case HoldStatus::Conflict:
        case HoldStatus::InvalidRequest:
        case HoldStatus::ExtensionNotAllowed:
            return make_result(BookingOutcome::HoldExpired, claim.message);
    }
    const Hold& hold = *claim.hold;

    // 2-3. Pending row with the recomputed price.
    Booking booking;
    booking.show_id = hold.show_id;
    booking.actor = hold.actor;
    booking.hold_token = hold.token;
    booking.seats = quote.seats;
    booking.price = quote.price;
    booking.promo_code = quote.promo_code;
    booking.idempotency_key = idempotency_key_for(hold.token);
    booking.status = BookingStatus::Pending;
    booking.created_at = clock_->now();
    if (!insert_pending(booking)) {
        holds_->abort_claimed(token, "booking storage unavailable");
        throw StorageError("Could not allocate a unique booking code");
    }

    SHOWSEAT_LOG("orchestrator: booking " << booking.id << " (" << booking.code << ") pending, charging "
                 << booking.price.final_amount);

    // 4. The one external call, time-bounded.
    ChargeRequest req;
    req.amount = booking.price.final_amount;
    req.method = payment_method;
    req.idempotency_key = booking.idempotency_key;
    const PaymentOutcome outcome = payments_.charge(req);

    // 5 / 6. Exactly one branch runs.
    switch (outcome.kind) {
        case PaymentOutcomeKind::Success:
            return on_payment_success(hold, std::move(booking), outcome);
        case PaymentOutcomeKind::Failure:
        case PaymentOutcomeKind::Timeout:
            return on_payment_failure(hold, booking, outcome);
    }
    throw InvariantViolation("Unhandled payment outcome");
}

bool BookingOrchestrator::insert_pending(Booking& booking) {
    booking.id = registry_->next_id();
    for (int attempt = 0; attempt < kMaxCodeAttempts; ++attempt) {
        booking.code = codes_.next(booking.created_at);
        if (registry_->insert(booking)) {
            return true;
        }
        SHOWSEAT_WARN("orchestrator: booking code collision on " << booking.code << ", retrying");
    }
    return false;
}

BookingResult BookingOrchestrator::on_payment_success(const Hold& hold, Booking booking,
                                                      const PaymentOutcome& outcome) {
    // Re-validate liveness after the charge: the sweep may have won meanwhile.
    HoldResult done;
    try {
        done = holds_->complete(hold.token);
    } catch (const StorageError&) {
        // Expired hold whose release failed; the sweep retries the seats.
        const Booking expired = registry_->expire(booking.id, outcome.transaction_id, clock_->now());
        publish_refund(expired, "booking storage failure");
        throw;
    }
    if (done.status != HoldStatus::Ok) {
        return expire_charged(hold, booking, outcome.transaction_id, done.message);
    }

    InventoryResult fin;
    try {
        fin = inventory_->finalize(hold.show_id, hold.seats, hold.token, booking.id);
    } catch (const StorageError&) {
        // The hold record is gone but its seats are still Held: put them back
        // and make sure the charge is refunded before failing the request.
        const Booking expired = registry_->expire(booking.id, outcome.transaction_id, clock_->now());
        publish_refund(expired, "booking storage failure");
        holds_->discard(hold, "storage failure");
        throw;
    }

    if (!fin.ok()) {
        if (fin.status == InventoryStatus::Expired) {
            holds_->discard(hold, "expired");
        } else {
            SHOWSEAT_WARN("orchestrator: finalize of hold " << hold.token << " found seats it did not own: "
                          << fin.message);
        }
        return expire_charged(hold, booking, outcome.transaction_id, fin.message);
    }

    const Booking confirmed = registry_->confirm(booking.id, outcome.transaction_id, clock_->now());

    SeatEvent ev;
    ev.type = EventType::SeatsBooked;
    ev.show_id = confirmed.show_id;
    ev.seat_ids = confirmed.seat_ids();
    ev.booking_id = confirmed.id;
    ev.hold_token = hold.token;
    ev.reference = confirmed.code;
    ev.ts = *confirmed.confirmed_at;
    publisher_->publish(ev);

    SHOWSEAT_LOG("orchestrator: booking " << confirmed.id << " confirmed, txn " << confirmed.transaction_id);

    BookingResult r = make_result(BookingOutcome::Confirmed, "Booked successfully");
    r.booking = confirmed;
    return r;
}

BookingResult BookingOrchestrator::on_payment_failure(const Hold& hold, const Booking& booking,
                                                      const PaymentOutcome& outcome) {
    const std::string reason = outcome.reason.empty() ? to_string(outcome.kind) : outcome.reason;

    // Row first: if releasing the seats hits a storage fault, the hold goes
    // back to the sweep and no Pending row is left behind.
    BookingResult r = make_result(BookingOutcome::PaymentFailed, "Payment failed: " + reason);
    if (outcome.kind == PaymentOutcomeKind::Timeout) {
        // The charge may still land at the gateway. The Expired row is the
        // durable refund record; the event only notifies settlement.
        const Booking expired = registry_->expire(booking.id, std::string(), clock_->now());
        publish_refund(expired, "payment timed out");
        r.booking = expired;
        r.refund_due = true;
    } else {
        registry_->erase_pending(booking.id);
    }

    holds_->abort_claimed(hold.token, "payment " + std::string(to_string(outcome.kind)));

    SHOWSEAT_LOG("orchestrator: booking " << booking.id << " unwound: " << reason);
    return r;
}

BookingResult BookingOrchestrator::expire_charged(const Hold& hold, const Booking& booking,
                                                  const std::string& transaction_id, const std::string& why) {
    const Booking expired = registry_->expire(booking.id, transaction_id, clock_->now());
    publish_refund(expired, "hold expired during payment");

    SHOWSEAT_WARN("orchestrator: hold " << hold.token << " lost after successful charge (" << why
                  << "), refund of " << expired.refund_amount << " required");

    BookingResult r = make_result(BookingOutcome::HoldExpired,
                                  "Hold expired during payment; the charge will be refunded");
    r.booking = expired;
    r.refund_due = true;
    return r;
}

void BookingOrchestrator::publish_refund(const Booking& booking, const std::string& reason) {
    SeatEvent ev;
    ev.type = EventType::RefundRequired;
    ev.show_id = booking.show_id;
    ev.seat_ids = booking.seat_ids();
    ev.booking_id = booking.id;
    ev.hold_token = booking.hold_token;
    ev.amount = booking.price.final_amount;
    ev.reason = reason;
    ev.reference = booking.idempotency_key;
    ev.ts = clock_->now();
    publisher_->publish(ev);
}

const char* to_string(BookingOutcome outcome) {
    switch (outcome) {
        case BookingOutcome::Confirmed: return "confirmed";
        case BookingOutcome::HoldExpired: return "hold expired";
        case BookingOutcome::PaymentFailed: return "payment failed";
        case BookingOutcome::PaymentInProgress: return "payment in progress";
        case BookingOutcome::InvalidRequest: return "invalid request";
    }
    return "unknown";
}

} // namespace showseat
