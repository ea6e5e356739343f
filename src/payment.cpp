#include "showseat/payment.hpp"
#include "showseat/log.hpp"

#include <future>
#include <thread>

namespace showseat {

PaymentCaller::PaymentCaller(std::shared_ptr<IPaymentGateway> gateway,
                             std::chrono::milliseconds timeout,
                             std::size_t max_in_flight)
    : gateway_(std::move(gateway)),
      timeout_(timeout),
      max_in_flight_(max_in_flight),
      in_flight_(std::make_shared<std::atomic<std::size_t>>(0)) {}

bool PaymentCaller::acquire_slot() {
    std::size_t current = in_flight_->load();
    do {
        if (current >= max_in_flight_) return false;
    } while (!in_flight_->compare_exchange_weak(current, current + 1));
    return true;
}

PaymentOutcome PaymentCaller::charge(const ChargeRequest& request) {
    if (!gateway_) {
        return PaymentOutcome::failure("no payment gateway configured");
    }
    if (!acquire_slot()) {
        SHOWSEAT_WARN("payment: " << max_in_flight_ << " charges still outstanding, refusing key "
                      << request.idempotency_key);
        return PaymentOutcome::failure("payment gateway saturated");
    }

    auto promise = std::make_shared<std::promise<PaymentOutcome>>();
    std::future<PaymentOutcome> result = promise->get_future();

    std::thread([gateway = gateway_, request, promise, in_flight = in_flight_]() {
        PaymentOutcome outcome;
        try {
            outcome = gateway->charge(request);
        } catch (const std::exception& e) {
            SHOWSEAT_WARN("payment: gateway threw for key " << request.idempotency_key << ": " << e.what());
            outcome = PaymentOutcome::failure(std::string("gateway error: ") + e.what());
        } catch (...) {
            SHOWSEAT_WARN("payment: gateway threw a non-standard exception for key " << request.idempotency_key);
            outcome = PaymentOutcome::failure("gateway error: unknown exception");
        }
        // Slot first, so a caller that sees the result also sees the slot free.
        in_flight->fetch_sub(1);
        promise->set_value(std::move(outcome));
    }).detach();

    if (result.wait_for(timeout_) != std::future_status::ready) {
        SHOWSEAT_WARN("payment: no answer within " << timeout_.count() << "ms for key " << request.idempotency_key);
        return PaymentOutcome::timeout();
    }
    return result.get();
}

const char* to_string(PaymentOutcomeKind kind) {
    switch (kind) {
        case PaymentOutcomeKind::Success: return "success";
        case PaymentOutcomeKind::Failure: return "failure";
        case PaymentOutcomeKind::Timeout: return "timeout";
    }
    return "unknown";
}

} // namespace showseat
