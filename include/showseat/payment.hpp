#pragma once

#include "showseat/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace showseat {

/**
 * @brief Closed set of payment outcomes. The orchestrator switches on it
 * exhaustively; there is no "unknown" case to mis-handle.
 */
enum class PaymentOutcomeKind : std::uint8_t { Success, Failure, Timeout };

struct ChargeRequest {
    Money amount{0};
    std::string method;           /**< Opaque payment method reference (card token, wallet id, ...). */
    std::string idempotency_key;  /**< Same key => the gateway applies the charge at most once. */
};

struct PaymentOutcome {
    PaymentOutcomeKind kind{PaymentOutcomeKind::Failure};
    std::string transaction_id;   /**< Set on Success. */
    std::string reason;           /**< Set on Failure / Timeout. */

    static PaymentOutcome success(std::string transaction_id) {
        return PaymentOutcome{PaymentOutcomeKind::Success, std::move(transaction_id), {}};
    }
    static PaymentOutcome failure(std::string reason) {
        return PaymentOutcome{PaymentOutcomeKind::Failure, {}, std::move(reason)};
    }
    static PaymentOutcome timeout() {
        return PaymentOutcome{PaymentOutcomeKind::Timeout, {}, "payment timed out"};
    }
};

/**
 * @brief Contract the engine expects from the payment collaborator.
 *
 * Implementations must honour the idempotency key: a repeated request with a
 * key that already succeeded returns the original transaction instead of
 * charging again.
 */
class IPaymentGateway {
public:
    virtual ~IPaymentGateway() = default;
    virtual PaymentOutcome charge(const ChargeRequest& request) = 0;
};

/**
 * @brief Calls the gateway with a hard upper bound on the wait.
 *
 * @details
 * Each call runs on its own detached thread; if it has not returned within
 * the timeout the result is PaymentOutcomeKind::Timeout and the thread is left
 * to finish in the background (it keeps the gateway alive through its
 * shared_ptr). A hung gateway therefore costs one thread per timed-out call:
 * at most @p max_in_flight such threads may exist at once, and further calls
 * fail immediately with "payment gateway saturated" without reaching the
 * gateway. Any exception thrown by the gateway becomes a Failure outcome.
 *
 * Thread-safe; one instance is shared by all request threads.
 */
class PaymentCaller {
public:
    PaymentCaller(std::shared_ptr<IPaymentGateway> gateway,
                  std::chrono::milliseconds timeout,
                  std::size_t max_in_flight);

    PaymentOutcome charge(const ChargeRequest& request);

    /** @brief Gateway calls that have not returned yet, timed out or not. */
    std::size_t in_flight() const { return in_flight_->load(); }

private:
    bool acquire_slot();

    std::shared_ptr<IPaymentGateway> gateway_;
    const std::chrono::milliseconds timeout_;
    const std::size_t max_in_flight_;
    // Shared with the charge threads, which may outlive this object.
    std::shared_ptr<std::atomic<std::size_t>> in_flight_;
};

const char* to_string(PaymentOutcomeKind kind);

} // namespace showseat
