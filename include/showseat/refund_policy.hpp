#pragma once

#include "showseat/config.hpp"
#include "showseat/types.hpp"

#include <chrono>
#include <vector>

namespace showseat {

struct RefundDecision {
    bool allowed{false};  /**< False: inside the cancellation cutoff (TooLateToCancel). */
    int percent{0};
    Money refund{0};
};

/**
 * @brief Pure refund computation from (final amount, time to show, tiers).
 *
 * The first tier whose lead time is covered wins; tiers are validated to be
 * monotone, so cancelling earlier never refunds less than cancelling later.
 * Between the cutoff and the shortest tier the refund is zero but the
 * cancellation is still allowed.
 */
class RefundPolicy {
public:
    /** @throws ConfigError if the tiers fail validate_refund_tiers(). */
    RefundPolicy(std::chrono::minutes cutoff, std::vector<RefundTier> tiers);
    explicit RefundPolicy(const EngineConfig& config);

    RefundDecision evaluate(Money final_amount, Duration time_to_show) const;

    std::chrono::minutes cutoff() const { return cutoff_; }

private:
    std::chrono::minutes cutoff_;
    std::vector<RefundTier> tiers_;  // longest lead first
};

/** @brief Free-function form of RefundPolicy::evaluate(). */
inline RefundDecision compute_refund(Money final_amount, Duration time_to_show, const RefundPolicy& policy) {
    return policy.evaluate(final_amount, time_to_show);
}

} // namespace showseat
