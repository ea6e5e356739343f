#include "showseat/refund_policy.hpp"
#include "showseat/errors.hpp"

namespace showseat {

RefundPolicy::RefundPolicy(std::chrono::minutes cutoff, std::vector<RefundTier> tiers)
    : cutoff_(cutoff), tiers_(std::move(tiers)) {
    if (cutoff_.count() < 0) {
        throw ConfigError("cancellation cutoff must not be negative");
    }
    validate_refund_tiers(cutoff_, tiers_);
}

RefundPolicy::RefundPolicy(const EngineConfig& config)
    : RefundPolicy(config.cancellation_cutoff, config.refund_tiers) {}

RefundDecision RefundPolicy::evaluate(Money final_amount, Duration time_to_show) const {
    RefundDecision d;
    // "More than" the cutoff: exactly at the cutoff is already too late.
    if (time_to_show <= cutoff_) {
        return d;
    }

    d.allowed = true;
    for (const auto& tier : tiers_) {
        if (time_to_show >= tier.min_lead) {
            d.percent = tier.percent;
            break;
        }
    }
    d.refund = final_amount * d.percent / 100;
    return d;
}

} // namespace showseat
