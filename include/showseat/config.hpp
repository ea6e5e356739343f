#pragma once

#include "showseat/types.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

/**
 * @file config.hpp
 * @brief Engine policy values and their JSON loader.
 *
 * Every value has a default matching the house policy (10 minute holds,
 * 30 second sweeps, 30 second payment bound, 2 hour cancellation cutoff).
 * A JSON file only needs to name the keys it overrides, e.g.:
 *
 * @code{.json}
 * {
 *   "hold_window_seconds": 600,
 *   "sweep_interval_seconds": 30,
 *   "payment_timeout_seconds": 30,
 *   "cancellation_cutoff_minutes": 120,
 *   "convenience_fee_per_seat": 150,
 *   "refund_tiers": [ {"min_hours_before_show": 24, "percent": 100},
 *                     {"min_hours_before_show": 2,  "percent": 50} ],
 *   "promo_codes": { "WELCOME10": 10 },
 *   "max_seats_per_hold": 10,
 *   "event_queue_capacity": 4096,
 *   "max_charges_in_flight": 64,
 *   "journal_capacity": 100000
 * }
 * @endcode
 */

namespace showseat {

/**
 * @brief One refund tier: cancelling at least @ref min_lead before the show
 * refunds @ref percent of the final amount.
 */
struct RefundTier {
    std::chrono::minutes min_lead{0};
    int percent{0};
};

struct EngineConfig {
    std::chrono::seconds hold_window{std::chrono::minutes(10)};
    std::chrono::milliseconds sweep_interval{std::chrono::seconds(30)};
    std::chrono::milliseconds payment_timeout{std::chrono::seconds(30)};
    std::chrono::minutes cancellation_cutoff{std::chrono::hours(2)};

    bool allow_hold_extension{false};
    std::chrono::seconds max_hold_window{std::chrono::minutes(15)};

    Money convenience_fee_per_seat{0};

    /** Sorted by min_lead, longest lead first. */
    std::vector<RefundTier> refund_tiers{
        {std::chrono::hours(24), 100},
        {std::chrono::hours(2), 50},
    };

    /** Promo code -> percentage discount on the subtotal. */
    std::map<std::string, int> promo_codes;

    std::size_t event_queue_capacity{4096};
    std::size_t max_seats_per_hold{10};

    /** Charge threads that may still be running after their request timed out. */
    std::size_t max_charges_in_flight{64};

    /** Seat-state transitions kept in memory before the oldest are dropped. */
    std::size_t journal_capacity{100000};
};

/**
 * @brief Sorts refund tiers longest lead first and checks them.
 *
 * @throws ConfigError if a percentage is outside [0, 100], a tier applies
 *         inside @p cutoff, two tiers share a lead time, or a longer lead
 *         refunds less than a shorter one.
 */
void validate_refund_tiers(std::chrono::minutes cutoff, std::vector<RefundTier>& tiers);

/**
 * @brief Checks internal consistency of a config and sorts its refund tiers.
 *
 * @throws ConfigError if a duration or a count is non-positive, a percentage is outside
 *         [0, 100], refund tiers are not monotone (a longer lead must never
 *         refund less), or the hold window exceeds max_hold_window.
 */
void validate_config(EngineConfig& cfg);

/**
 * @brief Loads an EngineConfig from a JSON file. Missing keys keep defaults.
 *
 * @throws ConfigError if the file cannot be opened, cannot be parsed, has
 *         values of the wrong type, or fails @ref validate_config.
 */
EngineConfig load_engine_config(const std::string& path);

/** @brief Same as @ref load_engine_config but from an in-memory JSON document. */
EngineConfig parse_engine_config(const std::string& json_text);

} // namespace showseat
