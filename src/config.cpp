#include "showseat/config.hpp"
#include "showseat/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace showseat {

namespace {

template <typename T>
T read_or(const nlohmann::json& j, const char* key, T fallback) {
    if (!j.contains(key)) return fallback;
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

// Counts are read signed so that a negative value is rejected instead of
// wrapping around in size_t.
std::size_t read_count_or(const nlohmann::json& j, const char* key, std::size_t fallback) {
    const long long v = read_or<long long>(j, key, static_cast<long long>(fallback));
    if (v < 1) {
        throw ConfigError(std::string("Invalid value for '") + key + "': must be at least 1");
    }
    return static_cast<std::size_t>(v);
}

EngineConfig from_json_document(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Engine config must be a JSON object");
    }

    EngineConfig cfg;
    cfg.hold_window = std::chrono::seconds(
        read_or<long long>(j, "hold_window_seconds", cfg.hold_window.count()));
    cfg.sweep_interval = std::chrono::milliseconds(
        read_or<long long>(j, "sweep_interval_ms",
                           read_or<long long>(j, "sweep_interval_seconds",
                                              cfg.sweep_interval.count() / 1000) * 1000));
    cfg.payment_timeout = std::chrono::milliseconds(
        read_or<long long>(j, "payment_timeout_ms",
                           read_or<long long>(j, "payment_timeout_seconds",
                                              cfg.payment_timeout.count() / 1000) * 1000));
    cfg.cancellation_cutoff = std::chrono::minutes(
        read_or<long long>(j, "cancellation_cutoff_minutes", cfg.cancellation_cutoff.count()));
    cfg.allow_hold_extension = read_or<bool>(j, "allow_hold_extension", cfg.allow_hold_extension);
    cfg.max_hold_window = std::chrono::seconds(
        read_or<long long>(j, "max_hold_window_seconds", cfg.max_hold_window.count()));
    cfg.convenience_fee_per_seat = read_or<Money>(j, "convenience_fee_per_seat", cfg.convenience_fee_per_seat);
    cfg.event_queue_capacity = read_count_or(j, "event_queue_capacity", cfg.event_queue_capacity);
    cfg.max_seats_per_hold = read_count_or(j, "max_seats_per_hold", cfg.max_seats_per_hold);
    cfg.max_charges_in_flight = read_count_or(j, "max_charges_in_flight", cfg.max_charges_in_flight);
    cfg.journal_capacity = read_count_or(j, "journal_capacity", cfg.journal_capacity);

    if (j.contains("refund_tiers")) {
        const auto& tiers = j.at("refund_tiers");
        if (!tiers.is_array()) {
            throw ConfigError("'refund_tiers' must be an array");
        }
        cfg.refund_tiers.clear();
        for (const auto& t : tiers) {
            RefundTier tier;
            tier.min_lead = std::chrono::minutes(
                read_or<long long>(t, "min_minutes_before_show",
                                   read_or<long long>(t, "min_hours_before_show", 0) * 60));
            tier.percent = read_or<int>(t, "percent", 0);
            cfg.refund_tiers.push_back(tier);
        }
    }

    if (j.contains("promo_codes")) {
        const auto& promos = j.at("promo_codes");
        if (!promos.is_object()) {
            throw ConfigError("'promo_codes' must be an object of code -> percent");
        }
        for (auto it = promos.begin(); it != promos.end(); ++it) {
            if (!it.value().is_number_integer()) {
                throw ConfigError("Promo code '" + it.key() + "' must map to an integer percent");
            }
            cfg.promo_codes[it.key()] = it.value().get<int>();
        }
    }

    validate_config(cfg);
    return cfg;
}

} // namespace

void validate_config(EngineConfig& cfg) {
    if (cfg.hold_window.count() <= 0) throw ConfigError("hold window must be positive");
    if (cfg.sweep_interval.count() <= 0) throw ConfigError("sweep interval must be positive");
    if (cfg.payment_timeout.count() <= 0) throw ConfigError("payment timeout must be positive");
    if (cfg.cancellation_cutoff.count() < 0) throw ConfigError("cancellation cutoff must not be negative");
    if (cfg.max_hold_window < cfg.hold_window) throw ConfigError("max hold window is shorter than the hold window");
    if (cfg.convenience_fee_per_seat < 0) throw ConfigError("convenience fee must not be negative");
    if (cfg.event_queue_capacity == 0) throw ConfigError("event queue capacity must be positive");
    if (cfg.max_seats_per_hold == 0) throw ConfigError("max seats per hold must be positive");
    if (cfg.max_charges_in_flight == 0) throw ConfigError("max charges in flight must be positive");
    if (cfg.journal_capacity == 0) throw ConfigError("journal capacity must be positive");

    for (const auto& promo : cfg.promo_codes) {
        if (promo.second < 0 || promo.second > 100) {
            throw ConfigError("Promo code '" + promo.first + "' percent out of range");
        }
    }

    validate_refund_tiers(cfg.cancellation_cutoff, cfg.refund_tiers);
}

void validate_refund_tiers(std::chrono::minutes cutoff, std::vector<RefundTier>& tiers) {
    std::sort(tiers.begin(), tiers.end(),
              [](const RefundTier& a, const RefundTier& b) { return a.min_lead > b.min_lead; });

    for (std::size_t i = 0; i < tiers.size(); ++i) {
        const RefundTier& t = tiers[i];
        if (t.percent < 0 || t.percent > 100) {
            throw ConfigError("refund tier percent out of range");
        }
        if (t.min_lead < cutoff) {
            throw ConfigError("refund tier lead is inside the cancellation cutoff");
        }
        // Earlier cancellation must never refund less than a later one.
        if (i > 0 && t.percent > tiers[i - 1].percent) {
            throw ConfigError("refund tiers are not monotone");
        }
        if (i > 0 && t.min_lead == tiers[i - 1].min_lead) {
            throw ConfigError("duplicate refund tier lead time");
        }
    }
}

EngineConfig parse_engine_config(const std::string& json_text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Failed to parse engine config: " + std::string(e.what()));
    }
    return from_json_document(j);
}

EngineConfig load_engine_config(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw ConfigError("Cannot open engine config: " + path);
    }
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return parse_engine_config(oss.str());
}

} // namespace showseat
