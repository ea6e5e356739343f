#include "showseat/types.hpp"

#include <algorithm>
#include <cctype>

namespace showseat {

const char* to_string(SeatTier tier) {
    switch (tier) {
        case SeatTier::Standard: return "standard";
        case SeatTier::Premium: return "premium";
        case SeatTier::Recliner: return "recliner";
    }
    return "unknown";
}

const char* to_string(SeatState state) {
    switch (state) {
        case SeatState::Available: return "available";
        case SeatState::Held: return "held";
        case SeatState::Booked: return "booked";
    }
    return "unknown";
}

const char* to_string(BookingStatus status) {
    switch (status) {
        case BookingStatus::Pending: return "pending";
        case BookingStatus::Confirmed: return "confirmed";
        case BookingStatus::Cancelled: return "cancelled";
        case BookingStatus::Expired: return "expired";
    }
    return "unknown";
}

bool try_parse_seat_tier(const std::string& text, SeatTier& out_tier) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "standard") {
        out_tier = SeatTier::Standard;
    } else if (lower == "premium") {
        out_tier = SeatTier::Premium;
    } else if (lower == "recliner") {
        out_tier = SeatTier::Recliner;
    } else {
        return false;
    }
    return true;
}

} // namespace showseat
