#include "showseat/events.hpp"

#include <nlohmann/json.hpp>

#include <chrono>

namespace showseat {

const char* to_string(EventType type) {
    switch (type) {
        case EventType::SeatsHeld: return "SeatsHeld";
        case EventType::SeatsReleased: return "SeatsReleased";
        case EventType::SeatsBooked: return "SeatsBooked";
        case EventType::BookingCancelled: return "BookingCancelled";
        case EventType::RefundRequired: return "RefundRequired";
    }
    return "Unknown";
}

void to_json(nlohmann::json& j, const SeatEvent& e) {
    j = nlohmann::json{
        {"eventType", to_string(e.type)},
        {"showId", e.show_id},
        {"seatIds", e.seat_ids},
        {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(e.ts.time_since_epoch()).count()}
    };
    if (e.booking_id) j["bookingId"] = *e.booking_id;
    if (e.hold_token) j["holdToken"] = *e.hold_token;
    if (e.amount) j["amount"] = *e.amount;
    if (!e.reason.empty()) j["reason"] = e.reason;
    if (!e.reference.empty()) j["reference"] = e.reference;
}

} // namespace showseat
