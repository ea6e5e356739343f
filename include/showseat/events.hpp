#pragma once

#include "showseat/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace showseat {

enum class EventType : std::uint8_t {
    SeatsHeld,         // Available -> Held
    SeatsReleased,     // Held -> Available (failure, explicit release, expiry)
    SeatsBooked,       // Held -> Booked
    BookingCancelled,  // Booked -> Available, carries the refund
    RefundRequired     // money moved without a booking; settlement must refund/void it
};

struct SeatEvent final {
    EventType type{EventType::SeatsHeld};
    ShowId show_id{};
    std::vector<SeatId> seat_ids;
    std::optional<BookingId> booking_id;
    std::optional<HoldToken> hold_token;
    std::optional<Money> amount;             // refund amount for BookingCancelled / RefundRequired
    std::string reason;                      // e.g. "expired", "payment declined"
    std::string reference;                   // booking code, or payment idempotency key for refunds
    TimePoint ts{};
};

const char* to_string(EventType type);

// Wire shape handed to observers outside the process (notification outbox).
void to_json(nlohmann::json& j, const SeatEvent& e);

} // namespace showseat
