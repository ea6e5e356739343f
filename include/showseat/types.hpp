#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @file types.hpp
 * @brief Domain types shared by every component of the seat booking engine.
 *
 * This header defines:
 * - identifier aliases (shows, screens, seats, holds, bookings)
 * - Money (integer minor units) and the wall-clock TimePoint
 * - Seat, Screen and Show as supplied by the catalog collaborator
 * - the per-(show, seat) SeatState and the Booking status enum
 */

namespace showseat {

using ShowId = std::uint32_t;
using ScreenId = std::uint32_t;

/**
 * @brief Zero-based seat index within a screen.
 *
 * Seats are shared by every show on the same screen, so a (ShowId, SeatId)
 * pair addresses exactly one inventory slot.
 */
using SeatId = std::uint32_t;

using HoldToken = std::uint64_t;
using BookingId = std::uint64_t;

/** @brief Opaque identifier of the customer (or admin) acting on the engine. */
using ActorId = std::string;

/**
 * @brief Money in minor units (cents).
 *
 * Fixed precision on purpose: prices, fees, discounts and refunds never touch
 * floating point.
 */
using Money = std::int64_t;

using WallClock = std::chrono::system_clock;
using TimePoint = WallClock::time_point;
using Duration = std::chrono::milliseconds;

/** @brief Seat tier; each tier carries its own price delta on the Seat. */
enum class SeatTier : std::uint8_t { Standard = 0, Premium = 1, Recliner = 2 };

/**
 * @brief Authoritative per-(show, seat) status.
 *
 * At most one non-Available state exists for a given (show, seat) at any
 * instant.
 */
enum class SeatState : std::uint8_t { Available = 0, Held = 1, Booked = 2 };

enum class BookingStatus : std::uint8_t { Pending = 0, Confirmed = 1, Cancelled = 2, Expired = 3 };

/**
 * @brief A physical seat on a screen. Immutable once created.
 */
struct Seat {
    SeatId id{};                        /**< Index within the screen. */
    std::string label;                  /**< Human-readable label, e.g. "A1". */
    SeatTier tier{SeatTier::Standard};  /**< Pricing tier. */
    Money price_delta{0};               /**< Added to the show's base price. */
};

/**
 * @brief A screen (auditorium) and its seat layout.
 */
struct Screen {
    ScreenId id{};
    std::string name;
    std::vector<Seat> seats;
};

/**
 * @brief A single screening.
 *
 * Read-only metadata from the engine's perspective. The available counter is
 * not stored here: it is derived from the inventory (total - booked).
 */
struct Show {
    ShowId id{};
    std::string title;        /**< Movie title, informational only. */
    ScreenId screen_id{};
    TimePoint scheduled_at{}; /**< Immutable start time. */
    Money base_price{0};
    std::uint32_t total_seats{0};
};

const char* to_string(SeatTier tier);
const char* to_string(SeatState state);
const char* to_string(BookingStatus status);

/**
 * @brief Parses a tier name ("standard", "premium", "recliner"), case-insensitive.
 * @return True on success.
 */
bool try_parse_seat_tier(const std::string& text, SeatTier& out_tier);

} // namespace showseat
