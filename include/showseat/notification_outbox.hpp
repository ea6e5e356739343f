#pragma once

#include "showseat/broadcaster.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace showseat {

/**
 * @brief Queue of notification documents for the email/SMS and settlement
 * collaborators.
 *
 * Keeps SeatsBooked, BookingCancelled and RefundRequired events as JSON.
 * The collaborator drains it on its own schedule; a failed or slow drain
 * never reaches back into the booking path.
 */
class NotificationOutbox {
public:
    explicit NotificationOutbox(std::size_t capacity = 10000);
    ~NotificationOutbox();

    NotificationOutbox(const NotificationOutbox&) = delete;
    NotificationOutbox& operator=(const NotificationOutbox&) = delete;

    /** @brief Subscribes to every show on @p broadcaster. Call once. */
    void attach(AvailabilityBroadcaster& broadcaster);

    /** @brief Observer entry point; ignores event types nobody is notified about. */
    void on_event(const SeatEvent& event);

    /** @brief Removes and returns every queued document, oldest first. */
    std::vector<nlohmann::json> drain();

    std::size_t size() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<nlohmann::json> queue_;

    AvailabilityBroadcaster* broadcaster_{nullptr};
    AvailabilityBroadcaster::SubscriptionId subscription_{0};
};

} // namespace showseat
