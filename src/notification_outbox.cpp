#include "showseat/notification_outbox.hpp"
#include "showseat/log.hpp"

#include <iterator>

namespace showseat {

NotificationOutbox::NotificationOutbox(std::size_t capacity) : capacity_(capacity) {}

NotificationOutbox::~NotificationOutbox() {
    if (broadcaster_) {
        broadcaster_->unsubscribe(subscription_);
    }
}

void NotificationOutbox::attach(AvailabilityBroadcaster& broadcaster) {
    broadcaster_ = &broadcaster;
    subscription_ = broadcaster.subscribe_all([this](const SeatEvent& e) { on_event(e); });
}

void NotificationOutbox::on_event(const SeatEvent& event) {
    switch (event.type) {
        case EventType::SeatsBooked:
        case EventType::BookingCancelled:
        case EventType::RefundRequired:
            break;
        case EventType::SeatsHeld:
        case EventType::SeatsReleased:
            return;
    }

    nlohmann::json doc = event;
    std::lock_guard<std::mutex> g(mutex_);
    if (queue_.size() >= capacity_) {
        // Oldest notification goes first; refunds are also carried on the booking record.
        SHOWSEAT_WARN("outbox: full, discarding oldest " << queue_.front().value("eventType", std::string("?")));
        queue_.pop_front();
    }
    queue_.push_back(std::move(doc));
}

std::vector<nlohmann::json> NotificationOutbox::drain() {
    std::lock_guard<std::mutex> g(mutex_);
    std::vector<nlohmann::json> out(std::make_move_iterator(queue_.begin()),
                                    std::make_move_iterator(queue_.end()));
    queue_.clear();
    return out;
}

std::size_t NotificationOutbox::size() const {
    std::lock_guard<std::mutex> g(mutex_);
    return queue_.size();
}

} // namespace showseat
