#pragma once

#include "showseat/events.hpp"

namespace showseat {

// Interface for event publishing. Components emit seat-state changes through
// it without knowing who listens.
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    // Must not block and must not throw: a failed publish never affects the
    // transition that produced the event. Returns false if the event was dropped.
    virtual bool publish(const SeatEvent& event) = 0;
};

class NullEventPublisher final : public IEventPublisher {
public:
    bool publish(const SeatEvent&) override { return true; }
};

} // namespace showseat
