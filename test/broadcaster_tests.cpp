#include <gtest/gtest.h>

#include "showseat/broadcaster.hpp"
#include "showseat/notification_outbox.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <stdexcept>
#include <thread>
#include <vector>

using showseat::AvailabilityBroadcaster;
using showseat::EventType;
using showseat::NotificationOutbox;
using showseat::SeatEvent;

// ---------- Helpers ----------
static SeatEvent make_event(EventType type, showseat::ShowId show, std::vector<showseat::SeatId> seats) {
    SeatEvent e;
    e.type = type;
    e.show_id = show;
    e.seat_ids = std::move(seats);
    e.ts = showseat::TimePoint(std::chrono::milliseconds(1767225600000LL));
    return e;
}

// ---------- Tests: subscriptions ----------
TEST(Broadcaster, DeliversOnlyToSubscribersOfTheShow) {
    AvailabilityBroadcaster b;
    int show1 = 0, show2 = 0, all = 0;
    b.subscribe(1, [&](const SeatEvent&) { ++show1; });
    b.subscribe(2, [&](const SeatEvent&) { ++show2; });
    b.subscribe_all([&](const SeatEvent&) { ++all; });

    b.publish(make_event(EventType::SeatsHeld, 1, {1}));
    b.publish(make_event(EventType::SeatsReleased, 1, {1}));
    b.publish(make_event(EventType::SeatsHeld, 3, {1}));

    EXPECT_EQ(b.pending(), 3u);
    EXPECT_EQ(b.process_events(), 3u);
    EXPECT_EQ(show1, 2);
    EXPECT_EQ(show2, 0);
    EXPECT_EQ(all, 3);
    EXPECT_EQ(b.pending(), 0u);
}

TEST(Broadcaster, PreservesPublishOrder) {
    AvailabilityBroadcaster b;
    std::vector<EventType> seen;
    b.subscribe(1, [&](const SeatEvent& e) { seen.push_back(e.type); });

    b.publish(make_event(EventType::SeatsHeld, 1, {1}));
    b.publish(make_event(EventType::SeatsBooked, 1, {1}));
    b.publish(make_event(EventType::BookingCancelled, 1, {1}));
    b.process_events();

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], EventType::SeatsHeld);
    EXPECT_EQ(seen[1], EventType::SeatsBooked);
    EXPECT_EQ(seen[2], EventType::BookingCancelled);
}

TEST(Broadcaster, UnsubscribeStopsDelivery) {
    AvailabilityBroadcaster b;
    int calls = 0;
    auto id = b.subscribe(1, [&](const SeatEvent&) { ++calls; });

    EXPECT_TRUE(b.unsubscribe(id));
    EXPECT_FALSE(b.unsubscribe(id));

    b.publish(make_event(EventType::SeatsHeld, 1, {1}));
    b.process_events();
    EXPECT_EQ(calls, 0);
}

// ---------- Tests: failure isolation ----------
TEST(Broadcaster, ThrowingObserverDoesNotAffectOthers) {
    AvailabilityBroadcaster b;
    int healthy = 0;
    b.subscribe(1, [](const SeatEvent&) { throw std::runtime_error("socket closed"); });
    b.subscribe(1, [&](const SeatEvent&) { ++healthy; });

    EXPECT_TRUE(b.publish(make_event(EventType::SeatsHeld, 1, {1})));
    EXPECT_NO_THROW(b.process_events());
    EXPECT_EQ(healthy, 1);
    EXPECT_EQ(b.observer_failures(), 1u);
}

TEST(Broadcaster, FullQueueDropsAndCounts) {
    AvailabilityBroadcaster b(2);
    EXPECT_TRUE(b.publish(make_event(EventType::SeatsHeld, 1, {1})));
    EXPECT_TRUE(b.publish(make_event(EventType::SeatsHeld, 1, {2})));
    EXPECT_FALSE(b.publish(make_event(EventType::SeatsHeld, 1, {3})));

    EXPECT_EQ(b.dropped_count(), 1u);
    EXPECT_EQ(b.pending(), 2u);
}

// ---------- Tests: dispatcher thread ----------
TEST(Broadcaster, DispatcherDeliversInBackground) {
    AvailabilityBroadcaster b;
    std::atomic<int> delivered{0};
    b.subscribe(1, [&](const SeatEvent&) { delivered.fetch_add(1); });

    b.start();
    EXPECT_TRUE(b.is_running());
    for (int i = 0; i < 50; ++i) {
        b.publish(make_event(EventType::SeatsHeld, 1, {static_cast<showseat::SeatId>(i)}));
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (delivered.load() < 50 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    b.stop();

    EXPECT_FALSE(b.is_running());
    EXPECT_EQ(delivered.load(), 50);
}

TEST(Broadcaster, StopFlushesQueuedEvents) {
    AvailabilityBroadcaster b;
    int delivered = 0;
    b.subscribe(1, [&](const SeatEvent&) { ++delivered; });

    b.start();
    b.stop();
    b.publish(make_event(EventType::SeatsHeld, 1, {1}));
    b.start();
    b.stop();

    EXPECT_EQ(delivered, 1);
}

// ---------- Tests: wire shape ----------
TEST(SeatEventJson, CarriesRequiredAndOptionalFields) {
    SeatEvent e = make_event(EventType::RefundRequired, 4, {2, 3});
    e.booking_id = 17;
    e.amount = 2500;
    e.reference = "hold-000000000000002a";

    const nlohmann::json j = e;
    EXPECT_EQ(j.at("eventType").get<std::string>(), "RefundRequired");
    EXPECT_EQ(j.at("showId").get<showseat::ShowId>(), 4u);
    EXPECT_EQ(j.at("seatIds").get<std::vector<showseat::SeatId>>(), std::vector<showseat::SeatId>({2, 3}));
    EXPECT_EQ(j.at("timestamp").get<long long>(), 1767225600000LL);
    EXPECT_EQ(j.at("bookingId").get<showseat::BookingId>(), 17u);
    EXPECT_EQ(j.at("amount").get<showseat::Money>(), 2500);
    EXPECT_EQ(j.at("reference").get<std::string>(), "hold-000000000000002a");
    EXPECT_FALSE(j.contains("holdToken"));
    EXPECT_FALSE(j.contains("reason"));
}

// ---------- Tests: notification outbox ----------
TEST(Outbox, KeepsOnlyCustomerFacingEvents) {
    AvailabilityBroadcaster b;
    NotificationOutbox outbox;
    outbox.attach(b);

    b.publish(make_event(EventType::SeatsHeld, 1, {1}));
    b.publish(make_event(EventType::SeatsBooked, 1, {1}));
    b.publish(make_event(EventType::SeatsReleased, 1, {2}));
    b.publish(make_event(EventType::RefundRequired, 1, {2}));
    b.publish(make_event(EventType::BookingCancelled, 1, {1}));
    b.process_events();

    auto docs = outbox.drain();
    ASSERT_EQ(docs.size(), 3u);
    EXPECT_EQ(docs[0]["eventType"].get<std::string>(), "SeatsBooked");
    EXPECT_EQ(docs[1]["eventType"].get<std::string>(), "RefundRequired");
    EXPECT_EQ(docs[2]["eventType"].get<std::string>(), "BookingCancelled");
    EXPECT_EQ(outbox.size(), 0u);
}

TEST(Outbox, OverflowDiscardsOldest) {
    NotificationOutbox outbox(2);
    for (showseat::SeatId s = 0; s < 3; ++s) {
        outbox.on_event(make_event(EventType::SeatsBooked, 1, {s}));
    }

    auto docs = outbox.drain();
    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(docs[0]["seatIds"][0].get<showseat::SeatId>(), 1u);
    EXPECT_EQ(docs[1]["seatIds"][0].get<showseat::SeatId>(), 2u);
}

TEST(Outbox, DetachesOnDestruction) {
    AvailabilityBroadcaster b;
    {
        NotificationOutbox outbox;
        outbox.attach(b);
    }
    b.publish(make_event(EventType::SeatsBooked, 1, {1}));
    EXPECT_NO_THROW(b.process_events());
    EXPECT_EQ(b.observer_failures(), 0u);
}
