#include <gtest/gtest.h>

#include "showseat/errors.hpp"
#include "showseat/hold_manager.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using showseat::EngineConfig;
using showseat::EventType;
using showseat::HoldManager;
using showseat::HoldStatus;
using showseat::ManualClock;
using showseat::SeatId;
using showseat::SeatInventory;
using showseat::SeatState;

namespace {

constexpr showseat::ShowId kShow = 1;

struct HoldFixture {
    explicit HoldFixture(EngineConfig cfg = EngineConfig{})
        : config(cfg),
          clock(std::make_shared<ManualClock>(showseat_test::test_epoch())),
          inventory(std::make_shared<SeatInventory>(clock)),
          events(std::make_shared<showseat_test::RecordingPublisher>()),
          holds(inventory, clock, events, config) {
        inventory->add_show(kShow, 20);
    }

    EngineConfig config;
    std::shared_ptr<ManualClock> clock;
    std::shared_ptr<SeatInventory> inventory;
    std::shared_ptr<showseat_test::RecordingPublisher> events;
    HoldManager holds;
};

} // namespace

// ---------- Tests: create / release ----------
TEST(HoldCreate, HoldsSeatsForTheConfiguredWindow) {
    HoldFixture f;
    auto r = f.holds.create_hold(kShow, {1, 2}, "alice");
    ASSERT_TRUE(r.success());
    ASSERT_TRUE(r.hold.has_value());

    EXPECT_NE(r.hold->token, 0u);
    EXPECT_EQ(r.hold->expires_at - r.hold->created_at, std::chrono::seconds(600));
    EXPECT_EQ(f.inventory->seat_state(kShow, 1), SeatState::Held);
    EXPECT_EQ(f.holds.active_holds(), 1u);

    auto held = f.events->of_type(EventType::SeatsHeld);
    ASSERT_EQ(held.size(), 1u);
    EXPECT_EQ(held[0].seat_ids, std::vector<SeatId>({1, 2}));
    EXPECT_EQ(*held[0].hold_token, r.hold->token);
}

TEST(HoldCreate, TokensAreDistinct) {
    HoldFixture f;
    auto a = f.holds.create_hold(kShow, {1}, "alice");
    auto b = f.holds.create_hold(kShow, {2}, "bob");
    ASSERT_TRUE(a.success());
    ASSERT_TRUE(b.success());
    EXPECT_NE(a.hold->token, b.hold->token);
}

TEST(HoldCreate, RejectsMalformedRequests) {
    EngineConfig cfg;
    cfg.max_seats_per_hold = 2;
    HoldFixture f(cfg);

    EXPECT_EQ(f.holds.create_hold(kShow, {}, "alice").status, HoldStatus::InvalidRequest);
    EXPECT_EQ(f.holds.create_hold(kShow, {1, 2, 3}, "alice").status, HoldStatus::InvalidRequest);
    EXPECT_EQ(f.holds.create_hold(99, {1}, "alice").status, HoldStatus::InvalidRequest);
    EXPECT_EQ(f.holds.create_hold(kShow, {1, 1}, "alice").status, HoldStatus::InvalidRequest);
    EXPECT_EQ(f.holds.active_holds(), 0u);
}

TEST(HoldCreate, ConflictReportsContestedSeats) {
    HoldFixture f;
    ASSERT_TRUE(f.holds.create_hold(kShow, {1, 2}, "x").success());

    auto r = f.holds.create_hold(kShow, {2, 3}, "y");
    EXPECT_EQ(r.status, HoldStatus::Conflict);
    EXPECT_EQ(r.conflicting, std::vector<SeatId>({2}));
    EXPECT_FALSE(r.hold.has_value());
    EXPECT_EQ(f.inventory->seat_state(kShow, 3), SeatState::Available);
}

TEST(HoldRelease, ExplicitReleaseFreesSeats) {
    HoldFixture f;
    auto h = f.holds.create_hold(kShow, {1, 2}, "alice");
    ASSERT_TRUE(h.success());

    ASSERT_TRUE(f.holds.release_hold(h.hold->token).success());
    EXPECT_EQ(f.inventory->seat_state(kShow, 1), SeatState::Available);
    EXPECT_EQ(f.holds.release_hold(h.hold->token).status, HoldStatus::NotFound);

    auto released = f.events->of_type(EventType::SeatsReleased);
    ASSERT_EQ(released.size(), 1u);
    EXPECT_EQ(released[0].reason, "released");
}

TEST(HoldRelease, RefusedWhilePaymentInFlight) {
    HoldFixture f;
    auto h = f.holds.create_hold(kShow, {1}, "alice");
    ASSERT_TRUE(f.holds.claim_for_payment(h.hold->token).success());

    EXPECT_EQ(f.holds.release_hold(h.hold->token).status, HoldStatus::PaymentInProgress);
    EXPECT_EQ(f.inventory->seat_state(kShow, 1), SeatState::Held);
}

// ---------- Tests: expiry ----------
TEST(HoldExpiry, SweepReleasesOnlyElapsedHolds) {
    HoldFixture f;
    auto early = f.holds.create_hold(kShow, {1}, "alice");
    f.clock->advance(std::chrono::minutes(5));
    auto late = f.holds.create_hold(kShow, {2}, "bob");

    f.clock->advance(std::chrono::minutes(5)); // early: exactly at expiry
    EXPECT_EQ(f.holds.sweep_expired(), 1u);

    EXPECT_EQ(f.inventory->seat_state(kShow, 1), SeatState::Available);
    EXPECT_EQ(f.inventory->seat_state(kShow, 2), SeatState::Held);
    EXPECT_FALSE(f.holds.find_hold(early.hold->token).has_value());
    EXPECT_TRUE(f.holds.find_hold(late.hold->token).has_value());

    // Second sweep over the same instant is a no-op.
    EXPECT_EQ(f.holds.sweep_expired(), 0u);

    auto released = f.events->of_type(EventType::SeatsReleased);
    ASSERT_EQ(released.size(), 1u);
    EXPECT_EQ(released[0].reason, "expired");
}

TEST(HoldExpiry, SeatIsBookableAgainAfterSweep) {
    HoldFixture f;
    ASSERT_TRUE(f.holds.create_hold(kShow, {4}, "alice").success());
    EXPECT_EQ(f.holds.create_hold(kShow, {4}, "bob").status, HoldStatus::Conflict);

    f.clock->advance(std::chrono::minutes(11));
    f.holds.sweep_expired();

    EXPECT_TRUE(f.holds.create_hold(kShow, {4}, "bob").success());
}

TEST(HoldExpiry, SweepRunsOnBackgroundThread) {
    EngineConfig cfg;
    cfg.sweep_interval = std::chrono::milliseconds(10);
    HoldFixture f(cfg);

    ASSERT_TRUE(f.holds.create_hold(kShow, {1}, "alice").success());
    f.clock->advance(std::chrono::minutes(10));

    f.holds.start();
    EXPECT_TRUE(f.holds.is_running());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (f.inventory->seat_state(kShow, 1) != SeatState::Available &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    f.holds.stop();

    EXPECT_FALSE(f.holds.is_running());
    EXPECT_EQ(f.inventory->seat_state(kShow, 1), SeatState::Available);
    EXPECT_EQ(f.holds.active_holds(), 0u);
}

TEST(HoldExpiry, StorageFaultDuringSweepIsRetriedNextPass) {
    HoldFixture f;
    auto h = f.holds.create_hold(kShow, {1}, "alice");
    f.clock->advance(std::chrono::minutes(10));

    f.inventory->set_fault_hook([](showseat::ShowId, SeatId, SeatState) {
        throw std::runtime_error("storage offline");
    });
    EXPECT_EQ(f.holds.sweep_expired(), 0u);
    EXPECT_EQ(f.inventory->seat_state(kShow, 1), SeatState::Held);
    EXPECT_TRUE(f.holds.find_hold(h.hold->token).has_value());

    f.inventory->set_fault_hook(nullptr);
    EXPECT_EQ(f.holds.sweep_expired(), 1u);
    EXPECT_EQ(f.inventory->seat_state(kShow, 1), SeatState::Available);
}

// ---------- Tests: extension ----------
TEST(HoldExtend, DisabledByDefault) {
    HoldFixture f;
    auto h = f.holds.create_hold(kShow, {1}, "alice");
    EXPECT_EQ(f.holds.extend_hold(h.hold->token, std::chrono::seconds(60)).status,
              HoldStatus::ExtensionNotAllowed);
}

TEST(HoldExtend, CappedAtMaximumWindow) {
    EngineConfig cfg;
    cfg.allow_hold_extension = true;
    cfg.max_hold_window = std::chrono::minutes(15);
    HoldFixture f(cfg);

    auto h = f.holds.create_hold(kShow, {1}, "alice");
    auto r = f.holds.extend_hold(h.hold->token, std::chrono::minutes(30));
    ASSERT_TRUE(r.success());
    EXPECT_EQ(r.hold->expires_at, h.hold->created_at + std::chrono::minutes(15));

    EXPECT_EQ(f.holds.extend_hold(h.hold->token, std::chrono::seconds(1)).status,
              HoldStatus::ExtensionNotAllowed);

    // The extended deadline is what the sweep honours.
    f.clock->advance(std::chrono::minutes(12));
    EXPECT_EQ(f.holds.sweep_expired(), 0u);
    f.clock->advance(std::chrono::minutes(3));
    EXPECT_EQ(f.holds.sweep_expired(), 1u);
}

// ---------- Tests: orchestrator hooks ----------
TEST(HoldClaim, SecondClaimSeesPaymentInProgress) {
    HoldFixture f;
    auto h = f.holds.create_hold(kShow, {1}, "alice");

    EXPECT_TRUE(f.holds.claim_for_payment(h.hold->token).success());
    EXPECT_EQ(f.holds.claim_for_payment(h.hold->token).status, HoldStatus::PaymentInProgress);
}

TEST(HoldClaim, ExpiredHoldIsReleasedOnClaim) {
    HoldFixture f;
    auto h = f.holds.create_hold(kShow, {1}, "alice");
    f.clock->advance(std::chrono::minutes(10));

    EXPECT_EQ(f.holds.claim_for_payment(h.hold->token).status, HoldStatus::Expired);
    EXPECT_EQ(f.inventory->seat_state(kShow, 1), SeatState::Available);
}

TEST(HoldClaim, CompleteAfterExpiryReportsExpired) {
    HoldFixture f;
    auto h = f.holds.create_hold(kShow, {1}, "alice");
    ASSERT_TRUE(f.holds.claim_for_payment(h.hold->token).success());

    f.clock->advance(std::chrono::minutes(10));
    auto r = f.holds.complete(h.hold->token);
    EXPECT_EQ(r.status, HoldStatus::Expired);
    EXPECT_EQ(f.inventory->seat_state(kShow, 1), SeatState::Available);
}

TEST(HoldClaim, SweepWinsOverInFlightPayment) {
    HoldFixture f;
    auto h = f.holds.create_hold(kShow, {1}, "alice");
    ASSERT_TRUE(f.holds.claim_for_payment(h.hold->token).success());

    f.clock->advance(std::chrono::minutes(10));
    EXPECT_EQ(f.holds.sweep_expired(), 1u);
    EXPECT_EQ(f.holds.complete(h.hold->token).status, HoldStatus::NotFound);
}

TEST(HoldClaim, CompleteKeepsSeatsHeldForFinalize) {
    HoldFixture f;
    auto h = f.holds.create_hold(kShow, {1, 2}, "alice");
    ASSERT_TRUE(f.holds.claim_for_payment(h.hold->token).success());

    auto r = f.holds.complete(h.hold->token);
    ASSERT_TRUE(r.success());
    EXPECT_EQ(f.holds.active_holds(), 0u);
    EXPECT_EQ(f.inventory->seat_state(kShow, 1), SeatState::Held);
    EXPECT_TRUE(f.inventory->finalize(kShow, {1, 2}, h.hold->token, 42).ok());
}

// ---------- Concurrency test ----------
TEST(HoldConcurrency, ExactlyOneOverlappingHoldWins) {
    HoldFixture f;

    constexpr int kThreads = 16;
    std::atomic<bool> start{false};
    std::atomic<int> successes{0};
    std::atomic<int> conflicts{0};

    std::vector<std::thread> threads;
    threads.reserve(kThreads);

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            while (!start.load()) {
                // spin until start
            }
            auto r = f.holds.create_hold(kShow, {7, static_cast<SeatId>(10 + i % 4)},
                                         "actor-" + std::to_string(i));
            if (r.success()) {
                successes.fetch_add(1);
            } else if (r.status == HoldStatus::Conflict) {
                conflicts.fetch_add(1);
            }
        });
    }

    start.store(true);

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(conflicts.load(), kThreads - 1);
    EXPECT_EQ(f.holds.active_holds(), 1u);
}

TEST(HoldConcurrency, NullPublisherIsEnough) {
    auto clock = std::make_shared<ManualClock>(showseat_test::test_epoch());
    auto inventory = std::make_shared<SeatInventory>(clock);
    inventory->add_show(kShow, 4);
    HoldManager holds(inventory, clock, std::make_shared<showseat::NullEventPublisher>(), EngineConfig{});

    auto h = holds.create_hold(kShow, {0, 1, 2, 3}, "alice");
    ASSERT_TRUE(h.success());
    EXPECT_EQ(holds.create_hold(kShow, {0}, "bob").status, HoldStatus::Conflict);
}
