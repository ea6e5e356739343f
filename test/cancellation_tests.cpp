#include <gtest/gtest.h>

#include "showseat/booking_engine.hpp"
#include "showseat/errors.hpp"
#include "showseat/refund_policy.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <stdexcept>
#include <thread>
#include <vector>

using showseat::BookingEngine;
using showseat::BookingStatus;
using showseat::CancellationStatus;
using showseat::EngineConfig;
using showseat::ManualClock;
using showseat::RefundPolicy;
using showseat::RefundTier;
using showseat::SeatId;
using showseat::SeatState;
using std::chrono::hours;
using std::chrono::minutes;

namespace {

struct CancelFixture {
    explicit CancelFixture(std::chrono::hours show_in = hours(72))
        : clock(std::make_shared<ManualClock>(showseat_test::test_epoch())),
          gateway(std::make_shared<showseat_test::FakePaymentGateway>()),
          engine(EngineConfig{}, gateway, clock) {
        const auto screen = engine.add_screen("Screen 1", showseat::ShowCatalog::make_grid(1, 10));
        show = engine.add_show("Inception", screen, clock->now() + show_in, 1000);
    }

    showseat::Booking book(const std::vector<SeatId>& seats, const std::string& actor = "alice") {
        auto h = engine.hold(show, seats, actor);
        EXPECT_TRUE(h.success()) << h.message;
        auto r = engine.submit(h.hold->token, "card-4242");
        EXPECT_TRUE(r.success) << r.message;
        return *r.booking;
    }

    std::shared_ptr<ManualClock> clock;
    std::shared_ptr<showseat_test::FakePaymentGateway> gateway;
    BookingEngine engine;
    showseat::ShowId show{0};
};

} // namespace

// ---------- Tests: refund computation ----------
TEST(RefundPolicyTiers, DefaultTiers) {
    RefundPolicy policy(EngineConfig{});

    auto d = compute_refund(2000, hours(48), policy);
    EXPECT_TRUE(d.allowed);
    EXPECT_EQ(d.percent, 100);
    EXPECT_EQ(d.refund, 2000);

    d = compute_refund(2000, hours(24), policy);
    EXPECT_EQ(d.percent, 100);

    d = compute_refund(2000, hours(23), policy);
    EXPECT_EQ(d.percent, 50);
    EXPECT_EQ(d.refund, 1000);

    d = compute_refund(2000, hours(2) + minutes(1), policy);
    EXPECT_TRUE(d.allowed);
    EXPECT_EQ(d.refund, 1000);
}

TEST(RefundPolicyTiers, CutoffIsExclusive) {
    RefundPolicy policy(EngineConfig{});
    EXPECT_FALSE(compute_refund(2000, hours(2), policy).allowed);
    EXPECT_FALSE(compute_refund(2000, hours(1), policy).allowed);
    EXPECT_FALSE(compute_refund(2000, -hours(1), policy).allowed);
}

TEST(RefundPolicyTiers, GapBetweenCutoffAndShortestTierRefundsNothing) {
    RefundPolicy policy(minutes(60), {RefundTier{hours(24), 100}, RefundTier{hours(3), 50}});
    auto d = policy.evaluate(2000, hours(2));
    EXPECT_TRUE(d.allowed);
    EXPECT_EQ(d.percent, 0);
    EXPECT_EQ(d.refund, 0);
}

TEST(RefundPolicyTiers, DirectConstructionValidatesTiers) {
    // A later cancellation may not refund more than an earlier one.
    EXPECT_THROW(RefundPolicy(hours(2), {RefundTier{hours(24), 50}, RefundTier{hours(2), 100}}),
                 showseat::ConfigError);
    EXPECT_THROW(RefundPolicy(hours(2), {RefundTier{hours(1), 100}}), showseat::ConfigError);
    EXPECT_THROW(RefundPolicy(hours(2), {RefundTier{hours(24), 120}}), showseat::ConfigError);

    // Order of the input does not matter.
    RefundPolicy policy(hours(2), {RefundTier{hours(3), 50}, RefundTier{hours(24), 100}});
    EXPECT_EQ(policy.evaluate(1000, hours(30)).percent, 100);
    EXPECT_EQ(policy.evaluate(1000, hours(4)).percent, 50);
}

TEST(RefundPolicyTiers, RefundNeverGrowsAsShowApproaches) {
    RefundPolicy policy(EngineConfig{});
    showseat::Money previous = compute_refund(12345, hours(96), policy).refund;
    for (minutes lead = hours(96); lead > minutes(0); lead -= minutes(15)) {
        const auto d = compute_refund(12345, lead, policy);
        const showseat::Money refund = d.allowed ? d.refund : 0;
        EXPECT_LE(refund, previous) << "lead " << lead.count() << " min";
        previous = refund;
    }
}

TEST(RefundPolicyTiers, RoundsDown) {
    RefundPolicy policy(EngineConfig{});
    EXPECT_EQ(compute_refund(999, hours(10), policy).refund, 499);
}

// ---------- Tests: cancel_booking ----------
TEST(CancelBooking, FullRefundFreesSeats) {
    CancelFixture f;
    const auto b = f.book({0, 1});
    ASSERT_EQ(f.engine.available_count(f.show), 8u);

    auto r = f.engine.cancel(b.id, "alice");
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.status, CancellationStatus::Cancelled);
    EXPECT_EQ(r.refund_amount, 2000);
    ASSERT_TRUE(r.booking.has_value());
    EXPECT_EQ(r.booking->status, BookingStatus::Cancelled);

    EXPECT_EQ(f.engine.inventory().seat_state(f.show, 0), SeatState::Available);
    EXPECT_EQ(f.engine.available_count(f.show), 10u);
    EXPECT_EQ(f.engine.booking(b.id)->refund_amount, 2000);

    // No money moves from here: the gateway was called once, for the booking.
    EXPECT_EQ(f.gateway->call_count(), 1u);
}

TEST(CancelBooking, HalfRefundInsideOneDay) {
    CancelFixture f(hours(5));
    const auto b = f.book({3});

    auto r = f.engine.cancel(b.id, "alice");
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.refund_amount, 500);
}

TEST(CancelBooking, TooLateInsideCutoff) {
    CancelFixture f;
    const auto b = f.book({3});
    f.clock->advance(hours(70)); // exactly 2h before the show

    auto r = f.engine.cancel(b.id, "alice");
    EXPECT_EQ(r.status, CancellationStatus::TooLateToCancel);
    EXPECT_EQ(f.engine.booking(b.id)->status, BookingStatus::Confirmed);
    EXPECT_EQ(f.engine.inventory().seat_state(f.show, 3), SeatState::Booked);
}

TEST(CancelBooking, RejectsUnknownForeignAndRepeated) {
    CancelFixture f;
    const auto b = f.book({4});

    EXPECT_EQ(f.engine.cancel(b.id + 100, "alice").status, CancellationStatus::NotFound);
    EXPECT_EQ(f.engine.cancel(b.id, "mallory").status, CancellationStatus::Forbidden);

    ASSERT_TRUE(f.engine.cancel(b.id, "alice").success);
    EXPECT_EQ(f.engine.cancel(b.id, "alice").status, CancellationStatus::NotConfirmed);
}

TEST(CancelBooking, EmitsBookingCancelledWithRefund) {
    CancelFixture f;
    const auto b = f.book({5, 6});
    ASSERT_TRUE(f.engine.cancel(b.id, "alice").success);

    f.engine.flush_events();
    auto docs = f.engine.outbox().drain();
    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(docs[0]["eventType"].get<std::string>(), "SeatsBooked");
    EXPECT_EQ(docs[1]["eventType"].get<std::string>(), "BookingCancelled");
    EXPECT_EQ(docs[1]["bookingId"].get<showseat::BookingId>(), b.id);
    EXPECT_EQ(docs[1]["amount"].get<showseat::Money>(), 2000);
    EXPECT_EQ(docs[1]["seatIds"].get<std::vector<SeatId>>(), std::vector<SeatId>({5, 6}));
}

TEST(CancelBooking, StorageFaultRestoresConfirmedBooking) {
    CancelFixture f;
    const auto b = f.book({7, 8});

    f.engine.inventory().set_fault_hook([](showseat::ShowId, SeatId seat, SeatState to) {
        if (to == SeatState::Available && seat == 8) throw std::runtime_error("disk gone");
    });
    EXPECT_THROW(f.engine.cancel(b.id, "alice"), showseat::StorageError);
    f.engine.inventory().set_fault_hook(nullptr);

    EXPECT_EQ(f.engine.booking(b.id)->status, BookingStatus::Confirmed);
    EXPECT_EQ(f.engine.inventory().seat_state(f.show, 7), SeatState::Booked);
    EXPECT_EQ(f.engine.inventory().seat_state(f.show, 8), SeatState::Booked);

    // Once storage is back the cancellation goes through.
    EXPECT_TRUE(f.engine.cancel(b.id, "alice").success);
}

TEST(CancelBooking, ConcurrentCancelsRefundOnce) {
    CancelFixture f;
    const auto b = f.book({9});

    constexpr int kThreads = 8;
    std::atomic<bool> start{false};
    std::atomic<int> successes{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            while (!start.load()) {
                // spin until start
            }
            if (f.engine.cancel(b.id, "alice").success) {
                successes.fetch_add(1);
            }
        });
    }

    start.store(true);
    for (auto& t : threads) t.join();

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(f.engine.available_count(f.show), 10u);
}
