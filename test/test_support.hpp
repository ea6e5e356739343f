#pragma once

#include "showseat/clock.hpp"
#include "showseat/event_publisher.hpp"
#include "showseat/payment.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace showseat_test {

/**
 * @brief Scripted payment collaborator.
 *
 * Answers with queued outcomes (Success by default), honours idempotency keys
 * the way a real gateway must, and can be told to sleep before answering so
 * that the caller's timeout fires.
 */
class FakePaymentGateway final : public showseat::IPaymentGateway {
public:
    showseat::PaymentOutcome charge(const showseat::ChargeRequest& req) override {
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> g(mutex_);
            calls_.push_back(req);
            delay = delay_;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        std::lock_guard<std::mutex> g(mutex_);
        auto it = settled_.find(req.idempotency_key);
        if (it != settled_.end()) {
            return showseat::PaymentOutcome::success(it->second);
        }

        bool approve = true;
        std::string reason;
        if (!script_.empty()) {
            approve = script_.front().first;
            reason = script_.front().second;
            script_.pop_front();
        }
        if (!approve) {
            return showseat::PaymentOutcome::failure(reason);
        }

        const std::string txn = "TXN-" + std::to_string(++charged_);
        settled_.emplace(req.idempotency_key, txn);
        return showseat::PaymentOutcome::success(txn);
    }

    void approve_next() {
        std::lock_guard<std::mutex> g(mutex_);
        script_.emplace_back(true, std::string());
    }

    void decline_next(const std::string& reason) {
        std::lock_guard<std::mutex> g(mutex_);
        script_.emplace_back(false, reason);
    }

    void set_delay(std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> g(mutex_);
        delay_ = d;
    }

    /** Number of distinct successful charges (money actually taken). */
    std::uint64_t charged() const {
        std::lock_guard<std::mutex> g(mutex_);
        return charged_;
    }

    std::size_t call_count() const {
        std::lock_guard<std::mutex> g(mutex_);
        return calls_.size();
    }

    std::vector<showseat::ChargeRequest> calls() const {
        std::lock_guard<std::mutex> g(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<std::pair<bool, std::string>> script_;
    std::unordered_map<std::string, std::string> settled_;
    std::vector<showseat::ChargeRequest> calls_;
    std::chrono::milliseconds delay_{0};
    std::uint64_t charged_{0};
};

/**
 * @brief Gateway that advances a ManualClock while "charging", to put the
 * hold's expiry in the middle of a successful payment.
 */
class ClockAdvancingGateway final : public showseat::IPaymentGateway {
public:
    ClockAdvancingGateway(std::shared_ptr<showseat::ManualClock> clock, std::chrono::seconds step)
        : clock_(std::move(clock)), step_(step) {}

    showseat::PaymentOutcome charge(const showseat::ChargeRequest&) override {
        clock_->advance(step_);
        return showseat::PaymentOutcome::success("TXN-LATE-" + std::to_string(++calls_));
    }

private:
    std::shared_ptr<showseat::ManualClock> clock_;
    std::chrono::seconds step_;
    std::atomic<int> calls_{0};
};

/**
 * @brief Publisher that keeps every event, for asserting on what was emitted.
 */
class RecordingPublisher final : public showseat::IEventPublisher {
public:
    bool publish(const showseat::SeatEvent& event) override {
        std::lock_guard<std::mutex> g(mutex_);
        events_.push_back(event);
        return true;
    }

    std::vector<showseat::SeatEvent> events() const {
        std::lock_guard<std::mutex> g(mutex_);
        return events_;
    }

    std::vector<showseat::SeatEvent> of_type(showseat::EventType type) const {
        std::vector<showseat::SeatEvent> out;
        std::lock_guard<std::mutex> g(mutex_);
        for (const auto& e : events_) {
            if (e.type == type) out.push_back(e);
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::vector<showseat::SeatEvent> events_;
};

// Fixed epoch for deterministic tests: 2026-01-01T00:00:00Z.
inline showseat::TimePoint test_epoch() {
    return showseat::TimePoint(std::chrono::seconds(1767225600));
}

} // namespace showseat_test
