#pragma once

#include "showseat/event_publisher.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace showseat {

/**
 * @brief Fans seat-state events out to observers scoped by show id.
 *
 * @details
 * Best-effort, at-least-once delivery. Nothing here is required for
 * correctness: observers must treat the inventory's seat map as ground truth
 * and re-fetch it on reconnect.
 *
 * - publish() never blocks: it appends to a bounded queue and drops (and
 *   counts) the event when the queue is full.
 * - Events are delivered either by the dispatcher thread (start()/stop()) or
 *   by calling process_events() on any thread. Deliveries are serialized, so
 *   observers see events in publish order.
 * - An observer that throws is logged and counted; other observers still
 *   receive the event and the publisher never sees the failure.
 */
class AvailabilityBroadcaster final : public IEventPublisher {
public:
    using Observer = std::function<void(const SeatEvent&)>;
    using SubscriptionId = std::uint64_t;

    explicit AvailabilityBroadcaster(std::size_t capacity = 4096);
    ~AvailabilityBroadcaster() override;

    AvailabilityBroadcaster(const AvailabilityBroadcaster&) = delete;
    AvailabilityBroadcaster& operator=(const AvailabilityBroadcaster&) = delete;

    /** @brief Observe events of one show (e.g. viewers of its seat map). */
    SubscriptionId subscribe(ShowId show_id, Observer observer);

    /** @brief Observe events of every show (e.g. the notification outbox). */
    SubscriptionId subscribe_all(Observer observer);

    bool unsubscribe(SubscriptionId id);

    bool publish(const SeatEvent& event) override;

    /**
     * @brief Delivers every queued event on the calling thread.
     * @return Number of events delivered.
     */
    std::size_t process_events();

    // Lifecycle of the dispatcher thread.
    void start();
    void stop();
    bool is_running() const noexcept { return running_.load(); }

    std::size_t pending() const;
    std::uint64_t dropped_count() const noexcept { return dropped_.load(); }
    std::uint64_t observer_failures() const noexcept { return observer_failures_.load(); }

private:
    void dispatch_loop();
    void deliver(const SeatEvent& event);

    const std::size_t capacity_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<SeatEvent> queue_;

    std::mutex delivery_mutex_;

    std::mutex observers_mutex_;
    std::unordered_map<ShowId, std::vector<std::pair<SubscriptionId, Observer>>> by_show_;
    std::vector<std::pair<SubscriptionId, Observer>> global_;
    std::atomic<SubscriptionId> next_id_{1};

    std::thread dispatcher_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> observer_failures_{0};
};

} // namespace showseat
