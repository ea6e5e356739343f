#include "showseat/broadcaster.hpp"
#include "showseat/log.hpp"

#include <algorithm>
#include <chrono>

namespace showseat {

AvailabilityBroadcaster::AvailabilityBroadcaster(std::size_t capacity) : capacity_(capacity) {}

AvailabilityBroadcaster::~AvailabilityBroadcaster() {
    stop();
}

AvailabilityBroadcaster::SubscriptionId AvailabilityBroadcaster::subscribe(ShowId show_id, Observer observer) {
    const SubscriptionId id = next_id_.fetch_add(1);
    std::lock_guard<std::mutex> g(observers_mutex_);
    by_show_[show_id].emplace_back(id, std::move(observer));
    return id;
}

AvailabilityBroadcaster::SubscriptionId AvailabilityBroadcaster::subscribe_all(Observer observer) {
    const SubscriptionId id = next_id_.fetch_add(1);
    std::lock_guard<std::mutex> g(observers_mutex_);
    global_.emplace_back(id, std::move(observer));
    return id;
}

bool AvailabilityBroadcaster::unsubscribe(SubscriptionId id) {
    auto matches = [id](const std::pair<SubscriptionId, Observer>& p) { return p.first == id; };

    std::lock_guard<std::mutex> g(observers_mutex_);
    auto it = std::find_if(global_.begin(), global_.end(), matches);
    if (it != global_.end()) {
        global_.erase(it);
        return true;
    }
    for (auto& kv : by_show_) {
        auto sit = std::find_if(kv.second.begin(), kv.second.end(), matches);
        if (sit != kv.second.end()) {
            kv.second.erase(sit);
            return true;
        }
    }
    return false;
}

bool AvailabilityBroadcaster::publish(const SeatEvent& event) {
    {
        std::lock_guard<std::mutex> g(queue_mutex_);
        if (queue_.size() >= capacity_) {
            dropped_.fetch_add(1);
            SHOWSEAT_WARN("broadcaster: queue full, dropped " << to_string(event.type)
                          << " for show " << event.show_id);
            return false;
        }
        queue_.push_back(event);
    }
    queue_cv_.notify_one();
    return true;
}

std::size_t AvailabilityBroadcaster::process_events() {
    std::lock_guard<std::mutex> delivery(delivery_mutex_);

    std::deque<SeatEvent> batch;
    {
        std::lock_guard<std::mutex> g(queue_mutex_);
        batch.swap(queue_);
    }
    for (const auto& event : batch) {
        deliver(event);
    }
    return batch.size();
}

void AvailabilityBroadcaster::deliver(const SeatEvent& event) {
    // Copy the observer list so callbacks run without holding observers_mutex_
    // (an observer may subscribe/unsubscribe from inside its callback).
    std::vector<std::pair<SubscriptionId, Observer>> targets;
    {
        std::lock_guard<std::mutex> g(observers_mutex_);
        targets = global_;
        auto it = by_show_.find(event.show_id);
        if (it != by_show_.end()) {
            targets.insert(targets.end(), it->second.begin(), it->second.end());
        }
    }

    for (const auto& target : targets) {
        try {
            target.second(event);
        } catch (const std::exception& e) {
            observer_failures_.fetch_add(1);
            SHOWSEAT_WARN("broadcaster: observer " << target.first << " failed on "
                          << to_string(event.type) << ": " << e.what());
        }
    }
}

void AvailabilityBroadcaster::start() {
    if (running_.exchange(true)) {
        return; // Already running
    }
    dispatcher_ = std::thread(&AvailabilityBroadcaster::dispatch_loop, this);
}

void AvailabilityBroadcaster::stop() {
    if (!running_.exchange(false)) {
        return; // Already stopped
    }
    queue_cv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    // Flush what was published before shutdown.
    process_events();
}

std::size_t AvailabilityBroadcaster::pending() const {
    std::lock_guard<std::mutex> g(queue_mutex_);
    return queue_.size();
}

void AvailabilityBroadcaster::dispatch_loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait_for(lock, std::chrono::milliseconds(100),
                               [this] { return !queue_.empty() || !running_.load(); });
        }
        process_events();
    }
}

} // namespace showseat
