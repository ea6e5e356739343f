#include "showseat/hold_manager.hpp"
#include "showseat/errors.hpp"
#include "showseat/log.hpp"

#include <random>

namespace showseat {

namespace {

// splitmix64 finalizer: a bijection on 64-bit values, so distinct counters
// always give distinct tokens while the tokens themselves are not sequential.
std::uint64_t mix64(std::uint64_t x) {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

std::uint64_t random_seed() {
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}

HoldResult make_result(HoldStatus status, std::string message) {
    HoldResult r;
    r.status = status;
    r.message = std::move(message);
    return r;
}

} // namespace

HoldManager::HoldManager(std::shared_ptr<SeatInventory> inventory,
                         std::shared_ptr<const Clock> clock,
                         std::shared_ptr<IEventPublisher> publisher,
                         const EngineConfig& config)
    : inventory_(std::move(inventory)),
      clock_(std::move(clock)),
      publisher_(std::move(publisher)),
      hold_window_(config.hold_window),
      max_hold_window_(config.max_hold_window),
      sweep_interval_(config.sweep_interval),
      allow_extension_(config.allow_hold_extension),
      max_seats_(config.max_seats_per_hold),
      token_seed_(random_seed()) {}

HoldManager::~HoldManager() {
    stop();
}

HoldToken HoldManager::next_token() {
    // 0 means "no owner" in the inventory; skip the one counter value mapping to it.
    for (;;) {
        const HoldToken t = mix64(token_counter_.fetch_add(1) ^ token_seed_);
        if (t != 0) return t;
    }
}

HoldResult HoldManager::create_hold(ShowId show_id, const std::vector<SeatId>& seats, const ActorId& actor) {
    if (seats.empty()) {
        return make_result(HoldStatus::InvalidRequest, "No seats provided");
    }
    if (seats.size() > max_seats_) {
        return make_result(HoldStatus::InvalidRequest,
                           "At most " + std::to_string(max_seats_) + " seats per hold");
    }

    Hold hold;
    hold.token = next_token();
    hold.show_id = show_id;
    hold.seats = seats;
    hold.actor = actor;
    hold.created_at = clock_->now();
    hold.expires_at = hold.created_at + hold_window_;

    const InventoryResult r = inventory_->reserve(show_id, seats, hold.token, hold.expires_at);
    switch (r.status) {
        case InventoryStatus::Ok:
            break;
        case InventoryStatus::Conflict: {
            HoldResult out = make_result(HoldStatus::Conflict, r.message);
            out.conflicting = r.conflicting;
            return out;
        }
        case InventoryStatus::UnknownShow:
        case InventoryStatus::InvalidSeats:
        case InventoryStatus::NotFound:
        case InventoryStatus::Expired:
            return make_result(HoldStatus::InvalidRequest, r.message);
    }

    {
        std::lock_guard<std::mutex> g(mutex_);
        holds_.emplace(hold.token, hold);
    }

    SeatEvent ev;
    ev.type = EventType::SeatsHeld;
    ev.show_id = show_id;
    ev.seat_ids = seats;
    ev.hold_token = hold.token;
    ev.ts = hold.created_at;
    publisher_->publish(ev);

    SHOWSEAT_LOG("holds: created token=" << hold.token << " show=" << show_id << " actor=" << actor
                 << " seats=" << seats.size());

    HoldResult out = make_result(HoldStatus::Ok, "Seats held");
    out.hold = std::move(hold);
    return out;
}

HoldResult HoldManager::extend_hold(HoldToken token, std::chrono::seconds extra) {
    if (!allow_extension_) {
        return make_result(HoldStatus::ExtensionNotAllowed, "Hold extension is disabled");
    }
    if (extra.count() <= 0) {
        return make_result(HoldStatus::InvalidRequest, "Extension must be positive");
    }

    // Holding mutex_ across the inventory call keeps the sweep from releasing
    // the hold between the liveness check and the deadline update.
    std::lock_guard<std::mutex> g(mutex_);
    auto it = holds_.find(token);
    if (it == holds_.end()) {
        return make_result(HoldStatus::NotFound, "Unknown or released hold");
    }
    Hold& hold = it->second;
    const TimePoint now = clock_->now();
    if (hold.expires_at <= now) {
        return make_result(HoldStatus::Expired, "Hold expired");
    }

    const TimePoint cap = hold.created_at + max_hold_window_;
    TimePoint target = hold.expires_at + extra;
    if (target > cap) target = cap;
    if (target <= hold.expires_at) {
        return make_result(HoldStatus::ExtensionNotAllowed, "Maximum hold window reached");
    }

    const InventoryResult r = inventory_->extend(hold.show_id, hold.seats, token, target);
    if (!r.ok()) {
        return make_result(HoldStatus::NotFound, r.message);
    }
    hold.expires_at = target;

    HoldResult out = make_result(HoldStatus::Ok, "Hold extended");
    out.hold = hold;
    return out;
}

HoldResult HoldManager::release_hold(HoldToken token) {
    Hold hold;
    {
        std::lock_guard<std::mutex> g(mutex_);
        auto it = holds_.find(token);
        if (it == holds_.end()) {
            return make_result(HoldStatus::NotFound, "Unknown or released hold");
        }
        if (it->second.in_payment) {
            return make_result(HoldStatus::PaymentInProgress, "Payment in progress for this hold");
        }
        hold = std::move(it->second);
        holds_.erase(it);
    }

    release_seats(hold, "released");
    HoldResult out = make_result(HoldStatus::Ok, "Hold released");
    out.hold = std::move(hold);
    return out;
}

std::optional<Hold> HoldManager::find_hold(HoldToken token) const {
    std::lock_guard<std::mutex> g(mutex_);
    auto it = holds_.find(token);
    if (it == holds_.end()) return std::nullopt;
    return it->second;
}

std::size_t HoldManager::active_holds() const {
    std::lock_guard<std::mutex> g(mutex_);
    return holds_.size();
}

HoldResult HoldManager::claim_for_payment(HoldToken token) {
    Hold expired;
    {
        std::lock_guard<std::mutex> g(mutex_);
        auto it = holds_.find(token);
        if (it == holds_.end()) {
            return make_result(HoldStatus::NotFound, "Unknown or released hold");
        }
        if (it->second.in_payment) {
            return make_result(HoldStatus::PaymentInProgress, "Payment in progress for this hold");
        }
        if (it->second.expires_at > clock_->now()) {
            it->second.in_payment = true;
            HoldResult out = make_result(HoldStatus::Ok, "Hold claimed");
            out.hold = it->second;
            return out;
        }
        // Expired but not swept yet: release it now rather than wait for the sweep.
        expired = std::move(it->second);
        holds_.erase(it);
    }

    release_seats(expired, "expired");
    return make_result(HoldStatus::Expired, "Hold expired");
}

HoldResult HoldManager::complete(HoldToken token) {
    Hold hold;
    bool live = false;
    {
        std::lock_guard<std::mutex> g(mutex_);
        auto it = holds_.find(token);
        if (it == holds_.end()) {
            return make_result(HoldStatus::NotFound, "Hold was released before payment completed");
        }
        live = it->second.expires_at > clock_->now();
        hold = std::move(it->second);
        holds_.erase(it);
    }

    if (!live) {
        release_seats(hold, "expired");
        HoldResult out = make_result(HoldStatus::Expired, "Hold expired before payment completed");
        out.hold = std::move(hold);
        return out;
    }

    HoldResult out = make_result(HoldStatus::Ok, "Hold promoted");
    out.hold = std::move(hold);
    return out;
}

HoldResult HoldManager::abort_claimed(HoldToken token, const std::string& reason) {
    Hold hold;
    {
        std::lock_guard<std::mutex> g(mutex_);
        auto it = holds_.find(token);
        if (it == holds_.end()) {
            return make_result(HoldStatus::NotFound, "Hold already released");
        }
        hold = std::move(it->second);
        holds_.erase(it);
    }

    release_seats(hold, reason);
    HoldResult out = make_result(HoldStatus::Ok, "Hold released");
    out.hold = std::move(hold);
    return out;
}

void HoldManager::discard(const Hold& hold, const std::string& reason) {
    release_seats(hold, reason);
}

std::size_t HoldManager::sweep_expired() {
    std::vector<Hold> expired;
    {
        std::lock_guard<std::mutex> g(mutex_);
        const TimePoint now = clock_->now();
        for (auto it = holds_.begin(); it != holds_.end();) {
            if (it->second.expires_at <= now) {
                expired.push_back(std::move(it->second));
                it = holds_.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::size_t released = 0;
    for (const auto& hold : expired) {
        try {
            release_seats(hold, "expired");
            ++released;
        } catch (const StorageError& e) {
            SHOWSEAT_WARN("holds: sweep could not release token " << hold.token
                          << ", retrying next pass: " << e.what());
        }
    }
    if (released > 0) {
        SHOWSEAT_LOG("holds: sweep released " << released << " hold(s)");
    }
    return released;
}

void HoldManager::release_seats(const Hold& hold, const std::string& reason) {
    // Only the caller that removed the hold record gets here, so each hold's
    // seats are released at most once.
    InventoryResult r;
    try {
        r = inventory_->release(hold.show_id, hold.seats, hold.token);
    } catch (const StorageError&) {
        // Put the record back so the next sweep retries; seats must not stay Held forever.
        Hold retry = hold;
        retry.in_payment = false;
        {
            std::lock_guard<std::mutex> g(mutex_);
            holds_.emplace(retry.token, std::move(retry));
        }
        throw;
    }
    if (!r.ok()) {
        SHOWSEAT_WARN("holds: release of token " << hold.token << " on show " << hold.show_id
                      << " found no held seats: " << r.message);
        return;
    }

    SeatEvent ev;
    ev.type = EventType::SeatsReleased;
    ev.show_id = hold.show_id;
    ev.seat_ids = hold.seats;
    ev.hold_token = hold.token;
    ev.reason = reason;
    ev.ts = clock_->now();
    publisher_->publish(ev);

    SHOWSEAT_LOG("holds: released token=" << hold.token << " reason=" << reason);
}

void HoldManager::start() {
    if (running_.exchange(true)) {
        return; // Already running
    }
    sweeper_ = std::thread(&HoldManager::sweep_loop, this);
}

void HoldManager::stop() {
    if (!running_.exchange(false)) {
        return; // Already stopped
    }
    {
        std::lock_guard<std::mutex> g(sweep_mutex_);
    }
    sweep_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
}

void HoldManager::sweep_loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(sweep_mutex_);
            sweep_cv_.wait_for(lock, sweep_interval_, [this] { return !running_.load(); });
        }
        if (!running_.load()) break;
        sweep_expired();
    }
}

} // namespace showseat
