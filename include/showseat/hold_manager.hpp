#pragma once

#include "showseat/clock.hpp"
#include "showseat/config.hpp"
#include "showseat/event_publisher.hpp"
#include "showseat/seat_inventory.hpp"
#include "showseat/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace showseat {

/**
 * @brief A short-lived, exclusive reservation on seats pending payment.
 */
struct Hold {
    HoldToken token{0};
    ShowId show_id{};
    std::vector<SeatId> seats;
    ActorId actor;
    TimePoint created_at{};
    TimePoint expires_at{};
    bool in_payment{false};  /**< A submit is currently charging against this hold. */
};

enum class HoldStatus : std::uint8_t {
    Ok,
    Conflict,             /**< Some requested seats are not Available. */
    Expired,              /**< Window elapsed; seats were (or are being) released. */
    NotFound,             /**< Unknown token, or already released/promoted/swept. */
    InvalidRequest,       /**< Unknown show, bad/duplicate seats, too many seats. */
    PaymentInProgress,    /**< A submit already owns the hold. */
    ExtensionNotAllowed   /**< Extensions disabled, or the maximum window is reached. */
};

/**
 * @brief Typed outcome of a Hold Manager operation.
 */
struct HoldResult {
    HoldStatus status{HoldStatus::Ok};
    std::optional<Hold> hold;         /**< Present on Ok (and on Expired from complete()). */
    std::vector<SeatId> conflicting;  /**< Contested seats on Conflict. */
    std::string message;

    bool success() const { return status == HoldStatus::Ok; }
};

/**
 * @brief Issues holds against the inventory and expires them server-side.
 *
 * @details
 * Every hold is backed by Held slots in the SeatInventory owned by its token;
 * the hold record and the slots are created together and removed together.
 * The server-side expiry is authoritative: a background sweep (start()/stop())
 * releases holds whose window has elapsed, regardless of whether a payment is
 * in flight. The orchestrator re-validates liveness via complete() after
 * payment, so the sweep and a late payment cannot both win.
 *
 * ### Thread-safety
 * All public methods may be called concurrently with each other and with the
 * sweep. Sweeping an already released hold is a no-op.
 */
class HoldManager {
public:
    HoldManager(std::shared_ptr<SeatInventory> inventory,
                std::shared_ptr<const Clock> clock,
                std::shared_ptr<IEventPublisher> publisher,
                const EngineConfig& config);
    ~HoldManager();

    HoldManager(const HoldManager&) = delete;
    HoldManager& operator=(const HoldManager&) = delete;

    /**
     * @brief Holds every requested seat for the configured window, or none.
     *
     * @param show_id Show to hold seats for.
     * @param seats Seat ids on the show's screen (order irrelevant, no duplicates).
     * @param actor Requesting customer.
     * @return Ok with the new Hold, or Conflict listing only the contested seats.
     */
    HoldResult create_hold(ShowId show_id, const std::vector<SeatId>& seats, const ActorId& actor);

    /**
     * @brief Pushes a hold's expiry out by @p extra, capped at created_at + max_hold_window.
     *
     * Only available when EngineConfig::allow_hold_extension is set.
     */
    HoldResult extend_hold(HoldToken token, std::chrono::seconds extra);

    /** @brief Explicit release by the customer. Refused while a payment is in flight. */
    HoldResult release_hold(HoldToken token);

    std::optional<Hold> find_hold(HoldToken token) const;
    std::size_t active_holds() const;

    /**
     * @brief Marks a live hold as owned by one booking attempt.
     * @return Ok with a copy of the hold; Expired (seats released now),
     *         NotFound, or PaymentInProgress for a concurrent duplicate submit.
     */
    HoldResult claim_for_payment(HoldToken token);

    /**
     * @brief Promotes a claimed hold: removes it if still live.
     *
     * @return Ok with the hold (seats remain Held, ready to finalize);
     *         Expired with the hold if its window elapsed (seats released here);
     *         NotFound if the sweep already took it.
     */
    HoldResult complete(HoldToken token);

    /**
     * @brief Drops a claimed hold after a failed payment and releases its seats.
     * @return NotFound if the sweep already released it (nothing to do).
     */
    HoldResult abort_claimed(HoldToken token, const std::string& reason);

    /**
     * @brief Releases the seats of a hold already removed by complete() that
     * could not be finalized (its slots expired in between).
     */
    void discard(const Hold& hold, const std::string& reason);

    /**
     * @brief Releases every hold with expires_at <= now.
     * @return Number of holds released.
     */
    std::size_t sweep_expired();

    // Lifecycle of the background sweep thread.
    void start();
    void stop();
    bool is_running() const noexcept { return running_.load(); }

private:
    HoldToken next_token();
    void release_seats(const Hold& hold, const std::string& reason);
    void sweep_loop();

    std::shared_ptr<SeatInventory> inventory_;
    std::shared_ptr<const Clock> clock_;
    std::shared_ptr<IEventPublisher> publisher_;

    const std::chrono::seconds hold_window_;
    const std::chrono::seconds max_hold_window_;
    const std::chrono::milliseconds sweep_interval_;
    const bool allow_extension_;
    const std::size_t max_seats_;

    mutable std::mutex mutex_;
    std::unordered_map<HoldToken, Hold> holds_;

    std::atomic<std::uint64_t> token_counter_{0};
    const std::uint64_t token_seed_;

    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    std::thread sweeper_;
    std::atomic<bool> running_{false};
};

} // namespace showseat
