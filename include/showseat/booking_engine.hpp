#pragma once

#include "showseat/booking_orchestrator.hpp"
#include "showseat/booking_registry.hpp"
#include "showseat/broadcaster.hpp"
#include "showseat/cancellation_service.hpp"
#include "showseat/catalog.hpp"
#include "showseat/clock.hpp"
#include "showseat/config.hpp"
#include "showseat/hold_manager.hpp"
#include "showseat/notification_outbox.hpp"
#include "showseat/payment.hpp"
#include "showseat/seat_inventory.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @file booking_engine.hpp
 * @brief Public API of the seat inventory and booking engine.
 *
 * BookingEngine wires the components together and is what request handlers
 * (or the CLI) talk to:
 * - catalog: screens, seat layouts, shows and prices
 * - holds: hold / extend / release, with server-side expiry
 * - bookings: submit (pay + confirm) and cancel (refund)
 * - read side: seat maps, counters, booking records, notification outbox
 *
 * Every method is safe to call from many request threads at once.
 */

namespace showseat {

/**
 * @brief One seat of a show as shown to a customer.
 */
struct SeatView {
    SeatId seat_id{};
    std::string label;
    SeatTier tier{SeatTier::Standard};
    Money price{0};
    SeatState state{SeatState::Available};
};

class BookingEngine {
public:
    /**
     * @brief Builds an engine around a payment collaborator.
     *
     * @param config Policy values; validated here.
     * @param gateway Payment collaborator.
     * @param clock Time source (a ManualClock in tests).
     *
     * @throws ConfigError if @p config is inconsistent.
     */
    BookingEngine(EngineConfig config,
                  std::shared_ptr<IPaymentGateway> gateway,
                  std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>());
    ~BookingEngine();

    BookingEngine(const BookingEngine&) = delete;
    BookingEngine& operator=(const BookingEngine&) = delete;

    // ---------- Catalog ----------

    ScreenId add_screen(const std::string& name, std::vector<Seat> seats);

    /** @brief Registers a show in the catalog and creates its inventory slots. */
    ShowId add_show(const std::string& title, ScreenId screen_id, TimePoint scheduled_at, Money base_price);

    /**
     * @brief Loads a catalog JSON file and creates slots for its shows.
     * @throws ConfigError on a malformed file.
     */
    void load_catalog(const std::string& path);

    std::vector<Show> list_shows() const { return catalog_.list_shows(); }

    // ---------- Holds ----------

    HoldResult hold(ShowId show_id, const std::vector<SeatId>& seats, const ActorId& actor);

    /** @brief Same as hold() with seat labels ("A1", "B4", ...). */
    HoldResult hold_labels(ShowId show_id, const std::vector<std::string>& labels, const ActorId& actor);

    HoldResult release(HoldToken token);
    HoldResult extend(HoldToken token, std::chrono::seconds extra);

    // ---------- Bookings ----------

    BookingResult submit(HoldToken token, const std::string& payment_method,
                         const std::string& promo_code = std::string());

    CancellationResult cancel(BookingId booking_id, const ActorId& actor);

    // ---------- Read side ----------

    /** @brief Every seat of a show with its price and current state. Empty for unknown shows. */
    std::vector<SeatView> seat_map(ShowId show_id) const;

    /** @brief Labels of the Available seats of a show, in layout order. */
    std::vector<std::string> available_seats(ShowId show_id) const;

    std::uint32_t available_count(ShowId show_id) const { return inventory_->available_count(show_id); }

    std::optional<Booking> booking(BookingId booking_id) const { return registry_->get(booking_id); }
    std::vector<Booking> bookings_for_show(ShowId show_id) const { return registry_->list_for_show(show_id); }

    /**
     * @brief Attempts whose money must go back: charged after the hold was
     * lost, or timed out with a charge that may still land.
     */
    std::vector<Booking> refunds_due() const { return registry_->list_by_status(BookingStatus::Expired); }

    // ---------- Lifecycle ----------

    /** @brief Runs one expiry sweep on the calling thread. */
    std::size_t sweep_now() { return holds_->sweep_expired(); }

    /** @brief Delivers queued events on the calling thread. */
    std::size_t flush_events() { return broadcaster_->process_events(); }

    /** @brief Starts the background sweeper and event dispatcher. */
    void start();
    void stop();

    const EngineConfig& config() const { return config_; }
    const ShowCatalog& catalog() const { return catalog_; }
    SeatInventory& inventory() { return *inventory_; }
    HoldManager& holds() { return *holds_; }
    BookingRegistry& registry() { return *registry_; }
    AvailabilityBroadcaster& broadcaster() { return *broadcaster_; }
    NotificationOutbox& outbox() { return *outbox_; }

private:
    void register_inventory(const Show& show);

    EngineConfig config_;
    std::shared_ptr<const Clock> clock_;
    ShowCatalog catalog_;

    std::shared_ptr<SeatInventory> inventory_;
    std::shared_ptr<AvailabilityBroadcaster> broadcaster_;
    std::unique_ptr<NotificationOutbox> outbox_;
    std::shared_ptr<HoldManager> holds_;
    std::shared_ptr<BookingRegistry> registry_;
    std::unique_ptr<BookingOrchestrator> orchestrator_;
    std::unique_ptr<CancellationService> cancellations_;
};

} // namespace showseat
