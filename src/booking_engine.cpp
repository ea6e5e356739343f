#include "showseat/booking_engine.hpp"
#include "showseat/errors.hpp"
#include "showseat/log.hpp"

namespace showseat {

namespace {

EngineConfig validated(EngineConfig config) {
    validate_config(config);
    return config;
}

} // namespace

BookingEngine::BookingEngine(EngineConfig config,
                             std::shared_ptr<IPaymentGateway> gateway,
                             std::shared_ptr<const Clock> clock)
    : config_(validated(std::move(config))),
      clock_(std::move(clock)),
      inventory_(std::make_shared<SeatInventory>(clock_, config_.journal_capacity)),
      broadcaster_(std::make_shared<AvailabilityBroadcaster>(config_.event_queue_capacity)),
      outbox_(std::make_unique<NotificationOutbox>()),
      holds_(std::make_shared<HoldManager>(inventory_, clock_, broadcaster_, config_)),
      registry_(std::make_shared<BookingRegistry>()) {
    if (!gateway) {
        throw ConfigError("A payment gateway is required");
    }
    outbox_->attach(*broadcaster_);
    orchestrator_ = std::make_unique<BookingOrchestrator>(holds_, inventory_, registry_, std::move(gateway),
                                                          broadcaster_, clock_, catalog_, config_);
    cancellations_ = std::make_unique<CancellationService>(registry_, inventory_, broadcaster_, clock_,
                                                           catalog_, RefundPolicy(config_));
}

BookingEngine::~BookingEngine() {
    stop();
}

ScreenId BookingEngine::add_screen(const std::string& name, std::vector<Seat> seats) {
    return catalog_.add_screen(name, std::move(seats));
}

ShowId BookingEngine::add_show(const std::string& title, ScreenId screen_id,
                               TimePoint scheduled_at, Money base_price) {
    const ShowId id = catalog_.add_show(title, screen_id, scheduled_at, base_price);
    register_inventory(*catalog_.find_show(id));
    return id;
}

void BookingEngine::load_catalog(const std::string& path) {
    catalog_.load_json(path);
    for (const auto& show : catalog_.list_shows()) {
        register_inventory(show);
    }
}

void BookingEngine::register_inventory(const Show& show) {
    inventory_->add_show(show.id, show.total_seats);
    SHOWSEAT_LOG("engine: show " << show.id << " '" << show.title << "' open with " << show.total_seats
                 << " seats");
}

HoldResult BookingEngine::hold(ShowId show_id, const std::vector<SeatId>& seats, const ActorId& actor) {
    return holds_->create_hold(show_id, seats, actor);
}

HoldResult BookingEngine::hold_labels(ShowId show_id, const std::vector<std::string>& labels,
                                      const ActorId& actor) {
    std::vector<SeatId> ids;
    std::string err;
    if (!catalog_.resolve_labels(show_id, labels, ids, err)) {
        HoldResult r;
        r.status = HoldStatus::InvalidRequest;
        r.message = err;
        return r;
    }
    return holds_->create_hold(show_id, ids, actor);
}

HoldResult BookingEngine::release(HoldToken token) {
    return holds_->release_hold(token);
}

HoldResult BookingEngine::extend(HoldToken token, std::chrono::seconds extra) {
    return holds_->extend_hold(token, extra);
}

BookingResult BookingEngine::submit(HoldToken token, const std::string& payment_method,
                                    const std::string& promo_code) {
    return orchestrator_->submit_booking(token, payment_method, promo_code);
}

CancellationResult BookingEngine::cancel(BookingId booking_id, const ActorId& actor) {
    return cancellations_->cancel_booking(booking_id, actor);
}

std::vector<SeatView> BookingEngine::seat_map(ShowId show_id) const {
    std::vector<SeatView> out;
    const std::vector<Seat> seats = catalog_.seats_for_show(show_id);
    const std::vector<SeatState> states = inventory_->snapshot(show_id);
    if (seats.empty() || states.size() != seats.size()) {
        return out;
    }

    out.reserve(seats.size());
    for (const auto& seat : seats) {
        SeatView v;
        v.seat_id = seat.id;
        v.label = seat.label;
        v.tier = seat.tier;
        v.price = catalog_.seat_price(show_id, seat.id).value_or(0);
        v.state = states[seat.id];
        out.push_back(std::move(v));
    }
    return out;
}

std::vector<std::string> BookingEngine::available_seats(ShowId show_id) const {
    std::vector<std::string> out;
    for (const auto& v : seat_map(show_id)) {
        if (v.state == SeatState::Available) out.push_back(v.label);
    }
    return out;
}

void BookingEngine::start() {
    broadcaster_->start();
    holds_->start();
}

void BookingEngine::stop() {
    holds_->stop();
    broadcaster_->stop();
}

} // namespace showseat
