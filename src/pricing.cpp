#include "showseat/pricing.hpp"

#include <algorithm>

namespace showseat {

PriceCalculator::PriceCalculator(const ShowCatalog& catalog, const EngineConfig& config)
    : catalog_(catalog),
      fee_per_seat_(config.convenience_fee_per_seat),
      promo_codes_(config.promo_codes) {}

bool PriceCalculator::quote(ShowId show_id, const std::vector<SeatId>& seats, const std::string& promo_code,
                            Quote& out_quote, std::string& out_error) const {
    out_error.clear();
    out_quote = Quote{};

    int promo_percent = 0;
    if (!promo_code.empty()) {
        auto it = promo_codes_.find(promo_code);
        if (it == promo_codes_.end()) {
            out_error = "Unknown promo code: " + promo_code;
            return false;
        }
        promo_percent = it->second;
    }

    const std::vector<Seat> layout = catalog_.seats_for_show(show_id);
    const std::optional<Show> show = catalog_.find_show(show_id);
    if (!show || layout.empty()) {
        out_error = "Invalid show id";
        return false;
    }

    PriceBreakdown& p = out_quote.price;
    for (SeatId id : seats) {
        if (id >= layout.size()) {
            out_error = "Invalid seat " + std::to_string(id);
            return false;
        }
        const Seat& seat = layout[id];
        BookedSeat booked{seat.id, seat.label, seat.tier, show->base_price + seat.price_delta};
        p.subtotal += booked.price;
        out_quote.seats.push_back(booked);
    }

    p.convenience_fee = fee_per_seat_ * static_cast<Money>(seats.size());
    p.discount = p.subtotal * promo_percent / 100;
    p.final_amount = std::max<Money>(0, p.subtotal + p.convenience_fee - p.discount);
    out_quote.promo_code = promo_code;
    return true;
}

} // namespace showseat
