#pragma once

#include "showseat/catalog.hpp"
#include "showseat/config.hpp"
#include "showseat/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace showseat {

/** @brief A seat as sold: its price is frozen at booking time. */
struct BookedSeat {
    SeatId seat_id{};
    std::string label;
    SeatTier tier{SeatTier::Standard};
    Money price{0};
};

struct PriceBreakdown {
    Money subtotal{0};
    Money convenience_fee{0};
    Money discount{0};
    Money final_amount{0};
};

struct Quote {
    std::vector<BookedSeat> seats;
    PriceBreakdown price;
    std::string promo_code;
};

/**
 * @brief Computes what a customer pays for a seat set, from current catalog
 * prices. Client-supplied totals are never an input.
 *
 * final = sum(base price + tier delta) + fee per seat - promo discount,
 * where the discount is a percentage of the subtotal, rounded down, and the
 * final amount never goes below zero.
 */
class PriceCalculator {
public:
    PriceCalculator(const ShowCatalog& catalog, const EngineConfig& config);

    /**
     * @param out_error Set when the show, a seat or the promo code is unknown.
     * @return True and a filled @p out_quote on success.
     */
    bool quote(ShowId show_id, const std::vector<SeatId>& seats, const std::string& promo_code,
               Quote& out_quote, std::string& out_error) const;

private:
    const ShowCatalog& catalog_;
    Money fee_per_seat_;
    std::map<std::string, int> promo_codes_;
};

} // namespace showseat
