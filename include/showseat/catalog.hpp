#pragma once

#include "showseat/types.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace showseat {

/**
 * @brief Read-mostly registry of screens, seats and shows.
 *
 * @details
 * Populated by the catalog/show-admin collaborator (in code or from a JSON
 * file) and read concurrently by the engine afterwards. Lookups return copies
 * so callers never hold references into the registry.
 *
 * Unknown ids come back as empty optionals; they are not exceptional.
 */
class ShowCatalog {
public:
    ShowCatalog() = default;
    ShowCatalog(const ShowCatalog&) = delete;
    ShowCatalog& operator=(const ShowCatalog&) = delete;

    /**
     * @brief Registers a screen. Seat ids are reassigned to their index.
     * @throws ConfigError if the layout is empty or labels repeat.
     */
    ScreenId add_screen(const std::string& name, std::vector<Seat> seats);

    /**
     * @brief Registers a show on an existing screen.
     * @throws ConfigError if the screen is unknown or base_price is negative.
     */
    ShowId add_show(const std::string& title, ScreenId screen_id,
                    TimePoint scheduled_at, Money base_price);

    std::optional<Show> find_show(ShowId show_id) const;
    std::optional<Screen> find_screen(ScreenId screen_id) const;
    std::vector<Show> list_shows() const;

    /** @brief Seat layout used by a show (its screen's seats). */
    std::vector<Seat> seats_for_show(ShowId show_id) const;

    /**
     * @brief Resolves seat labels ("A1", "b3", ...) of a show's screen to ids.
     *
     * @param out_ids Filled in request order on success.
     * @param out_error Reason on failure (unknown show or label).
     * @return True if every label resolved.
     */
    bool resolve_labels(ShowId show_id, const std::vector<std::string>& labels,
                        std::vector<SeatId>& out_ids, std::string& out_error) const;

    /**
     * @brief Current price of one seat for a show: base price + tier delta.
     * @return Empty if the show or the seat does not exist.
     */
    std::optional<Money> seat_price(ShowId show_id, SeatId seat_id) const;

    /**
     * @brief Loads screens and shows from a JSON file and registers them.
     *
     * Format:
     * @code{.json}
     * { "screens": [ {"name": "Screen 1", "rows": 5, "seats_per_row": 8,
     *                 "tiers": {"E": {"tier": "premium", "price_delta": 300}} } ],
     *   "shows":   [ {"title": "Inception", "screen": "Screen 1",
     *                 "starts_at_epoch_seconds": 1790000000, "base_price": 1200} ] }
     * @endcode
     *
     * @throws ConfigError on IO, parse or consistency errors.
     */
    void load_json(const std::string& path);

    /**
     * @brief Builds a rectangular seat layout labelled A1..<row><n>.
     * @param rows Number of rows (at most 26).
     * @param seats_per_row Seats in each row.
     */
    static std::vector<Seat> make_grid(int rows, int seats_per_row);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<ScreenId, Screen> screens_;
    std::unordered_map<ShowId, Show> shows_;
    ScreenId next_screen_id_{1};
    ShowId next_show_id_{1};
};

} // namespace showseat
