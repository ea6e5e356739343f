#include "showseat/catalog.hpp"
#include "showseat/errors.hpp"
#include "showseat/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>
#include <unordered_set>

namespace showseat {

namespace {

std::string upper(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

} // namespace

ScreenId ShowCatalog::add_screen(const std::string& name, std::vector<Seat> seats) {
    if (seats.empty()) {
        throw ConfigError("Screen '" + name + "' has no seats");
    }

    std::unordered_set<std::string> labels;
    for (std::size_t i = 0; i < seats.size(); ++i) {
        seats[i].id = static_cast<SeatId>(i);
        seats[i].label = upper(seats[i].label);
        if (!labels.insert(seats[i].label).second) {
            throw ConfigError("Screen '" + name + "' repeats seat label " + seats[i].label);
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    const ScreenId id = next_screen_id_++;
    screens_.emplace(id, Screen{id, name, std::move(seats)});
    return id;
}

ShowId ShowCatalog::add_show(const std::string& title, ScreenId screen_id,
                             TimePoint scheduled_at, Money base_price) {
    if (base_price < 0) {
        throw ConfigError("Show '" + title + "' has a negative base price");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = screens_.find(screen_id);
    if (it == screens_.end()) {
        throw ConfigError("Show '" + title + "' references unknown screen " + std::to_string(screen_id));
    }

    const ShowId id = next_show_id_++;
    Show show;
    show.id = id;
    show.title = title;
    show.screen_id = screen_id;
    show.scheduled_at = scheduled_at;
    show.base_price = base_price;
    show.total_seats = static_cast<std::uint32_t>(it->second.seats.size());
    shows_.emplace(id, show);

    SHOWSEAT_LOG("catalog: show " << id << " '" << title << "' on screen " << screen_id);
    return id;
}

std::optional<Show> ShowCatalog::find_show(ShowId show_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = shows_.find(show_id);
    if (it == shows_.end()) return std::nullopt;
    return it->second;
}

std::optional<Screen> ShowCatalog::find_screen(ScreenId screen_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = screens_.find(screen_id);
    if (it == screens_.end()) return std::nullopt;
    return it->second;
}

std::vector<Show> ShowCatalog::list_shows() const {
    std::vector<Show> out;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        out.reserve(shows_.size());
        for (const auto& kv : shows_) {
            out.push_back(kv.second);
        }
    }
    std::sort(out.begin(), out.end(), [](const Show& a, const Show& b) { return a.id < b.id; });
    return out;
}

std::vector<Seat> ShowCatalog::seats_for_show(ShowId show_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto show = shows_.find(show_id);
    if (show == shows_.end()) return {};
    auto screen = screens_.find(show->second.screen_id);
    if (screen == screens_.end()) return {};
    return screen->second.seats;
}

bool ShowCatalog::resolve_labels(ShowId show_id, const std::vector<std::string>& labels,
                                 std::vector<SeatId>& out_ids, std::string& out_error) const {
    out_ids.clear();
    out_error.clear();

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto show = shows_.find(show_id);
    if (show == shows_.end()) {
        out_error = "Invalid show id";
        return false;
    }
    const Screen& screen = screens_.at(show->second.screen_id);

    for (const auto& raw : labels) {
        const std::string label = upper(raw);
        auto it = std::find_if(screen.seats.begin(), screen.seats.end(),
                               [&](const Seat& s) { return s.label == label; });
        if (it == screen.seats.end()) {
            out_error = "Invalid seat label: " + raw;
            out_ids.clear();
            return false;
        }
        out_ids.push_back(it->id);
    }
    return true;
}

std::optional<Money> ShowCatalog::seat_price(ShowId show_id, SeatId seat_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto show = shows_.find(show_id);
    if (show == shows_.end()) return std::nullopt;
    const Screen& screen = screens_.at(show->second.screen_id);
    if (seat_id >= screen.seats.size()) return std::nullopt;
    return show->second.base_price + screen.seats[seat_id].price_delta;
}

std::vector<Seat> ShowCatalog::make_grid(int rows, int seats_per_row) {
    std::vector<Seat> seats;
    if (rows <= 0 || rows > 26 || seats_per_row <= 0) return seats;

    seats.reserve(static_cast<std::size_t>(rows * seats_per_row));
    for (int r = 0; r < rows; ++r) {
        const char row = static_cast<char>('A' + r);
        for (int n = 1; n <= seats_per_row; ++n) {
            Seat seat;
            seat.id = static_cast<SeatId>(seats.size());
            seat.label = std::string(1, row) + std::to_string(n);
            seats.push_back(seat);
        }
    }
    return seats;
}

void ShowCatalog::load_json(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw ConfigError("Cannot open catalog file: " + path);
    }

    nlohmann::json j;
    try {
        ifs >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Failed to parse catalog file: " + std::string(e.what()));
    }

    try {
        std::unordered_map<std::string, ScreenId> by_name;
        for (const auto& s : j.value("screens", nlohmann::json::array())) {
            const std::string name = s.at("name").get<std::string>();
            std::vector<Seat> seats = make_grid(s.at("rows").get<int>(), s.at("seats_per_row").get<int>());
            if (seats.empty()) {
                throw ConfigError("Screen '" + name + "' has an invalid layout");
            }

            // Optional per-row tier overrides, keyed by row letter.
            if (s.contains("tiers")) {
                for (auto it = s.at("tiers").begin(); it != s.at("tiers").end(); ++it) {
                    const std::string row = upper(it.key());
                    SeatTier tier = SeatTier::Standard;
                    if (!try_parse_seat_tier(it.value().at("tier").get<std::string>(), tier)) {
                        throw ConfigError("Unknown seat tier for row " + row);
                    }
                    const Money delta = it.value().value("price_delta", Money{0});
                    for (auto& seat : seats) {
                        if (seat.label.compare(0, row.size(), row) == 0) {
                            seat.tier = tier;
                            seat.price_delta = delta;
                        }
                    }
                }
            }
            by_name[name] = add_screen(name, std::move(seats));
        }

        for (const auto& sh : j.value("shows", nlohmann::json::array())) {
            const std::string screen_name = sh.at("screen").get<std::string>();
            auto it = by_name.find(screen_name);
            if (it == by_name.end()) {
                throw ConfigError("Show references unknown screen '" + screen_name + "'");
            }
            const TimePoint starts{std::chrono::seconds(sh.at("starts_at_epoch_seconds").get<std::int64_t>())};
            add_show(sh.at("title").get<std::string>(), it->second, starts, sh.at("base_price").get<Money>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Malformed catalog file: " + std::string(e.what()));
    }
}

} // namespace showseat
