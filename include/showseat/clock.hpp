#pragma once

#include "showseat/types.hpp"

#include <atomic>

namespace showseat {

/**
 * @brief Source of "now" for every time-dependent decision in the engine.
 *
 * Hold expiry, payment deadlines and cancellation cutoffs all read the time
 * through this interface so that they agree with each other and can be
 * driven deterministically.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock final : public Clock {
public:
    TimePoint now() const override { return WallClock::now(); }
};

/**
 * @brief Manually advanced clock. Thread-safe.
 */
class ManualClock final : public Clock {
public:
    explicit ManualClock(TimePoint start = TimePoint{}) : ticks_(start.time_since_epoch().count()) {}

    TimePoint now() const override {
        return TimePoint(WallClock::duration(ticks_.load()));
    }

    void set(TimePoint tp) { ticks_.store(tp.time_since_epoch().count()); }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> d) {
        ticks_.fetch_add(std::chrono::duration_cast<WallClock::duration>(d).count());
    }

private:
    std::atomic<WallClock::rep> ticks_;
};

} // namespace showseat
