#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>

namespace showseat {

inline std::uint64_t log_now_ms() {
    using clock = std::chrono::system_clock;
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now().time_since_epoch()).count();
}

} // namespace showseat

// Trace of state transitions; compiled out unless SHOWSEAT_VERBOSE_LOG is defined.
#ifdef SHOWSEAT_VERBOSE_LOG
#define SHOWSEAT_LOG(msg) do { std::cout << showseat::log_now_ms() << " | " << msg << std::endl; } while(0)
#else
#define SHOWSEAT_LOG(msg) do {} while(0)
#endif

// Always on: invariant alerts, observer failures, dropped events.
#define SHOWSEAT_WARN(msg) do { std::cerr << showseat::log_now_ms() << " | WARN | " << msg << std::endl; } while(0)
