// GemGame Platform
// timer.hpp - Stopwatch and fixed-rate loop timing

#pragma once

#include <array>
#include <chrono>
#include <cstdint>

namespace gemgame::platform {

// Simple stopwatch timer using steady_clock
class Stopwatch {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::nanoseconds;

    Stopwatch();

    void reset();

    [[nodiscard]] Duration elapsed() const;
    [[nodiscard]] double elapsed_seconds() const;
    [[nodiscard]] double elapsed_milliseconds() const;

private:
    TimePoint start_time_;
};

// Paces a loop at a fixed number of iterations per second
class TickClock {
public:
    explicit TickClock(double ticks_per_second);

    // Seconds since the previous tick, 0 on the first
    [[nodiscard]] float tick();

    // Sleeps away what is left of the current tick, never spins
    void sleep_until_next_tick() const;

    [[nodiscard]] double get_rate() const { return 1.0 / tick_length_; }
    [[nodiscard]] uint64_t get_tick_count() const { return tick_count_; }

    // Rolling average of tick deltas in milliseconds
    [[nodiscard]] double get_average_tick_time() const;

private:
    static constexpr size_t HISTORY_SIZE = 120;

    double tick_length_;
    Stopwatch::TimePoint last_tick_;
    uint64_t tick_count_ = 0;

    std::array<double, HISTORY_SIZE> tick_times_{};
    size_t tick_time_index_ = 0;
};

}  // namespace gemgame::platform
