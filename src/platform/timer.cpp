// GemGame Platform
// timer.cpp - Timer implementation

#include <gemgame/platform/timer.hpp>

#include <algorithm>
#include <thread>

namespace gemgame::platform {

// Stopwatch implementation
Stopwatch::Stopwatch() : start_time_(Clock::now()) {}

void Stopwatch::reset() {
    start_time_ = Clock::now();
}

Stopwatch::Duration Stopwatch::elapsed() const {
    return std::chrono::duration_cast<Duration>(Clock::now() - start_time_);
}

double Stopwatch::elapsed_seconds() const {
    return std::chrono::duration<double>(elapsed()).count();
}

double Stopwatch::elapsed_milliseconds() const {
    return std::chrono::duration<double, std::milli>(elapsed()).count();
}

// TickClock implementation
TickClock::TickClock(double ticks_per_second)
    : tick_length_(1.0 / std::max(ticks_per_second, 1.0)), last_tick_(Stopwatch::Clock::now()) {}

float TickClock::tick() {
    const auto now = Stopwatch::Clock::now();
    double delta = 0.0;
    if (tick_count_ > 0) {
        delta = std::chrono::duration<double>(now - last_tick_).count();
    }
    last_tick_ = now;

    tick_times_[tick_time_index_] = delta;
    tick_time_index_ = (tick_time_index_ + 1) % HISTORY_SIZE;
    ++tick_count_;

    return static_cast<float>(delta);
}

void TickClock::sleep_until_next_tick() const {
    const auto next = last_tick_ + std::chrono::duration_cast<Stopwatch::Duration>(
                                       std::chrono::duration<double>(tick_length_));
    std::this_thread::sleep_until(next);
}

double TickClock::get_average_tick_time() const {
    const size_t count = std::min(tick_count_, static_cast<uint64_t>(HISTORY_SIZE));
    if (count == 0) {
        return 0.0;
    }

    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += tick_times_[i];
    }
    return (sum / static_cast<double>(count)) * 1000.0;  // Convert to ms
}

}  // namespace gemgame::platform
