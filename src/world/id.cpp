// GemGame World
// id.cpp - Identifier generation

#include <gemgame/world/id.hpp>

#include <charconv>
#include <chrono>
#include <mutex>

#include <spdlog/fmt/fmt.h>

namespace gemgame::world {

Id Id::generate() {
    static std::mutex mutex;
    static uint64_t last_millis = 0;
    static uint64_t counter = 0;

    const auto now = std::chrono::system_clock::now().time_since_epoch();
    uint64_t millis = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());

    std::lock_guard lock(mutex);

    // Never go backwards, and borrow the next millisecond when the counter
    // for this one is used up
    if (millis < last_millis) {
        millis = last_millis;
    }
    if (millis == last_millis) {
        ++counter;
        if (counter >= (uint64_t{1} << COUNTER_BITS)) {
            ++millis;
            counter = 0;
        }
    } else {
        counter = 0;
    }
    last_millis = millis;

    return Id((millis << COUNTER_BITS) | counter);
}

std::string Id::to_string() const {
    return fmt::format("{:016x}", value_);
}

std::optional<Id> Id::from_string(std::string_view text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.remove_suffix(1);
    }
    if (text.empty() || text.size() > 16) {
        return std::nullopt;
    }

    uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value, 16);
    if (ec != std::errc() || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return Id(value);
}

}  // namespace gemgame::world
