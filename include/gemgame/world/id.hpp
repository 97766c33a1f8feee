// GemGame World
// id.hpp - Time-ordered 64-bit identifiers for entities and clients

#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace gemgame::world {

// Upper 48 bits: milliseconds since the Unix epoch. Lower 16 bits: a
// per-process counter, so ids made in the same millisecond stay distinct
// and ids sort by creation time.
class Id {
public:
    static constexpr int COUNTER_BITS = 16;

    constexpr Id() = default;
    constexpr explicit Id(uint64_t value) : value_(value) {}

    [[nodiscard]] static Id generate();

    [[nodiscard]] constexpr uint64_t value() const { return value_; }
    [[nodiscard]] constexpr uint64_t timestamp_ms() const { return value_ >> COUNTER_BITS; }

    // Sixteen lowercase hex digits
    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] static std::optional<Id> from_string(std::string_view text);

    constexpr auto operator<=>(const Id&) const = default;

private:
    uint64_t value_ = 0;
};

using EntityId = Id;
using ClientId = Id;

}  // namespace gemgame::world

namespace std {

template <>
struct hash<gemgame::world::Id> {
    size_t operator()(const gemgame::world::Id& id) const noexcept { return std::hash<uint64_t>{}(id.value()); }
};

}  // namespace std
