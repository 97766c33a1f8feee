// GemGame Gameplay
// gems.hpp - Gem kinds, gem collections and rock yields

#pragma once

#include <gemgame/world/tile.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace gemgame::protocol {
class ByteWriter;
class ByteReader;
}  // namespace gemgame::protocol

namespace gemgame::gameplay {

enum class Gem : uint8_t {
    Emerald = 0,
    Ruby = 1,
    Diamond = 2,
    Count = 3
};

inline constexpr size_t GEM_KIND_COUNT = static_cast<size_t>(Gem::Count);

[[nodiscard]] const char* gem_to_string(Gem gem);

[[nodiscard]] inline bool is_valid_gem(uint8_t value) {
    return value < static_cast<uint8_t>(Gem::Count);
}

class GemCollection {
public:
    GemCollection() = default;

    [[nodiscard]] uint32_t quantity(Gem gem) const;
    void increase(Gem gem, uint32_t amount);
    // Removes the amount only if it is all there
    bool decrease(Gem gem, uint32_t amount);
    [[nodiscard]] bool is_empty() const;

    // Persisted blob: u8 entry count, then (u8 gem, u32 quantity) pairs
    [[nodiscard]] std::vector<uint8_t> to_blob() const;
    // An undecodable blob yields an empty collection with a warning
    [[nodiscard]] static GemCollection from_blob(std::span<const uint8_t> blob);

    void encode(protocol::ByteWriter& writer) const;
    [[nodiscard]] static GemCollection decode(protocol::ByteReader& reader);

    bool operator==(const GemCollection& other) const = default;

private:
    std::array<uint32_t, GEM_KIND_COUNT> quantities_{};
};

// What smashing a rock gives
struct GemYield {
    Gem gem = Gem::Emerald;
    uint32_t minimum = 1;
    uint32_t maximum = 1;
};

[[nodiscard]] std::optional<GemYield> rock_yield(world::TileType type);

// Deterministic amount inside the yield range for a roll value
[[nodiscard]] uint32_t yield_amount(const GemYield& yield, uint32_t roll);

}  // namespace gemgame::gameplay
