// GemGame World
// entity.hpp - Player entities and their cosmetic attributes

#pragma once

#include "id.hpp"
#include "types.hpp"

#include <gemgame/gameplay/gems.hpp>
#include <gemgame/gameplay/items.hpp>

#include <cstdint>
#include <optional>
#include <random>

namespace gemgame::world {

// ============================================================================
// Cosmetics
// ============================================================================

enum class HairStyle : uint8_t { Quiff = 0, Mohawk = 1, Fringe = 2, Count = 3 };
enum class ClothingColour : uint8_t { Red = 0, Green = 1, Blue = 2, Grey = 3, Count = 4 };
enum class SkinColour : uint8_t { Pale = 0, Tan = 1, Brown = 2, Dark = 3, Count = 4 };
enum class HairColour : uint8_t { Black = 0, Brown = 1, Blonde = 2, Ginger = 3, Grey = 4, Count = 5 };
enum class FacialExpression : uint8_t { Neutral = 0, Angry = 1, Shocked = 2, Skeptical = 3, Count = 4 };

struct Cosmetics {
    HairStyle hair_style = HairStyle::Quiff;
    ClothingColour clothing_colour = ClothingColour::Red;
    SkinColour skin_colour = SkinColour::Pale;
    HairColour hair_colour = HairColour::Black;
    FacialExpression facial_expression = FacialExpression::Neutral;

    // Expression stays neutral for new players
    [[nodiscard]] static Cosmetics random(std::mt19937& rng);

    // Out-of-range indices fall back to the default with a warning
    [[nodiscard]] static Cosmetics from_indices(uint8_t hair_style, uint8_t clothing_colour, uint8_t skin_colour,
                                                uint8_t hair_colour, uint8_t facial_expression);

    bool operator==(const Cosmetics& other) const = default;
};

// ============================================================================
// Entity
// ============================================================================

struct Entity {
    TileCoords pos{0, 0};
    Direction direction = DEFAULT_DIRECTION;
    Cosmetics cosmetics;
    gameplay::GemCollection gems;
    gameplay::ItemInventory items;
    uint32_t bombs_placed_count = 0;

    Entity() = default;
    explicit Entity(const TileCoords& position) : pos(position) {}

    // Tile the entity faces
    [[nodiscard]] TileCoords facing_tile() const { return step(pos, direction); }

    void encode(protocol::ByteWriter& writer) const;
    // Fails only when the reader runs out or a direction is invalid
    [[nodiscard]] static std::optional<Entity> decode(protocol::ByteReader& reader);

    bool operator==(const Entity& other) const = default;
};

}  // namespace gemgame::world
