// GemGame World
// tile.hpp - Tile kinds and their wire encoding

#pragma once

#include <cstdint>

namespace gemgame::protocol {
class ByteWriter;
class ByteReader;
}  // namespace gemgame::protocol

namespace gemgame::world {

enum class TileType : uint8_t {
    Grass = 0,
    Dirt = 1,
    Water = 2,
    Wall = 3,
    Flower = 4,
    Bush = 5,
    Tree = 6,
    Rock = 7,
    EmeraldRock = 8,
    RubyRock = 9,
    DiamondRock = 10,
    Bomb = 11,
    Count = 12
};

// Which edge of a dirt or water tile borders grass
enum class TransitionEdge : uint8_t {
    None = 0,
    Top = 1,
    Bottom = 2,
    Left = 3,
    Right = 4,
    TopLeft = 5,
    TopRight = 6,
    BottomLeft = 7,
    BottomRight = 8,
    CornerTopLeft = 9,
    CornerTopRight = 10,
    CornerBottomLeft = 11,
    CornerBottomRight = 12,
    Count = 13
};

enum class PlantState : uint8_t {
    Ripe = 0,
    Harvested = 1,
    Dead = 2,
    Count = 3
};

struct Tile {
    TileType type = TileType::Grass;
    TransitionEdge transition = TransitionEdge::None;
    PlantState plant_state = PlantState::Ripe;

    constexpr Tile() = default;
    constexpr explicit Tile(TileType t, TransitionEdge edge = TransitionEdge::None,
                            PlantState plant = PlantState::Ripe)
        : type(t), transition(edge), plant_state(plant) {}

    // Entities cannot stand on a blocking tile
    [[nodiscard]] bool is_blocking() const;
    [[nodiscard]] bool is_rock() const;
    [[nodiscard]] bool is_plant() const;
    // Bombs may only be placed on plain grass or dirt
    [[nodiscard]] bool can_hold_bomb() const;

    void encode(protocol::ByteWriter& writer) const;
    // Unknown tag bytes decode to the default tile with a warning
    [[nodiscard]] static Tile decode(protocol::ByteReader& reader);

    bool operator==(const Tile& other) const = default;
};

inline constexpr Tile DEFAULT_TILE{};
inline constexpr size_t TILE_ENCODED_SIZE = 3;

[[nodiscard]] const char* tile_type_to_string(TileType type);
[[nodiscard]] const char* transition_edge_to_string(TransitionEdge edge);

}  // namespace gemgame::world
