// GemGame World
// tile.cpp - Tile properties and encoding

#include <gemgame/core/logger.hpp>
#include <gemgame/protocol/byte_buffer.hpp>
#include <gemgame/world/tile.hpp>

namespace gemgame::world {

bool Tile::is_blocking() const {
    switch (type) {
        case TileType::Water:
        case TileType::Wall:
        case TileType::Bush:
        case TileType::Tree:
        case TileType::Rock:
        case TileType::EmeraldRock:
        case TileType::RubyRock:
        case TileType::DiamondRock:
        case TileType::Bomb:
            return true;
        default:
            return false;
    }
}

bool Tile::is_rock() const {
    return type == TileType::Rock || type == TileType::EmeraldRock || type == TileType::RubyRock ||
           type == TileType::DiamondRock;
}

bool Tile::is_plant() const {
    return type == TileType::Flower || type == TileType::Bush || type == TileType::Tree;
}

bool Tile::can_hold_bomb() const {
    return (type == TileType::Grass || type == TileType::Dirt) && transition == TransitionEdge::None;
}

void Tile::encode(protocol::ByteWriter& writer) const {
    writer.write_u8(static_cast<uint8_t>(type));
    writer.write_u8(static_cast<uint8_t>(transition));
    writer.write_u8(static_cast<uint8_t>(plant_state));
}

Tile Tile::decode(protocol::ByteReader& reader) {
    const uint8_t type = reader.read_u8();
    const uint8_t transition = reader.read_u8();
    const uint8_t plant_state = reader.read_u8();

    if (!reader.ok()) {
        return DEFAULT_TILE;
    }
    if (type >= static_cast<uint8_t>(TileType::Count) || transition >= static_cast<uint8_t>(TransitionEdge::Count) ||
        plant_state >= static_cast<uint8_t>(PlantState::Count)) {
        GEMGAME_LOG_WARN(core::log_category::WORLD, "Unknown tile encoding ({}, {}, {}), using default tile", type,
                         transition, plant_state);
        return DEFAULT_TILE;
    }
    return Tile(static_cast<TileType>(type), static_cast<TransitionEdge>(transition),
                static_cast<PlantState>(plant_state));
}

const char* tile_type_to_string(TileType type) {
    switch (type) {
        case TileType::Grass:
            return "Grass";
        case TileType::Dirt:
            return "Dirt";
        case TileType::Water:
            return "Water";
        case TileType::Wall:
            return "Wall";
        case TileType::Flower:
            return "Flower";
        case TileType::Bush:
            return "Bush";
        case TileType::Tree:
            return "Tree";
        case TileType::Rock:
            return "Rock";
        case TileType::EmeraldRock:
            return "EmeraldRock";
        case TileType::RubyRock:
            return "RubyRock";
        case TileType::DiamondRock:
            return "DiamondRock";
        case TileType::Bomb:
            return "Bomb";
        default:
            return "Unknown";
    }
}

const char* transition_edge_to_string(TransitionEdge edge) {
    switch (edge) {
        case TransitionEdge::None:
            return "None";
        case TransitionEdge::Top:
            return "Top";
        case TransitionEdge::Bottom:
            return "Bottom";
        case TransitionEdge::Left:
            return "Left";
        case TransitionEdge::Right:
            return "Right";
        case TransitionEdge::TopLeft:
            return "TopLeft";
        case TransitionEdge::TopRight:
            return "TopRight";
        case TransitionEdge::BottomLeft:
            return "BottomLeft";
        case TransitionEdge::BottomRight:
            return "BottomRight";
        case TransitionEdge::CornerTopLeft:
            return "CornerTopLeft";
        case TransitionEdge::CornerTopRight:
            return "CornerTopRight";
        case TransitionEdge::CornerBottomLeft:
            return "CornerBottomLeft";
        case TransitionEdge::CornerBottomRight:
            return "CornerBottomRight";
        default:
            return "Unknown";
    }
}

}  // namespace gemgame::world
