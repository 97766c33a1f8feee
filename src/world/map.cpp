// GemGame World
// map.cpp - Map tile helpers and the shared movement rule

#include <gemgame/world/map.hpp>

namespace gemgame::world {

bool IMap::is_tile_loaded(const TileCoords& coords) const {
    return loaded_chunk_at(chunk_of(coords)) != nullptr;
}

const Tile* IMap::loaded_tile_at(const TileCoords& coords) const {
    const Chunk* chunk = loaded_chunk_at(chunk_of(coords));
    if (chunk == nullptr) {
        return nullptr;
    }
    return &chunk->tile_at_offset(offset_of(coords));
}

bool IMap::set_loaded_tile_at(const TileCoords& coords, const Tile& tile) {
    Chunk* chunk = loaded_chunk_at(chunk_of(coords));
    if (chunk == nullptr) {
        return false;
    }
    chunk->set_tile_at_offset(offset_of(coords), tile);
    return true;
}

bool is_position_free(const IMap& map, const TileCoords& coords) {
    const Tile* tile = map.loaded_tile_at(coords);
    if (tile == nullptr || tile->is_blocking()) {
        return false;
    }
    return !map.entity_at(coords).has_value();
}

}  // namespace gemgame::world
