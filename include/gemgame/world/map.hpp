// GemGame World
// map.hpp - Map capability shared by the client replica and the server map

#pragma once

#include "chunk.hpp"
#include "entity.hpp"
#include "id.hpp"
#include "types.hpp"

#include <optional>

namespace gemgame::world {

// A set of loaded chunks plus the entities standing in them. Movement rules
// and rendering queries are written against this interface only.
class IMap {
public:
    virtual ~IMap() = default;

    // ========================================================================
    // Chunks
    // ========================================================================

    [[nodiscard]] virtual const Chunk* loaded_chunk_at(const ChunkCoords& coords) const = 0;
    [[nodiscard]] virtual Chunk* loaded_chunk_at(const ChunkCoords& coords) = 0;
    virtual void provide_chunk(const ChunkCoords& coords, const Chunk& chunk) = 0;

    // ========================================================================
    // Entities
    // ========================================================================

    [[nodiscard]] virtual const Entity* entity_by_id(EntityId id) const = 0;
    [[nodiscard]] virtual std::optional<EntityId> entity_at(const TileCoords& coords) const = 0;
    virtual void add_entity(EntityId id, const Entity& entity) = 0;
    virtual std::optional<Entity> remove_entity(EntityId id) = 0;

    // ========================================================================
    // Tile Helpers
    // ========================================================================

    [[nodiscard]] bool is_tile_loaded(const TileCoords& coords) const;
    // nullptr when the containing chunk is not loaded
    [[nodiscard]] const Tile* loaded_tile_at(const TileCoords& coords) const;
    // Only writes into a loaded chunk, returns whether it did
    bool set_loaded_tile_at(const TileCoords& coords, const Tile& tile);
};

// A position is free when its chunk is loaded, the tile does not block and
// no entity stands there
[[nodiscard]] bool is_position_free(const IMap& map, const TileCoords& coords);

}  // namespace gemgame::world
