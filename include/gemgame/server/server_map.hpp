// GemGame Server
// server_map.hpp - Authoritative map with a position index

#pragma once

#include <gemgame/world/map.hpp>

#include <unordered_map>
#include <utility>
#include <vector>

namespace gemgame::server {

// Not synchronised: WorldState guards it
class ServerMap final : public world::IMap {
public:
    ServerMap() = default;

    // ========================================================================
    // IMap
    // ========================================================================

    [[nodiscard]] const world::Chunk* loaded_chunk_at(const world::ChunkCoords& coords) const override;
    [[nodiscard]] world::Chunk* loaded_chunk_at(const world::ChunkCoords& coords) override;
    void provide_chunk(const world::ChunkCoords& coords, const world::Chunk& chunk) override;

    [[nodiscard]] const world::Entity* entity_by_id(world::EntityId id) const override;
    [[nodiscard]] std::optional<world::EntityId> entity_at(const world::TileCoords& coords) const override;
    void add_entity(world::EntityId id, const world::Entity& entity) override;
    std::optional<world::Entity> remove_entity(world::EntityId id) override;

    // ========================================================================
    // Server Operations
    // ========================================================================

    // Moves an entity and keeps the position index current. Does not check
    // legality.
    bool set_entity_position(world::EntityId id, const world::TileCoords& position, world::Direction direction);
    [[nodiscard]] world::Entity* entity_by_id_mut(world::EntityId id);

    [[nodiscard]] std::vector<std::pair<world::EntityId, world::Entity>> entities_in_chunk(
        const world::ChunkCoords& coords) const;

    // Bomb tiles each entity has placed and not yet detonated
    void add_placed_bomb(world::EntityId owner, const world::TileCoords& coords);
    [[nodiscard]] std::vector<world::TileCoords> take_placed_bombs(world::EntityId owner);

    [[nodiscard]] size_t loaded_chunk_count() const { return chunks_.size(); }
    [[nodiscard]] size_t entity_count() const { return entities_.size(); }

    template<typename Fn>
    void for_each_entity(Fn&& fn) const {
        for (const auto& [id, entity] : entities_) {
            fn(id, entity);
        }
    }

private:
    std::unordered_map<world::ChunkCoords, world::Chunk> chunks_;
    std::unordered_map<world::EntityId, world::Entity> entities_;
    std::unordered_map<world::TileCoords, world::EntityId> positions_;
    std::unordered_map<world::EntityId, std::vector<world::TileCoords>> placed_bombs_;
};

}  // namespace gemgame::server
