// GemGame Client
// client_map.hpp - Client replica of the world with chunk streaming

#pragma once

#include "transition.hpp"

#include <gemgame/protocol/messages.hpp>
#include <gemgame/world/map.hpp>

#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gemgame::client {

/// Chunks and remote entities the server has provided. Asking for a tile in
/// a chunk that is not loaded marks the chunk as needed; needed chunks are
/// requested once and stay needed until they arrive.
///
/// The player's own entity is not stored here.
class ClientMap final : public world::IMap {
public:
    explicit ClientMap(float remote_move_duration = 0.2f);

    // ========================================================================
    // IMap
    // ========================================================================

    [[nodiscard]] const world::Chunk* loaded_chunk_at(const world::ChunkCoords& coords) const override;
    [[nodiscard]] world::Chunk* loaded_chunk_at(const world::ChunkCoords& coords) override;
    // Clears the coordinates from the needed and requested sets
    void provide_chunk(const world::ChunkCoords& coords, const world::Chunk& chunk) override;

    [[nodiscard]] const world::Entity* entity_by_id(world::EntityId id) const override;
    [[nodiscard]] std::optional<world::EntityId> entity_at(const world::TileCoords& coords) const override;
    void add_entity(world::EntityId id, const world::Entity& entity) override;
    std::optional<world::Entity> remove_entity(world::EntityId id) override;

    // ========================================================================
    // Streaming
    // ========================================================================

    /// Loaded tile, or nullptr after marking its chunk as needed
    [[nodiscard]] const world::Tile* tile_at(const world::TileCoords& coords);

    /// Sends RequestChunk for every needed chunk not yet requested
    void request_needed_chunks(protocol::ToServerSink& sink);

    /// Drops a chunk and the remote entities standing in it
    void remove_chunk(const world::ChunkCoords& coords);

    /// Forgets everything, used after a disconnect
    void clear();

    [[nodiscard]] const std::unordered_set<world::ChunkCoords>& needed_chunks() const { return needed_; }
    [[nodiscard]] const std::unordered_set<world::ChunkCoords>& requested_chunks() const { return requested_; }
    [[nodiscard]] std::vector<world::ChunkCoords> loaded_chunk_coords() const;
    [[nodiscard]] size_t loaded_chunk_count() const { return chunks_.size(); }

    // ========================================================================
    // Remote Entities
    // ========================================================================

    /// Applies a server move and starts its transition
    void move_remote_entity(world::EntityId id, const world::TileCoords& position, world::Direction direction);

    /// Interpolated position for drawing
    [[nodiscard]] std::optional<glm::vec2> remote_entity_position(world::EntityId id) const;

    [[nodiscard]] size_t entity_count() const { return entities_.size(); }

    void update(float delta);

private:
    struct RemoteEntity {
        world::Entity entity;
        Transition transition;
    };

    std::unordered_map<world::ChunkCoords, world::Chunk> chunks_;
    std::unordered_set<world::ChunkCoords> needed_;
    std::unordered_set<world::ChunkCoords> requested_;
    std::unordered_map<world::EntityId, RemoteEntity> entities_;
    float remote_move_duration_;
};

}  // namespace gemgame::client
