// GemGame Server
// world_state.hpp - Authoritative world shared by every session

#pragma once

#include "broadcast.hpp"
#include "server_map.hpp"

#include <gemgame/gameplay/gems.hpp>
#include <gemgame/gameplay/items.hpp>
#include <gemgame/world/terrain_generator.hpp>
#include <gemgame/world/world_store.hpp>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gemgame::server {

// ============================================================================
// Operation Results
// ============================================================================

struct JoinResult {
    world::EntityId entity_id;
    world::Entity entity;
};

struct MoveOutcome {
    bool committed = false;
    // Authoritative position after the attempt
    world::TileCoords position{0, 0};
    world::Direction direction = world::DEFAULT_DIRECTION;
};

struct PlaceBombOutcome {
    bool placed = false;
    uint32_t bombs_remaining = 0;
};

struct CollectedGems {
    gameplay::Gem gem = gameplay::Gem::Emerald;
    uint32_t amount = 0;
};

struct DetonateOutcome {
    uint32_t detonated = 0;
    std::vector<CollectedGems> collected;
    gameplay::GemCollection gems;
};

struct PurchaseOutcome {
    bool purchased = false;
    uint32_t item_quantity = 0;
    gameplay::Gem gem = gameplay::Gem::Emerald;
    uint32_t gem_quantity = 0;
};

// ============================================================================
// WorldState
// ============================================================================

/// Owns the server map behind a single mutex. Each operation holds the lock
/// for one read-modify-write step. Store access and terrain generation run
/// outside it.
class WorldState {
public:
    // Tiles searched around the spawn point for a free position
    static constexpr int SPAWN_SEARCH_RADIUS = 64;

    WorldState(std::shared_ptr<world::IWorldStore> store, std::shared_ptr<const world::TerrainGenerator> generator,
               BroadcastChannel& channel);

    WorldState(const WorldState&) = delete;
    WorldState& operator=(const WorldState&) = delete;

    // ========================================================================
    // Chunks
    // ========================================================================

    /// Returns the chunk, loading it from the store or generating it first if
    /// needed. Concurrent callers for the same coordinates wait for a single
    /// load or generation.
    [[nodiscard]] world::Chunk chunk_at(const world::ChunkCoords& coords);

    [[nodiscard]] bool is_chunk_loaded(const world::ChunkCoords& coords) const;
    [[nodiscard]] size_t loaded_chunk_count() const;
    [[nodiscard]] size_t generated_chunk_count() const { return generated_chunks_.load(); }

    // ========================================================================
    // Players
    // ========================================================================

    /// Loads or creates the client's entity and puts it on the map.
    /// nullopt when the client is already online or no spawn tile is free.
    [[nodiscard]] std::optional<JoinResult> join(world::ClientId client);

    /// Saves the client's entity and removes it from the map
    void leave(world::ClientId client);

    [[nodiscard]] std::optional<world::Entity> entity(world::EntityId id) const;
    [[nodiscard]] std::vector<std::pair<world::EntityId, world::Entity>> entities_in_chunk(
        const world::ChunkCoords& coords) const;
    [[nodiscard]] size_t online_count() const;

    // ========================================================================
    // Actions
    // ========================================================================

    /// Moves one tile in the direction if the destination is free.
    /// nullopt when the entity is not on the map.
    [[nodiscard]] std::optional<MoveOutcome> move_entity(world::EntityId id, world::Direction direction);

    /// Puts a bomb from the inventory on the tile the entity faces
    [[nodiscard]] std::optional<PlaceBombOutcome> place_bomb(world::EntityId id);

    /// Clears every bomb the entity placed and smashes rocks around them
    [[nodiscard]] std::optional<DetonateOutcome> detonate_bombs(world::EntityId id);

    [[nodiscard]] std::optional<PurchaseOutcome> purchase(world::EntityId id, gameplay::Item item, uint32_t quantity);

    // ========================================================================
    // Persistence
    // ========================================================================

    /// Writes chunks changed since the last flush
    void flush_dirty_chunks();

    /// Flushes chunks and saves every online player
    void save_all();

private:
    void ensure_chunk(const world::ChunkCoords& coords);
    // Places the entity on the nearest free tile and marks the client online
    bool spawn(world::ClientId client, world::EntityId id, world::Entity& entity, const world::TileCoords& start);
    void set_tile_locked(const world::TileCoords& coords, const world::Tile& tile);

    std::shared_ptr<world::IWorldStore> store_;
    std::shared_ptr<const world::TerrainGenerator> generator_;
    BroadcastChannel& channel_;

    mutable std::mutex mutex_;
    std::condition_variable chunk_ready_;
    ServerMap map_;
    std::unordered_set<world::ChunkCoords> in_flight_;
    std::unordered_set<world::ChunkCoords> dirty_chunks_;
    std::unordered_map<world::ClientId, world::EntityId> online_;
    std::unordered_set<world::ClientId> joining_;
    std::mt19937 rng_;

    // Serialises flushes so an older chunk copy never overwrites a newer one
    std::mutex flush_mutex_;
    std::atomic<size_t> generated_chunks_{0};
};

}  // namespace gemgame::server
