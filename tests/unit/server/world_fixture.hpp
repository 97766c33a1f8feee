// GemGame Server Tests
// world_fixture.hpp - Authoritative world over an in-memory store

#pragma once

#include <gtest/gtest.h>
#include <gemgame/server/broadcast.hpp>
#include <gemgame/server/world_state.hpp>
#include <gemgame/world/terrain_generator.hpp>
#include <gemgame/world/world_store.hpp>

#include <memory>

namespace gemgame::test {

// Chunks within this distance of the origin are plain grass, so tests
// near the spawn point never depend on generated terrain
inline constexpr int32_t PREPARED_RADIUS = 3;

class WorldFixture : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<world::MemoryWorldStore>();
        for (int32_t y = -PREPARED_RADIUS; y <= PREPARED_RADIUS; ++y) {
            for (int32_t x = -PREPARED_RADIUS; x <= PREPARED_RADIUS; ++x) {
                store_->save_chunk({x, y}, world::Chunk());
            }
        }
        generator_ = std::make_shared<const world::TerrainGenerator>();
        world_ = std::make_unique<server::WorldState>(store_, generator_, channel_);
    }

    // Places a tile in the stored copy of a prepared chunk, before it is loaded
    void prepare_tile(const world::TileCoords& coords, world::TileType type) {
        const world::ChunkCoords chunk_coords = world::chunk_of(coords);
        auto chunk = store_->load_chunk(chunk_coords).value_or(world::Chunk());
        chunk.set_tile_at_offset(world::offset_of(coords), world::Tile(type));
        store_->save_chunk(chunk_coords, chunk);
    }

    // Stores a player so the next join restores it at a known position
    void prepare_player(world::ClientId client, world::EntityId entity_id, const world::TileCoords& position,
                        world::Direction direction = world::DEFAULT_DIRECTION) {
        world::PlayerRecord record;
        record.entity_id = entity_id;
        record.entity.pos = position;
        record.entity.direction = direction;
        store_->save_player(client, record);
    }

    [[nodiscard]] world::Tile tile_at(const world::TileCoords& coords) {
        return world_->chunk_at(world::chunk_of(coords)).tile_at_offset(world::offset_of(coords));
    }

    std::shared_ptr<world::MemoryWorldStore> store_;
    std::shared_ptr<const world::TerrainGenerator> generator_;
    server::BroadcastChannel channel_;
    std::unique_ptr<server::WorldState> world_;
};

}  // namespace gemgame::test
