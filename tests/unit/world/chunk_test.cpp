// GemGame World Tests
// chunk_test.cpp - Chunk storage and flat encoding unit tests

#include <gtest/gtest.h>
#include <gemgame/protocol/byte_buffer.hpp>
#include <gemgame/world/chunk.hpp>

using namespace gemgame::world;
using gemgame::protocol::ByteWriter;

class ChunkTest : public ::testing::Test {};

TEST_F(ChunkTest, DefaultConstruction) {
    Chunk chunk;
    for (const Tile& tile : chunk.tiles()) {
        EXPECT_EQ(tile, DEFAULT_TILE);
    }
}

TEST_F(ChunkTest, FillConstruction) {
    Chunk chunk(Tile(TileType::Water));
    EXPECT_EQ(chunk.tile_at_offset({7, 9}).type, TileType::Water);
}

TEST_F(ChunkTest, SetAndGetTile) {
    Chunk chunk;
    chunk.set_tile_at_offset({3, 4}, Tile(TileType::Rock));

    EXPECT_EQ(chunk.tile_at_offset({3, 4}).type, TileType::Rock);
    EXPECT_EQ(chunk.tiles()[calculate_index({3, 4})].type, TileType::Rock);
    EXPECT_EQ(chunk.tile_at_offset({4, 3}), DEFAULT_TILE);
}

TEST_F(ChunkTest, OutOfRangeOffsetClampsToLastTile) {
    Chunk chunk;
    chunk.set_tile_at_offset({20, 20}, Tile(TileType::Wall));
    EXPECT_EQ(chunk.tile_at_offset({15, 15}).type, TileType::Wall);
}

TEST_F(ChunkTest, SerializeLayout) {
    Chunk chunk;
    auto bytes = chunk.serialize();
    EXPECT_EQ(bytes.size(), 4 + CHUNK_TILE_COUNT * TILE_ENCODED_SIZE);
    // Tile count, little-endian
    EXPECT_EQ(bytes[0], 0x00);
    EXPECT_EQ(bytes[1], 0x01);
}

TEST_F(ChunkTest, SerializeAndDeserialize) {
    Chunk chunk;
    chunk.set_tile_at_offset({0, 0}, Tile(TileType::Dirt, TransitionEdge::BottomLeft));
    chunk.set_tile_at_offset({15, 0}, Tile(TileType::DiamondRock));
    chunk.set_tile_at_offset({8, 15}, Tile(TileType::Flower, TransitionEdge::None, PlantState::Dead));

    Chunk decoded;
    ASSERT_TRUE(Chunk::deserialize(chunk.serialize(), decoded));
    EXPECT_EQ(decoded, chunk);
}

TEST_F(ChunkTest, ShortTileCountIsPadded) {
    ByteWriter writer;
    writer.write_u32(2);
    Tile(TileType::Rock).encode(writer);
    Tile(TileType::Wall).encode(writer);

    Chunk decoded(Tile(TileType::Water));
    ASSERT_TRUE(Chunk::deserialize(writer.data(), decoded));
    EXPECT_EQ(decoded.tile_at_offset({0, 0}).type, TileType::Rock);
    EXPECT_EQ(decoded.tile_at_offset({1, 0}).type, TileType::Wall);
    EXPECT_EQ(decoded.tile_at_offset({2, 0}), DEFAULT_TILE);
    EXPECT_EQ(decoded.tile_at_offset({15, 15}), DEFAULT_TILE);
}

TEST_F(ChunkTest, LongTileCountIsTruncated) {
    ByteWriter writer;
    writer.write_u32(static_cast<uint32_t>(CHUNK_TILE_COUNT + 2));
    for (size_t i = 0; i < CHUNK_TILE_COUNT + 2; ++i) {
        Tile(TileType::Dirt).encode(writer);
    }

    Chunk decoded;
    ASSERT_TRUE(Chunk::deserialize(writer.data(), decoded));
    EXPECT_EQ(decoded, Chunk(Tile(TileType::Dirt)));
}

TEST_F(ChunkTest, CountLargerThanDataIsRepaired) {
    ByteWriter writer;
    writer.write_u32(static_cast<uint32_t>(CHUNK_TILE_COUNT));
    Tile(TileType::Bush).encode(writer);

    Chunk decoded;
    ASSERT_TRUE(Chunk::deserialize(writer.data(), decoded));
    EXPECT_EQ(decoded.tile_at_offset({0, 0}).type, TileType::Bush);
    EXPECT_EQ(decoded.tile_at_offset({1, 0}), DEFAULT_TILE);
}

TEST_F(ChunkTest, MissingCountFails) {
    const std::vector<uint8_t> bytes = {0x01, 0x00};
    Chunk decoded;
    EXPECT_FALSE(Chunk::deserialize(bytes, decoded));
}
