// GemGame World Tests
// tile_test.cpp - Tile property and encoding unit tests

#include <gtest/gtest.h>
#include <gemgame/protocol/byte_buffer.hpp>
#include <gemgame/world/tile.hpp>

using namespace gemgame::world;
using gemgame::protocol::ByteReader;
using gemgame::protocol::ByteWriter;

class TileTest : public ::testing::Test {};

TEST_F(TileTest, DefaultIsPlainGrass) {
    Tile tile;
    EXPECT_EQ(tile.type, TileType::Grass);
    EXPECT_EQ(tile.transition, TransitionEdge::None);
    EXPECT_EQ(tile, DEFAULT_TILE);
}

TEST_F(TileTest, BlockingTiles) {
    EXPECT_FALSE(Tile(TileType::Grass).is_blocking());
    EXPECT_FALSE(Tile(TileType::Dirt).is_blocking());
    EXPECT_FALSE(Tile(TileType::Flower).is_blocking());
    EXPECT_TRUE(Tile(TileType::Water).is_blocking());
    EXPECT_TRUE(Tile(TileType::Wall).is_blocking());
    EXPECT_TRUE(Tile(TileType::Tree).is_blocking());
    EXPECT_TRUE(Tile(TileType::DiamondRock).is_blocking());
    EXPECT_TRUE(Tile(TileType::Bomb).is_blocking());
}

TEST_F(TileTest, Categories) {
    EXPECT_TRUE(Tile(TileType::Rock).is_rock());
    EXPECT_TRUE(Tile(TileType::RubyRock).is_rock());
    EXPECT_FALSE(Tile(TileType::Wall).is_rock());

    EXPECT_TRUE(Tile(TileType::Bush).is_plant());
    EXPECT_FALSE(Tile(TileType::Grass).is_plant());
}

TEST_F(TileTest, BombPlacement) {
    EXPECT_TRUE(Tile(TileType::Grass).can_hold_bomb());
    EXPECT_TRUE(Tile(TileType::Dirt).can_hold_bomb());
    EXPECT_FALSE(Tile(TileType::Dirt, TransitionEdge::Top).can_hold_bomb());
    EXPECT_FALSE(Tile(TileType::Flower).can_hold_bomb());
    EXPECT_FALSE(Tile(TileType::Bomb).can_hold_bomb());
}

TEST_F(TileTest, EncodeAndDecode) {
    const Tile tile(TileType::Tree, TransitionEdge::None, PlantState::Harvested);

    ByteWriter writer;
    tile.encode(writer);
    EXPECT_EQ(writer.size(), TILE_ENCODED_SIZE);

    ByteReader reader(writer.data());
    EXPECT_EQ(Tile::decode(reader), tile);
    EXPECT_TRUE(reader.at_end());
}

TEST_F(TileTest, UnknownEncodingDecodesToDefault) {
    ByteWriter writer;
    writer.write_u8(200);
    writer.write_u8(0);
    writer.write_u8(0);

    ByteReader reader(writer.data());
    EXPECT_EQ(Tile::decode(reader), DEFAULT_TILE);
    EXPECT_TRUE(reader.ok());
}

TEST_F(TileTest, Names) {
    EXPECT_STREQ(tile_type_to_string(TileType::EmeraldRock), "EmeraldRock");
    EXPECT_STREQ(transition_edge_to_string(TransitionEdge::CornerBottomRight), "CornerBottomRight");
}
