// GemGame World Tests
// entity_test.cpp - Entity and cosmetics unit tests

#include <gtest/gtest.h>
#include <gemgame/protocol/byte_buffer.hpp>
#include <gemgame/world/entity.hpp>

#include <random>

using namespace gemgame;
using namespace gemgame::world;

class EntityTest : public ::testing::Test {};

TEST_F(EntityTest, Defaults) {
    Entity entity({4, -2});
    EXPECT_EQ(entity.pos, TileCoords(4, -2));
    EXPECT_EQ(entity.direction, DEFAULT_DIRECTION);
    EXPECT_TRUE(entity.gems.is_empty());
    EXPECT_EQ(entity.items.quantity(gameplay::Item::Bomb), 0u);
    EXPECT_EQ(entity.bombs_placed_count, 0u);
}

TEST_F(EntityTest, FacingTile) {
    Entity entity({0, 0});
    entity.direction = Direction::Left;
    EXPECT_EQ(entity.facing_tile(), TileCoords(-1, 0));
    entity.direction = Direction::Up;
    EXPECT_EQ(entity.facing_tile(), TileCoords(0, 1));
}

TEST_F(EntityTest, EncodeAndDecode) {
    Entity entity({-100, 250});
    entity.direction = Direction::Right;
    entity.cosmetics = Cosmetics::from_indices(2, 3, 1, 4, 2);
    entity.gems.increase(gameplay::Gem::Diamond, 5);
    entity.items.add(gameplay::Item::Bomb, 2);
    entity.bombs_placed_count = 17;

    protocol::ByteWriter writer;
    entity.encode(writer);

    protocol::ByteReader reader(writer.data());
    auto decoded = Entity::decode(reader);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, entity);
    EXPECT_TRUE(reader.at_end());
}

TEST_F(EntityTest, DecodeRejectsInvalidDirection) {
    Entity entity;
    protocol::ByteWriter writer;
    entity.encode(writer);

    auto bytes = writer.take();
    bytes[8] = 7;  // Direction follows the position
    protocol::ByteReader reader(bytes);
    EXPECT_FALSE(Entity::decode(reader).has_value());
    EXPECT_FALSE(reader.ok());
}

TEST_F(EntityTest, DecodeRejectsTruncatedData) {
    Entity entity;
    protocol::ByteWriter writer;
    entity.encode(writer);

    auto bytes = writer.take();
    bytes.resize(10);
    protocol::ByteReader reader(bytes);
    EXPECT_FALSE(Entity::decode(reader).has_value());
}

TEST_F(EntityTest, InvalidCosmeticIndicesFallBack) {
    Cosmetics cosmetics = Cosmetics::from_indices(9, 1, 9, 2, 9);
    EXPECT_EQ(cosmetics.hair_style, HairStyle::Quiff);
    EXPECT_EQ(cosmetics.clothing_colour, ClothingColour::Green);
    EXPECT_EQ(cosmetics.skin_colour, SkinColour::Pale);
    EXPECT_EQ(cosmetics.hair_colour, HairColour::Blonde);
    EXPECT_EQ(cosmetics.facial_expression, FacialExpression::Neutral);
}

TEST_F(EntityTest, RandomCosmeticsKeepNeutralExpression) {
    std::mt19937 rng(42);
    for (int i = 0; i < 50; ++i) {
        Cosmetics cosmetics = Cosmetics::random(rng);
        EXPECT_EQ(cosmetics.facial_expression, FacialExpression::Neutral);
        EXPECT_LT(static_cast<uint8_t>(cosmetics.hair_colour), static_cast<uint8_t>(HairColour::Count));
    }
}
