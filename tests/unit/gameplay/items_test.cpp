// GemGame Gameplay Tests
// items_test.cpp - Item inventory and price unit tests

#include <gtest/gtest.h>
#include <gemgame/gameplay/items.hpp>

#include <limits>

using namespace gemgame::gameplay;

class ItemInventoryTest : public ::testing::Test {
protected:
    ItemInventory inventory_;
};

TEST_F(ItemInventoryTest, StartsEmpty) {
    EXPECT_EQ(inventory_.quantity(Item::Bomb), 0u);
}

TEST_F(ItemInventoryTest, AddAndRemove) {
    inventory_.add(Item::Bomb, 3);
    EXPECT_EQ(inventory_.quantity(Item::Bomb), 3u);

    EXPECT_TRUE(inventory_.remove(Item::Bomb, 1));
    EXPECT_EQ(inventory_.quantity(Item::Bomb), 2u);

    EXPECT_FALSE(inventory_.remove(Item::Bomb, 5));
    EXPECT_EQ(inventory_.quantity(Item::Bomb), 2u);
}

TEST_F(ItemInventoryTest, AddSaturates) {
    inventory_.add(Item::Bomb, std::numeric_limits<uint32_t>::max());
    inventory_.add(Item::Bomb, 1);
    EXPECT_EQ(inventory_.quantity(Item::Bomb), std::numeric_limits<uint32_t>::max());
}

TEST_F(ItemInventoryTest, BlobRoundTrip) {
    inventory_.add(Item::Bomb, 8);
    EXPECT_EQ(ItemInventory::from_blob(inventory_.to_blob()), inventory_);
}

TEST_F(ItemInventoryTest, BadBlobIsEmpty) {
    const std::vector<uint8_t> unknown_item = {1, 5, 1, 0, 0, 0};
    EXPECT_EQ(ItemInventory::from_blob(unknown_item).quantity(Item::Bomb), 0u);

    auto blob = inventory_.to_blob();
    blob.push_back(0);
    EXPECT_EQ(ItemInventory::from_blob(blob), ItemInventory{});
}

TEST_F(ItemInventoryTest, BombPrice) {
    const ItemPrice price = item_price(Item::Bomb);
    EXPECT_EQ(price.gem, Gem::Emerald);
    EXPECT_GT(price.amount, 0u);
}

TEST_F(ItemInventoryTest, Names) {
    EXPECT_STREQ(item_to_string(Item::Bomb), "Bomb");
    EXPECT_TRUE(is_valid_item(0));
    EXPECT_FALSE(is_valid_item(1));
}
