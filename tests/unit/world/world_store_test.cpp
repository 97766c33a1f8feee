// GemGame World Tests
// world_store_test.cpp - Chunk and player persistence unit tests

#include <gtest/gtest.h>
#include <gemgame/platform/file_io.hpp>
#include <gemgame/protocol/byte_buffer.hpp>
#include <gemgame/world/world_store.hpp>

#include <string>

namespace gemgame::world {
namespace {

using platform::FileSystem;

PlayerRecord make_record() {
    PlayerRecord record;
    record.entity_id = EntityId(0x1234ull);
    record.entity.pos = {-40, 12};
    record.entity.direction = Direction::Up;
    record.entity.cosmetics.hair_colour = HairColour::Ginger;
    record.entity.gems.increase(gameplay::Gem::Emerald, 30);
    record.entity.gems.increase(gameplay::Gem::Diamond, 1);
    record.entity.items.add(gameplay::Item::Bomb, 4);
    record.entity.bombs_placed_count = 6;
    return record;
}

// ============================================================================
// Player Records
// ============================================================================

class PlayerRecordTest : public ::testing::Test {};

TEST_F(PlayerRecordTest, EncodeAndDecode) {
    const PlayerRecord record = make_record();
    auto decoded = decode_player_record(encode_player_record(record));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, record);
}

TEST_F(PlayerRecordTest, TruncatedRecordFails) {
    auto bytes = encode_player_record(make_record());
    bytes.resize(bytes.size() - 3);
    EXPECT_FALSE(decode_player_record(bytes).has_value());
}

TEST_F(PlayerRecordTest, BadBlobsFallBackToEmpty) {
    const PlayerRecord record = make_record();

    protocol::ByteWriter writer;
    writer.write_i32(record.entity.pos.x);
    writer.write_i32(record.entity.pos.y);
    writer.write_u8(9);  // Invalid direction
    for (int i = 0; i < 5; ++i) {
        writer.write_u8(0);
    }
    writer.write_u64(record.entity_id.value());
    writer.write_blob(std::vector<uint8_t>{0xFF, 0xFF});
    writer.write_blob(std::vector<uint8_t>{});
    writer.write_u32(3);

    auto decoded = decode_player_record(writer.data());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->entity.pos, record.entity.pos);
    EXPECT_EQ(decoded->entity.direction, DEFAULT_DIRECTION);
    EXPECT_TRUE(decoded->entity.gems.is_empty());
    EXPECT_EQ(decoded->entity.items.quantity(gameplay::Item::Bomb), 0u);
    EXPECT_EQ(decoded->entity.bombs_placed_count, 3u);
}

// ============================================================================
// FileWorldStore
// ============================================================================

class FileWorldStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = FileSystem::get_temp_directory() /
                (std::string("world_store_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        FileSystem::remove_all(root_);
    }

    void TearDown() override {
        FileSystem::remove_all(root_);
    }

    std::filesystem::path root_;
};

TEST_F(FileWorldStoreTest, CreatesLayout) {
    FileWorldStore store(root_);
    EXPECT_TRUE(FileSystem::exists(root_ / "chunks"));
    EXPECT_TRUE(FileSystem::exists(root_ / "players"));
    EXPECT_EQ(store.chunk_path({-1, 2}), root_ / "chunks" / "-1_2.chunk");
    EXPECT_EQ(store.player_path(ClientId(0xAB)), root_ / "players" / "00000000000000ab.player");
}

TEST_F(FileWorldStoreTest, MissingChunkIsNullopt) {
    FileWorldStore store(root_);
    EXPECT_FALSE(store.load_chunk({0, 0}).has_value());
}

TEST_F(FileWorldStoreTest, SaveAndLoadChunk) {
    Chunk chunk;
    chunk.set_tile_at_offset({1, 1}, Tile(TileType::Bomb));

    {
        FileWorldStore store(root_);
        ASSERT_TRUE(store.save_chunk({5, -5}, chunk));
    }

    FileWorldStore reopened(root_);
    auto loaded = reopened.load_chunk({5, -5});
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, chunk);
}

TEST_F(FileWorldStoreTest, CorruptChunkIsRepairedToDefault) {
    FileWorldStore store(root_);
    ASSERT_TRUE(FileSystem::write_text(store.chunk_path({0, 0}), "garbage"));

    auto loaded = store.load_chunk({0, 0});
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, Chunk());

    // The damaged file is left alone
    auto contents = FileSystem::read_text(store.chunk_path({0, 0}));
    ASSERT_TRUE(contents.has_value());
    EXPECT_EQ(*contents, "garbage");
}

TEST_F(FileWorldStoreTest, SaveAndLoadPlayer) {
    FileWorldStore store(root_);
    const ClientId client(0x77);
    EXPECT_FALSE(store.load_player(client).has_value());

    const PlayerRecord record = make_record();
    ASSERT_TRUE(store.save_player(client, record));

    auto loaded = store.load_player(client);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, record);
}

// ============================================================================
// MemoryWorldStore
// ============================================================================

class MemoryWorldStoreTest : public ::testing::Test {
protected:
    MemoryWorldStore store_;
};

TEST_F(MemoryWorldStoreTest, ChunksAndCounters) {
    EXPECT_FALSE(store_.load_chunk({0, 0}).has_value());
    EXPECT_EQ(store_.chunk_load_count(), 1u);

    Chunk chunk(Tile(TileType::Dirt));
    EXPECT_TRUE(store_.save_chunk({0, 0}, chunk));
    EXPECT_TRUE(store_.save_chunk({0, 0}, chunk));
    EXPECT_EQ(store_.chunk_save_count(), 2u);
    EXPECT_EQ(store_.stored_chunk_count(), 1u);

    auto loaded = store_.load_chunk({0, 0});
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, chunk);
}

TEST_F(MemoryWorldStoreTest, Players) {
    const PlayerRecord record = make_record();
    EXPECT_TRUE(store_.save_player(ClientId(1), record));

    auto loaded = store_.load_player(ClientId(1));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, record);
    EXPECT_FALSE(store_.load_player(ClientId(2)).has_value());
}

}  // namespace
}  // namespace gemgame::world
