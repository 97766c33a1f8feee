// GemGame Server Tests
// session_test.cpp - Per-client protocol handling unit tests

#include "../recording_sink.hpp"
#include "world_fixture.hpp"

#include <gemgame/server/session.hpp>

namespace gemgame::server {
namespace {

namespace ts = protocol::to_server;
namespace tc = protocol::to_client;

using gameplay::Gem;
using gameplay::Item;
using world::ClientId;
using world::Direction;
using world::EntityId;
using world::TileCoords;
using world::TileType;

const ClientId ALICE(0xA11CEull << 16);
const ClientId BOB(0xB0Bull << 16);
const EntityId ALICE_ENTITY(2001);
const EntityId BOB_ENTITY(2002);

class SessionTest : public test::WorldFixture {
protected:
    void SetUp() override {
        WorldFixture::SetUp();
        session_ = std::make_unique<SessionHandler>(*world_, sink_, SessionConfig{});
    }

    void TearDown() override {
        session_->close();
    }

    // Alice joins at a known position through the session under test
    void hello_alice(const TileCoords& position, Direction direction = Direction::Down, uint32_t bombs = 0,
                     uint32_t emeralds = 0) {
        world::PlayerRecord record;
        record.entity_id = ALICE_ENTITY;
        record.entity.pos = position;
        record.entity.direction = direction;
        record.entity.items.add(Item::Bomb, bombs);
        record.entity.gems.increase(Gem::Emerald, emeralds);
        store_->save_player(ALICE, record);

        ASSERT_TRUE(session_->handle_message(ts::Hello{protocol::PROTOCOL_VERSION, ALICE}));
        sink_.clear();
    }

    // Bob joins straight through the world, without a session
    void join_bob(const TileCoords& position) {
        prepare_player(BOB, BOB_ENTITY, position);
        ASSERT_TRUE(world_->join(BOB).has_value());
    }

    test::RecordingClientSink sink_;
    std::unique_ptr<SessionHandler> session_;
};

// ============================================================================
// Handshake
// ============================================================================

TEST_F(SessionTest, HelloSendsWelcome) {
    ASSERT_TRUE(session_->handle_message(ts::Hello{protocol::PROTOCOL_VERSION, ALICE}));
    EXPECT_TRUE(session_->is_joined());
    EXPECT_EQ(session_->client_id(), ALICE);

    auto messages = sink_.messages();
    ASSERT_EQ(messages.size(), 1u);
    const auto* welcome = std::get_if<tc::Welcome>(&messages[0]);
    ASSERT_NE(welcome, nullptr);
    EXPECT_EQ(welcome->entity.pos, TileCoords(0, 0));
    EXPECT_EQ(session_->entity_id(), welcome->entity_id);
}

TEST_F(SessionTest, MessageBeforeHelloIsRejected) {
    EXPECT_FALSE(session_->handle_message(ts::RequestChunk{{0, 0}}));
    EXPECT_FALSE(session_->handle_message(ts::PlaceBomb{}));
    EXPECT_EQ(sink_.size(), 0u);
    EXPECT_EQ(world_->online_count(), 0u);
}

TEST_F(SessionTest, SecondHelloIsRejected) {
    ASSERT_TRUE(session_->handle_message(ts::Hello{protocol::PROTOCOL_VERSION, ALICE}));
    EXPECT_FALSE(session_->handle_message(ts::Hello{protocol::PROTOCOL_VERSION, ALICE}));
}

TEST_F(SessionTest, WrongProtocolVersionIsRejected) {
    EXPECT_FALSE(session_->handle_message(ts::Hello{protocol::PROTOCOL_VERSION + 1, ALICE}));
    EXPECT_FALSE(session_->is_joined());
    EXPECT_EQ(world_->online_count(), 0u);
}

TEST_F(SessionTest, ClientAlreadyOnlineIsRejected) {
    ASSERT_TRUE(world_->join(ALICE).has_value());
    EXPECT_FALSE(session_->handle_message(ts::Hello{protocol::PROTOCOL_VERSION, ALICE}));
    EXPECT_EQ(sink_.size(), 0u);
}

TEST_F(SessionTest, CloseLeavesTheWorld) {
    hello_alice({5, 5});
    EXPECT_EQ(world_->online_count(), 1u);

    session_->close();
    EXPECT_FALSE(session_->is_joined());
    EXPECT_EQ(world_->online_count(), 0u);
    EXPECT_TRUE(store_->load_player(ALICE).has_value());
}

// ============================================================================
// Chunks
// ============================================================================

TEST_F(SessionTest, RequestChunkProvidesChunkAndEntities) {
    join_bob({7, 7});
    hello_alice({5, 5});

    ASSERT_TRUE(session_->handle_message(ts::RequestChunk{{0, 0}}));

    auto messages = sink_.messages();
    ASSERT_EQ(messages.size(), 2u);
    const auto* chunk = std::get_if<tc::ProvideChunk>(&messages[0]);
    ASSERT_NE(chunk, nullptr);
    EXPECT_EQ(chunk->coords, world::ChunkCoords(0, 0));
    EXPECT_EQ(chunk->chunk, world::Chunk());

    const auto* entity = std::get_if<tc::ProvideEntity>(&messages[1]);
    ASSERT_NE(entity, nullptr);
    EXPECT_EQ(entity->id, BOB_ENTITY);
    EXPECT_EQ(entity->entity.pos, TileCoords(7, 7));

    EXPECT_TRUE(session_->provided_chunks().contains({0, 0}));
    EXPECT_TRUE(session_->knows_entity(BOB_ENTITY));
}

TEST_F(SessionTest, OwnEntityIsNotProvided) {
    hello_alice({5, 5});
    ASSERT_TRUE(session_->handle_message(ts::RequestChunk{{0, 0}}));
    EXPECT_EQ(sink_.count_of<tc::ProvideEntity>(), 0u);
}

TEST_F(SessionTest, DistantChunksUnloadAfterMove) {
    session_ = std::make_unique<SessionHandler>(*world_, sink_, SessionConfig{1});
    hello_alice({5, 5});
    ASSERT_TRUE(session_->handle_message(ts::RequestChunk{{0, 0}}));
    ASSERT_TRUE(session_->handle_message(ts::RequestChunk{{1, 1}}));
    ASSERT_TRUE(session_->handle_message(ts::RequestChunk{{2, 0}}));
    sink_.clear();

    ASSERT_TRUE(session_->handle_message(ts::MoveMyEntity{1, Direction::Left, {4, 5}}));

    auto unloaded = sink_.all_of<tc::ShouldUnloadChunk>();
    ASSERT_EQ(unloaded.size(), 1u);
    EXPECT_EQ(unloaded[0].coords, world::ChunkCoords(2, 0));
    EXPECT_FALSE(session_->provided_chunks().contains({2, 0}));
    EXPECT_TRUE(session_->provided_chunks().contains({1, 1}));
}

// ============================================================================
// Movement
// ============================================================================

TEST_F(SessionTest, AcceptedMoveSendsNothing) {
    hello_alice({5, 5});
    ASSERT_TRUE(session_->handle_message(ts::MoveMyEntity{1, Direction::Up, {5, 6}}));
    EXPECT_EQ(sink_.size(), 0u);
    EXPECT_EQ(world_->entity(ALICE_ENTITY)->pos, TileCoords(5, 6));
}

TEST_F(SessionTest, BlockedMoveSendsCorrection) {
    prepare_tile({5, 6}, TileType::Water);
    hello_alice({5, 5});

    ASSERT_TRUE(session_->handle_message(ts::MoveMyEntity{7, Direction::Up, {5, 6}}));

    auto corrected = sink_.last_of<tc::YourEntityMoved>();
    ASSERT_TRUE(corrected.has_value());
    EXPECT_EQ(corrected->sequence, 7u);
    EXPECT_EQ(corrected->position, TileCoords(5, 5));
}

TEST_F(SessionTest, WrongDestinationSendsActualPosition) {
    hello_alice({5, 5});

    ASSERT_TRUE(session_->handle_message(ts::MoveMyEntity{3, Direction::Up, {9, 9}}));

    auto corrected = sink_.last_of<tc::YourEntityMoved>();
    ASSERT_TRUE(corrected.has_value());
    EXPECT_EQ(corrected->sequence, 3u);
    EXPECT_EQ(corrected->position, TileCoords(5, 6));
}

TEST_F(SessionTest, PredictedMoveOntoFreshlyTakenTileIsReverted) {
    join_bob({7, 5});
    hello_alice({5, 5});

    // Bob steps into the gap before Alice's move arrives
    ASSERT_TRUE(world_->move_entity(BOB_ENTITY, Direction::Left)->committed);
    ASSERT_TRUE(session_->handle_message(ts::MoveMyEntity{4, Direction::Right, {6, 5}}));

    auto corrected = sink_.last_of<tc::YourEntityMoved>();
    ASSERT_TRUE(corrected.has_value());
    EXPECT_EQ(corrected->sequence, 4u);
    EXPECT_EQ(corrected->position, TileCoords(5, 5));
}

// ============================================================================
// Bombs and Purchases
// ============================================================================

TEST_F(SessionTest, PlaceBombReportsInventory) {
    hello_alice({5, 5}, Direction::Down, 3);

    ASSERT_TRUE(session_->handle_message(ts::PlaceBomb{}));

    auto inventory = sink_.last_of<tc::YourInventoryChanged>();
    ASSERT_TRUE(inventory.has_value());
    EXPECT_EQ(inventory->item, Item::Bomb);
    EXPECT_EQ(inventory->quantity, 2u);
}

TEST_F(SessionTest, DetonateReportsCollectedGems) {
    prepare_tile({4, 3}, TileType::Rock);
    prepare_tile({6, 3}, TileType::EmeraldRock);
    prepare_tile({5, 3}, TileType::DiamondRock);
    hello_alice({5, 5}, Direction::Down, 1);
    ASSERT_TRUE(session_->handle_message(ts::PlaceBomb{}));
    sink_.clear();

    ASSERT_TRUE(session_->handle_message(ts::DetonateBombs{}));

    auto collected = sink_.all_of<tc::YouCollectedGems>();
    EXPECT_EQ(collected.size(), 3u);

    // One summary per gem kind that changed
    auto totals = sink_.all_of<tc::YourGemsChanged>();
    ASSERT_EQ(totals.size(), 2u);
    const auto alice = world_->entity(ALICE_ENTITY);
    ASSERT_TRUE(alice.has_value());
    for (const auto& total : totals) {
        EXPECT_NE(total.gem, Gem::Ruby);
        EXPECT_EQ(total.quantity, alice->gems.quantity(total.gem));
    }
}

TEST_F(SessionTest, PurchaseReportsInventoryAndGems) {
    const auto price = gameplay::item_price(Item::Bomb);
    hello_alice({5, 5}, Direction::Down, 0, price.amount);

    ASSERT_TRUE(session_->handle_message(ts::PurchaseItem{Item::Bomb, 1}));

    auto messages = sink_.messages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(std::get<tc::YourInventoryChanged>(messages[0]), (tc::YourInventoryChanged{Item::Bomb, 1}));
    EXPECT_EQ(std::get<tc::YourGemsChanged>(messages[1]), (tc::YourGemsChanged{price.gem, 0}));
}

TEST_F(SessionTest, FailedPurchaseStillReportsTotals) {
    hello_alice({5, 5});

    ASSERT_TRUE(session_->handle_message(ts::PurchaseItem{Item::Bomb, 1}));

    EXPECT_EQ(sink_.last_of<tc::YourInventoryChanged>()->quantity, 0u);
    EXPECT_EQ(sink_.last_of<tc::YourGemsChanged>()->quantity, 0u);
}

// ============================================================================
// World Changes
// ============================================================================

TEST_F(SessionTest, ChangesIgnoredBeforeJoin) {
    session_->handle_world_change(TileChanged{{1, 1}, world::Tile(TileType::Bomb)});
    EXPECT_EQ(sink_.size(), 0u);
}

TEST_F(SessionTest, TileChangeInProvidedChunk) {
    hello_alice({5, 5});
    ASSERT_TRUE(session_->handle_message(ts::RequestChunk{{0, 0}}));
    sink_.clear();

    session_->handle_world_change(TileChanged{{3, 3}, world::Tile(TileType::Bomb)});
    session_->handle_world_change(TileChanged{{30, 3}, world::Tile(TileType::Bomb)});

    auto changes = sink_.all_of<tc::ChangeTile>();
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].coords, TileCoords(3, 3));
}

TEST_F(SessionTest, KnownEntityMovesWithinView) {
    join_bob({7, 7});
    hello_alice({5, 5});
    ASSERT_TRUE(session_->handle_message(ts::RequestChunk{{0, 0}}));
    sink_.clear();

    session_->handle_world_change(EntityMoved{BOB_ENTITY, {8, 7}, Direction::Right});

    auto moves = sink_.all_of<tc::MoveEntity>();
    ASSERT_EQ(moves.size(), 1u);
    EXPECT_EQ(moves[0], (tc::MoveEntity{BOB_ENTITY, {8, 7}, Direction::Right}));
}

TEST_F(SessionTest, KnownEntityLeavingViewIsUnloaded) {
    join_bob({15, 7});
    hello_alice({5, 5});
    ASSERT_TRUE(session_->handle_message(ts::RequestChunk{{0, 0}}));
    sink_.clear();

    session_->handle_world_change(EntityMoved{BOB_ENTITY, {16, 7}, Direction::Right});

    EXPECT_EQ(sink_.count_of<tc::ShouldUnloadEntity>(), 1u);
    EXPECT_FALSE(session_->knows_entity(BOB_ENTITY));
}

TEST_F(SessionTest, EntityWalkingIntoViewIsProvided) {
    join_bob({16, 7});
    hello_alice({5, 5});
    ASSERT_TRUE(session_->handle_message(ts::RequestChunk{{0, 0}}));
    sink_.clear();

    ASSERT_TRUE(world_->move_entity(BOB_ENTITY, Direction::Left)->committed);
    session_->handle_world_change(EntityMoved{BOB_ENTITY, {15, 7}, Direction::Left});

    auto provided = sink_.all_of<tc::ProvideEntity>();
    ASSERT_EQ(provided.size(), 1u);
    EXPECT_EQ(provided[0].id, BOB_ENTITY);
    EXPECT_EQ(provided[0].entity.pos, TileCoords(15, 7));
    EXPECT_TRUE(session_->knows_entity(BOB_ENTITY));
}

TEST_F(SessionTest, OwnMovesAreIgnored) {
    hello_alice({5, 5});
    ASSERT_TRUE(session_->handle_message(ts::RequestChunk{{0, 0}}));
    sink_.clear();

    session_->handle_world_change(EntityMoved{ALICE_ENTITY, {5, 6}, Direction::Up});
    EXPECT_EQ(sink_.size(), 0u);
}

TEST_F(SessionTest, JoiningEntityInViewIsProvided) {
    hello_alice({5, 5});
    ASSERT_TRUE(session_->handle_message(ts::RequestChunk{{0, 0}}));
    sink_.clear();

    auto subscription = channel_.subscribe();
    join_bob({9, 9});
    for (const auto& change : subscription->drain()) {
        session_->handle_world_change(change);
    }

    ASSERT_EQ(sink_.count_of<tc::ProvideEntity>(), 1u);
    EXPECT_EQ(sink_.last_of<tc::ProvideEntity>()->id, BOB_ENTITY);
}

TEST_F(SessionTest, LeavingEntityIsUnloaded) {
    join_bob({9, 9});
    hello_alice({5, 5});
    ASSERT_TRUE(session_->handle_message(ts::RequestChunk{{0, 0}}));
    sink_.clear();

    auto subscription = channel_.subscribe();
    world_->leave(BOB);
    for (const auto& change : subscription->drain()) {
        session_->handle_world_change(change);
    }

    auto unloaded = sink_.all_of<tc::ShouldUnloadEntity>();
    ASSERT_EQ(unloaded.size(), 1u);
    EXPECT_EQ(unloaded[0].id, BOB_ENTITY);
}

}  // namespace
}  // namespace gemgame::server
