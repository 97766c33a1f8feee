// GemGame World Tests
// terrain_generator_test.cpp - Tests for TerrainGenerator class

#include <gtest/gtest.h>

#include <gemgame/world/chunk.hpp>
#include <gemgame/world/terrain_generator.hpp>
#include <memory>
#include <thread>
#include <vector>

namespace gemgame::world {
namespace {

// Category source with a single dirt square, everything else grass
class SquareCategorySource : public ICategorySource {
public:
    SquareCategorySource(const TileCoords& min, const TileCoords& max) : min_(min), max_(max) {}

    [[nodiscard]] TileCategory category_at(const TileCoords& tile) const override {
        const bool inside = tile.x >= min_.x && tile.x <= max_.x && tile.y >= min_.y && tile.y <= max_.y;
        return inside ? TileCategory::Dirt : TileCategory::Grass;
    }

private:
    TileCoords min_;
    TileCoords max_;
};

// Lone water tiles that smoothing must remove
class SpeckleCategorySource : public ICategorySource {
public:
    [[nodiscard]] TileCategory category_at(const TileCoords& tile) const override {
        return (tile.x % 4 == 0 && tile.y % 4 == 0) ? TileCategory::Water : TileCategory::Grass;
    }
};

class TerrainGeneratorTest : public ::testing::Test {
protected:
    static TerrainConfig make_config(uint32_t seed) {
        TerrainConfig config;
        config.seed = seed;
        return config;
    }
};

// Test: Same seed produces the same chunk (deterministic)
TEST_F(TerrainGeneratorTest, DeterministicChunks) {
    TerrainGenerator gen1(make_config(12345));
    TerrainGenerator gen2(make_config(12345));

    EXPECT_EQ(gen1.generate({0, 0}), gen2.generate({0, 0}));
    EXPECT_EQ(gen1.generate({-7, 3}), gen2.generate({-7, 3}));
    EXPECT_EQ(gen1.generate({100000, -100000}), gen2.generate({100000, -100000}));
}

// Test: Generating the same chunk again on one instance is repeatable
TEST_F(TerrainGeneratorTest, OriginIsRepeatable) {
    TerrainGenerator gen(make_config(7));
    const Chunk first = gen.generate({0, 0});
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(gen.generate({0, 0}), first);
    }
}

// Test: Different seeds produce different terrain
TEST_F(TerrainGeneratorTest, DifferentSeedsProduceDifferentTerrain) {
    TerrainGenerator gen1(make_config(12345));
    TerrainGenerator gen2(make_config(54321));

    int different_count = 0;
    for (int i = 0; i < 10; ++i) {
        if (gen1.generate({i * 3, -i}) != gen2.generate({i * 3, -i})) {
            ++different_count;
        }
    }
    EXPECT_GE(different_count, 8);
}

// Test: Generation from several threads matches single-threaded output
TEST_F(TerrainGeneratorTest, ThreadSafeGeneration) {
    TerrainGenerator gen(make_config(99));
    const Chunk expected = gen.generate({2, 2});

    std::vector<Chunk> results(4);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&gen, &results, i]() { results[i] = gen.generate({2, 2}); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const Chunk& chunk : results) {
        EXPECT_EQ(chunk, expected);
    }
}

// Test: Generated chunks satisfy the smoothing invariant
TEST_F(TerrainGeneratorTest, PlansHaveNoJuttingTiles) {
    TerrainGenerator gen(make_config(2024));
    for (int32_t cx = -2; cx <= 2; ++cx) {
        const ChunkPlan plan = gen.plan({cx, cx * 2});
        for (int32_t x = 0; x < CHUNK_WIDTH; ++x) {
            for (int32_t y = 0; y < CHUNK_HEIGHT; ++y) {
                if (plan.category_at(x, y) != DEFAULT_CATEGORY) {
                    EXPECT_LT(plan.mismatches_at(x, y).count(), 3);
                }
            }
        }
    }
}

// Test: A custom category source drives the plan
TEST_F(TerrainGeneratorTest, UsesCategorySource) {
    auto source = std::make_shared<SquareCategorySource>(TileCoords(18, 18), TileCoords(21, 21));
    TerrainGenerator gen(make_config(1), source);

    const Chunk chunk = gen.generate({1, 1});

    // Square covers offsets (2..5, 2..5) of chunk (1, 1)
    EXPECT_EQ(chunk.tile_at_offset({3, 3}), Tile(TileType::Dirt));
    EXPECT_EQ(chunk.tile_at_offset({2, 2}), Tile(TileType::Dirt, TransitionEdge::BottomLeft));
    EXPECT_EQ(chunk.tile_at_offset({5, 5}), Tile(TileType::Dirt, TransitionEdge::TopRight));
    EXPECT_EQ(chunk.tile_at_offset({3, 5}), Tile(TileType::Dirt, TransitionEdge::Top));

    // Outside the square everything is grass or a grass decoration
    const Tile& outside = chunk.tile_at_offset({10, 10});
    EXPECT_NE(outside.type, TileType::Dirt);
    EXPECT_NE(outside.type, TileType::Water);
}

// Test: Lone tiles from the source are smoothed away
TEST_F(TerrainGeneratorTest, SmoothsSourceSpeckles) {
    TerrainGenerator gen(make_config(1), std::make_shared<SpeckleCategorySource>());
    const Chunk chunk = gen.generate({0, 0});

    for (const Tile& tile : chunk.tiles()) {
        EXPECT_NE(tile.type, TileType::Water);
    }
}

// Test: Grass decoration only yields grass-compatible tiles
TEST_F(TerrainGeneratorTest, GrassDecorations) {
    TerrainGenerator gen(make_config(5));

    int decorated = 0;
    for (int32_t x = 0; x < 200; ++x) {
        const Tile tile = gen.place_tile(TileCategory::Grass, {x, -x});
        EXPECT_NE(tile.type, TileType::Water);
        EXPECT_NE(tile.type, TileType::Dirt);
        EXPECT_NE(tile.type, TileType::Bomb);
        if (tile.type != TileType::Grass) {
            ++decorated;
        }
    }
    EXPECT_LT(decorated, 100);

    EXPECT_EQ(gen.place_tile(TileCategory::Dirt, {0, 0}), Tile(TileType::Dirt));
    EXPECT_EQ(gen.place_tile(TileCategory::Water, {0, 0}), Tile(TileType::Water));
}

// Test: Config is retained
TEST_F(TerrainGeneratorTest, GetConfig) {
    TerrainConfig config = make_config(31337);
    config.water.threshold = 0.8f;
    TerrainGenerator gen(config);

    EXPECT_EQ(gen.get_config().seed, 31337u);
    EXPECT_FLOAT_EQ(gen.get_config().water.threshold, 0.8f);
}

}  // namespace
}  // namespace gemgame::world
