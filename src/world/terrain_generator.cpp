// GemGame World
// terrain_generator.cpp - Procedural chunk generation using FastNoise2

#include <FastNoise/FastNoise.h>
#include <gemgame/core/logger.hpp>
#include <gemgame/world/terrain_generator.hpp>
#include <utility>

namespace gemgame::world {

namespace {

// Hash function for deterministic pseudo-random decisions
[[nodiscard]] uint32_t hash_coords(int64_t x, int64_t y, uint32_t seed) {
    uint32_t h = seed;
    h ^= static_cast<uint32_t>(x) * 374761393U;
    h ^= static_cast<uint32_t>(y) * 668265263U;
    h = (h ^ (h >> 13)) * 1274126177U;
    return h ^ (h >> 16);
}

// Convert hash to probability [0, 1)
[[nodiscard]] float hash_to_float(uint32_t hash) {
    return static_cast<float>(hash % 10000) / 10000.0f;
}

FastNoise::SmartNode<FastNoise::Generator> make_fractal(const TerrainConfig::CategoryNoise& noise) {
    auto simplex = FastNoise::New<FastNoise::Simplex>();
    auto fractal = FastNoise::New<FastNoise::FractalFBm>();
    fractal->SetSource(simplex);
    fractal->SetOctaveCount(noise.octaves);
    fractal->SetGain(noise.gain);
    fractal->SetLacunarity(noise.lacunarity);
    return fractal;
}

}  // namespace

// ============================================================================
// NoiseCategorySource
// ============================================================================

struct NoiseCategorySource::Impl {
    TerrainConfig config;

    // SmartNode is thread-safe for GenSingle calls
    FastNoise::SmartNode<FastNoise::Generator> water_node;
    FastNoise::SmartNode<FastNoise::Generator> dirt_node;
};

NoiseCategorySource::NoiseCategorySource(const TerrainConfig& config) : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
    impl_->water_node = make_fractal(config.water);
    impl_->dirt_node = make_fractal(config.dirt);
}

NoiseCategorySource::~NoiseCategorySource() = default;

TileCategory NoiseCategorySource::category_at(const TileCoords& tile) const {
    const auto& config = impl_->config;
    const float x = static_cast<float>(tile.x);
    const float y = static_cast<float>(tile.y);

    const float water = impl_->water_node->GenSingle2D(x * config.water.scale, y * config.water.scale,
                                                       static_cast<int>(config.seed));
    if (water > config.water.threshold) {
        return TileCategory::Water;
    }

    const float dirt = impl_->dirt_node->GenSingle2D(x * config.dirt.scale, y * config.dirt.scale,
                                                     static_cast<int>(config.seed + 1));
    if (dirt > config.dirt.threshold) {
        return TileCategory::Dirt;
    }

    return TileCategory::Grass;
}

// ============================================================================
// TerrainGenerator
// ============================================================================

struct TerrainGenerator::Impl {
    TerrainConfig config;
    std::shared_ptr<const ICategorySource> source;
    TransitionTiles dirt_transitions = TransitionTiles::for_type(TileType::Dirt);
    TransitionTiles water_transitions = TransitionTiles::for_type(TileType::Water);

    [[nodiscard]] Tile decorate_grass(const TileCoords& tile) const {
        const auto& d = config.decoration;
        float roll = hash_to_float(hash_coords(tile.x, tile.y, config.seed + 1000));

        const std::pair<float, TileType> table[] = {
            {d.flower, TileType::Flower},           {d.bush, TileType::Bush},
            {d.tree, TileType::Tree},               {d.rock, TileType::Rock},
            {d.emerald_rock, TileType::EmeraldRock}, {d.ruby_rock, TileType::RubyRock},
            {d.diamond_rock, TileType::DiamondRock},
        };

        for (const auto& [chance, type] : table) {
            if (roll < chance) {
                return Tile(type);
            }
            roll -= chance;
        }
        return Tile(TileType::Grass);
    }
};

TerrainGenerator::TerrainGenerator(const TerrainConfig& config, std::shared_ptr<const ICategorySource> source)
    : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
    impl_->source = source ? std::move(source) : std::make_shared<NoiseCategorySource>(config);
    GEMGAME_LOG_DEBUG(core::log_category::TERRAIN, "Terrain generator created with seed {}", config.seed);
}

TerrainGenerator::~TerrainGenerator() = default;

TerrainGenerator::TerrainGenerator(TerrainGenerator&&) noexcept = default;
TerrainGenerator& TerrainGenerator::operator=(TerrainGenerator&&) noexcept = default;

ChunkPlan TerrainGenerator::plan(const ChunkCoords& coords) const {
    ChunkPlan plan;
    for (int32_t y = 0; y < CHUNK_HEIGHT; ++y) {
        for (int32_t x = 0; x < CHUNK_WIDTH; ++x) {
            const OffsetCoords offset(static_cast<uint8_t>(x), static_cast<uint8_t>(y));
            plan.set_category_at(x, y, impl_->source->category_at(tile_of(coords, offset)));
        }
    }
    plan.remove_all_jutting_and_unconnected_tiles();
    return plan;
}

Tile TerrainGenerator::place_tile(TileCategory category, const TileCoords& tile) const {
    switch (category) {
        case TileCategory::Dirt:
            return Tile(TileType::Dirt);
        case TileCategory::Water:
            return Tile(TileType::Water);
        case TileCategory::Grass:
        default:
            return impl_->decorate_grass(tile);
    }
}

Chunk TerrainGenerator::generate(const ChunkCoords& coords) const {
    const ChunkPlan chunk_plan = plan(coords);
    Chunk chunk = chunk_plan.to_chunk(impl_->dirt_transitions, impl_->water_transitions,
                                      [this, &coords](TileCategory category, const OffsetCoords& offset) {
                                          return place_tile(category, tile_of(coords, offset));
                                      });
    GEMGAME_LOG_TRACE(core::log_category::TERRAIN, "Generated chunk {}", to_string(coords));
    return chunk;
}

const TerrainConfig& TerrainGenerator::get_config() const {
    return impl_->config;
}

}  // namespace gemgame::world
