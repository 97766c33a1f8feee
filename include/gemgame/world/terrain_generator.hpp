// GemGame World
// terrain_generator.hpp - Procedural chunk generation using FastNoise2

#pragma once

#include "chunk.hpp"
#include "chunk_plan.hpp"
#include "types.hpp"

#include <cstdint>
#include <memory>

namespace gemgame::world {

// ============================================================================
// Terrain Configuration
// ============================================================================

struct TerrainConfig {
    // World seed for deterministic generation
    uint32_t seed = 0;

    // Fractal noise field deciding one category
    struct CategoryNoise {
        float scale = 0.05f;      // Feature size, smaller is larger
        int octaves = 3;          // Number of noise layers
        float gain = 0.5f;        // Persistence - amplitude reduction per octave
        float lacunarity = 2.0f;  // Frequency increase per octave
        float threshold = 0.35f;  // Noise above this selects the category
    };

    CategoryNoise water{0.04f, 3, 0.5f, 2.0f, 0.4f};
    CategoryNoise dirt{0.06f, 2, 0.5f, 2.0f, 0.3f};

    // Per-tile probabilities for decorating plain grass, checked in order
    struct Decoration {
        float flower = 0.04f;
        float bush = 0.02f;
        float tree = 0.02f;
        float rock = 0.012f;
        float emerald_rock = 0.006f;
        float ruby_rock = 0.003f;
        float diamond_rock = 0.001f;
    } decoration;
};

// ============================================================================
// Category Sources
// ============================================================================

// Assigns a coarse category to any tile of the world
class ICategorySource {
public:
    virtual ~ICategorySource() = default;

    [[nodiscard]] virtual TileCategory category_at(const TileCoords& tile) const = 0;
};

// Water where the water field is high, else dirt where the dirt field is
// high, else grass
class NoiseCategorySource : public ICategorySource {
public:
    explicit NoiseCategorySource(const TerrainConfig& config);
    ~NoiseCategorySource() override;

    NoiseCategorySource(const NoiseCategorySource&) = delete;
    NoiseCategorySource& operator=(const NoiseCategorySource&) = delete;

    [[nodiscard]] TileCategory category_at(const TileCoords& tile) const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Terrain Generator
// ============================================================================

class TerrainGenerator {
public:
    // A null source selects NoiseCategorySource for the config
    explicit TerrainGenerator(const TerrainConfig& config = {},
                              std::shared_ptr<const ICategorySource> source = nullptr);
    ~TerrainGenerator();

    // Non-copyable but movable
    TerrainGenerator(const TerrainGenerator&) = delete;
    TerrainGenerator& operator=(const TerrainGenerator&) = delete;
    TerrainGenerator(TerrainGenerator&&) noexcept;
    TerrainGenerator& operator=(TerrainGenerator&&) noexcept;

    // ========================================================================
    // Main Generation Interface
    // ========================================================================

    /// Generate the chunk at the coordinates (thread-safe, reentrant).
    /// The result depends only on the coordinates, the seed and the source.
    [[nodiscard]] Chunk generate(const ChunkCoords& coords) const;

    /// Smoothed category plan for a chunk, before tiles are chosen
    [[nodiscard]] ChunkPlan plan(const ChunkCoords& coords) const;

    /// Tile chosen for a non-transition position
    [[nodiscard]] Tile place_tile(TileCategory category, const TileCoords& tile) const;

    [[nodiscard]] const TerrainConfig& get_config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace gemgame::world
