// GemGame World
// chunk_plan.hpp - Per-chunk category grid used while generating terrain

#pragma once

#include "chunk.hpp"
#include "tile.hpp"
#include "types.hpp"

#include <array>
#include <functional>
#include <optional>

namespace gemgame::world {

// Coarse terrain category assigned before tiles are chosen
enum class TileCategory : uint8_t {
    Grass = 0,
    Dirt = 1,
    Water = 2
};

inline constexpr TileCategory DEFAULT_CATEGORY = TileCategory::Grass;

[[nodiscard]] const char* tile_category_to_string(TileCategory category);

// Tiles used for every transition shape of one category
struct TransitionTiles {
    Tile plain;
    Tile top;
    Tile bottom;
    Tile left;
    Tile right;
    Tile top_left;
    Tile top_right;
    Tile bottom_left;
    Tile bottom_right;
    Tile corner_top_left;
    Tile corner_top_right;
    Tile corner_bottom_left;
    Tile corner_bottom_right;

    // Transition set of a base tile type, the edge tag varying per shape
    [[nodiscard]] static TransitionTiles for_type(TileType type);
};

// Which orthogonal neighbours hold a different category. "Above" is y + 1.
struct NeighbourMismatch {
    bool above = false;
    bool below = false;
    bool left = false;
    bool right = false;

    [[nodiscard]] int count() const { return int(above) + int(below) + int(left) + int(right); }
};

class ChunkPlan {
public:
    // Maps a non-transition position of the given category to a tile
    using PlaceTileFn = std::function<Tile(TileCategory category, const OffsetCoords& offset)>;

    ChunkPlan();

    // Positions outside the chunk are ignored when written and read as the
    // default category
    void set_category_at(int32_t x, int32_t y, TileCategory category);
    [[nodiscard]] TileCategory category_at(int32_t x, int32_t y) const;

    [[nodiscard]] NeighbourMismatch mismatches_at(int32_t x, int32_t y) const;

    // Demotes every non-default position with three or more differing
    // neighbours, repeating for neighbours affected by a demotion until no
    // such position remains
    void remove_all_jutting_and_unconnected_tiles();

    // Transition tile for a dirt or water position whose neighbours differ,
    // nullopt for grass positions and positions that need no transition
    [[nodiscard]] std::optional<Tile> transition_tile_at(int32_t x, int32_t y, const TransitionTiles& dirt,
                                                         const TransitionTiles& water) const;

    // Resolves every position into a tile. place_tile is called in index
    // order for each position that is not a transition.
    [[nodiscard]] Chunk to_chunk(const TransitionTiles& dirt, const TransitionTiles& water,
                                 const PlaceTileFn& place_tile) const;

private:
    [[nodiscard]] bool is_jutting_or_unconnected(int32_t x, int32_t y) const;

    std::array<TileCategory, CHUNK_TILE_COUNT> categories_;
};

}  // namespace gemgame::world
