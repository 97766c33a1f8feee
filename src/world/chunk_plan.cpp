// GemGame World
// chunk_plan.cpp - Category grid smoothing and transition resolution

#include <gemgame/core/logger.hpp>
#include <gemgame/world/chunk_plan.hpp>

#include <vector>

namespace gemgame::world {

namespace {

[[nodiscard]] bool in_plan(int32_t x, int32_t y) {
    return x >= 0 && x < CHUNK_WIDTH && y >= 0 && y < CHUNK_HEIGHT;
}

[[nodiscard]] size_t plan_index(int32_t x, int32_t y) {
    return static_cast<size_t>(y) * CHUNK_WIDTH + static_cast<size_t>(x);
}

}  // namespace

const char* tile_category_to_string(TileCategory category) {
    switch (category) {
        case TileCategory::Grass:
            return "Grass";
        case TileCategory::Dirt:
            return "Dirt";
        case TileCategory::Water:
            return "Water";
        default:
            return "Unknown";
    }
}

TransitionTiles TransitionTiles::for_type(TileType type) {
    TransitionTiles tiles;
    tiles.plain = Tile(type);
    tiles.top = Tile(type, TransitionEdge::Top);
    tiles.bottom = Tile(type, TransitionEdge::Bottom);
    tiles.left = Tile(type, TransitionEdge::Left);
    tiles.right = Tile(type, TransitionEdge::Right);
    tiles.top_left = Tile(type, TransitionEdge::TopLeft);
    tiles.top_right = Tile(type, TransitionEdge::TopRight);
    tiles.bottom_left = Tile(type, TransitionEdge::BottomLeft);
    tiles.bottom_right = Tile(type, TransitionEdge::BottomRight);
    tiles.corner_top_left = Tile(type, TransitionEdge::CornerTopLeft);
    tiles.corner_top_right = Tile(type, TransitionEdge::CornerTopRight);
    tiles.corner_bottom_left = Tile(type, TransitionEdge::CornerBottomLeft);
    tiles.corner_bottom_right = Tile(type, TransitionEdge::CornerBottomRight);
    return tiles;
}

ChunkPlan::ChunkPlan() {
    categories_.fill(DEFAULT_CATEGORY);
}

void ChunkPlan::set_category_at(int32_t x, int32_t y, TileCategory category) {
    if (!in_plan(x, y)) {
        GEMGAME_LOG_WARN(core::log_category::TERRAIN, "Ignoring plan write outside the chunk at ({}, {})", x, y);
        return;
    }
    categories_[plan_index(x, y)] = category;
}

TileCategory ChunkPlan::category_at(int32_t x, int32_t y) const {
    if (!in_plan(x, y)) {
        return DEFAULT_CATEGORY;
    }
    return categories_[plan_index(x, y)];
}

NeighbourMismatch ChunkPlan::mismatches_at(int32_t x, int32_t y) const {
    const TileCategory own = category_at(x, y);
    NeighbourMismatch mismatch;
    mismatch.above = category_at(x, y + 1) != own;
    mismatch.below = category_at(x, y - 1) != own;
    mismatch.left = category_at(x - 1, y) != own;
    mismatch.right = category_at(x + 1, y) != own;
    return mismatch;
}

bool ChunkPlan::is_jutting_or_unconnected(int32_t x, int32_t y) const {
    return category_at(x, y) != DEFAULT_CATEGORY && mismatches_at(x, y).count() >= 3;
}

void ChunkPlan::remove_all_jutting_and_unconnected_tiles() {
    // A demotion can only make same-category neighbours worse, so those are
    // the only positions pushed back for another look
    std::vector<glm::ivec2> pending;
    pending.reserve(CHUNK_TILE_COUNT);

    for (int32_t y = 0; y < CHUNK_HEIGHT; ++y) {
        for (int32_t x = 0; x < CHUNK_WIDTH; ++x) {
            pending.emplace_back(x, y);

            while (!pending.empty()) {
                const glm::ivec2 pos = pending.back();
                pending.pop_back();

                if (!in_plan(pos.x, pos.y) || !is_jutting_or_unconnected(pos.x, pos.y)) {
                    continue;
                }

                const TileCategory demoted = category_at(pos.x, pos.y);
                categories_[plan_index(pos.x, pos.y)] = DEFAULT_CATEGORY;

                for (const glm::ivec2& offset : DIRECTION_OFFSETS) {
                    const glm::ivec2 neighbour = pos + offset;
                    if (category_at(neighbour.x, neighbour.y) == demoted && in_plan(neighbour.x, neighbour.y)) {
                        pending.push_back(neighbour);
                    }
                }
            }
        }
    }
}

std::optional<Tile> ChunkPlan::transition_tile_at(int32_t x, int32_t y, const TransitionTiles& dirt,
                                                  const TransitionTiles& water) const {
    const TileCategory own = category_at(x, y);

    const TransitionTiles* tiles = nullptr;
    switch (own) {
        case TileCategory::Dirt:
            tiles = &dirt;
            break;
        case TileCategory::Water:
            tiles = &water;
            break;
        default:
            return std::nullopt;
    }

    const NeighbourMismatch m = mismatches_at(x, y);

    // Right angles
    if (m.above && m.left && !m.right) {
        return tiles->top_left;
    }
    if (m.above && !m.left && m.right) {
        return tiles->top_right;
    }
    if (m.below && m.left && !m.right) {
        return tiles->bottom_left;
    }
    if (m.below && !m.left && m.right) {
        return tiles->bottom_right;
    }

    // Straight edges
    if (m.above && !m.left && !m.right) {
        return tiles->top;
    }
    if (m.below && !m.left && !m.right) {
        return tiles->bottom;
    }
    if (!m.above && !m.below && m.left) {
        return tiles->left;
    }
    if (!m.above && !m.below && m.right) {
        return tiles->right;
    }

    // Inner corners, decided by the diagonal neighbours
    const bool top_left = category_at(x - 1, y + 1) != own;
    const bool top_right = category_at(x + 1, y + 1) != own;
    const bool bottom_left = category_at(x - 1, y - 1) != own;
    const bool bottom_right = category_at(x + 1, y - 1) != own;

    if (top_left && !top_right && !bottom_left) {
        return tiles->corner_top_left;
    }
    if (!top_left && top_right && !bottom_right) {
        return tiles->corner_top_right;
    }
    if (!top_left && bottom_left && !bottom_right) {
        return tiles->corner_bottom_left;
    }
    if (!top_right && !bottom_left && bottom_right) {
        return tiles->corner_bottom_right;
    }

    return std::nullopt;
}

Chunk ChunkPlan::to_chunk(const TransitionTiles& dirt, const TransitionTiles& water,
                          const PlaceTileFn& place_tile) const {
    Chunk chunk;
    for (size_t index = 0; index < CHUNK_TILE_COUNT; ++index) {
        const OffsetCoords offset = index_to_offset(index);
        const int32_t x = offset.x;
        const int32_t y = offset.y;

        if (auto transition = transition_tile_at(x, y, dirt, water)) {
            chunk.set_tile_at_offset(offset, *transition);
        } else {
            chunk.set_tile_at_offset(offset, place_tile(category_at(x, y), offset));
        }
    }
    return chunk;
}

}  // namespace gemgame::world
