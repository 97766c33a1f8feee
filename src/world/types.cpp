// GemGame World
// types.cpp - Coordinate helpers that need logging

#include <gemgame/core/logger.hpp>
#include <gemgame/world/types.hpp>

#include <algorithm>
#include <cstdlib>

namespace gemgame::world {

size_t calculate_index(const OffsetCoords& offset) {
    if (!is_valid_offset(offset)) {
        GEMGAME_LOG_WARN(core::log_category::WORLD, "Offset ({}, {}) is outside the chunk, using last tile",
                         offset.x, offset.y);
        return CHUNK_TILE_COUNT - 1;
    }
    return static_cast<size_t>(offset.y) * CHUNK_WIDTH + offset.x;
}

int32_t chebyshev_distance(const ChunkCoords& a, const ChunkCoords& b) {
    const int64_t dx = std::llabs(static_cast<int64_t>(a.x) - b.x);
    const int64_t dy = std::llabs(static_cast<int64_t>(a.y) - b.y);
    return static_cast<int32_t>(std::min<int64_t>(std::max(dx, dy), INT32_MAX));
}

std::string to_string(const glm::ivec2& coords) {
    return fmt::format("({}, {})", coords.x, coords.y);
}

}  // namespace gemgame::world
