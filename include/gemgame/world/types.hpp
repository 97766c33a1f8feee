// GemGame World
// types.hpp - Coordinate types, chunk constants, directions and conversions

#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/type_precision.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace gemgame::world {

// ============================================================================
// Chunk Constants
// ============================================================================

inline constexpr int32_t CHUNK_WIDTH = 16;
inline constexpr int32_t CHUNK_HEIGHT = 16;
inline constexpr size_t CHUNK_TILE_COUNT = static_cast<size_t>(CHUNK_WIDTH * CHUNK_HEIGHT);

// ============================================================================
// Coordinate Types (using GLM)
// ============================================================================

// Absolute tile position, unbounded in both axes
using TileCoords = glm::ivec2;

// Chunk grid position
using ChunkCoords = glm::ivec2;

// Tile position within a chunk, [0, CHUNK_WIDTH) x [0, CHUNK_HEIGHT)
using OffsetCoords = glm::u8vec2;

// ============================================================================
// Coordinate Conversion Functions
// ============================================================================

namespace detail {

[[nodiscard]] inline int32_t floor_div(int32_t value, int32_t divisor) {
    // 64-bit intermediate keeps INT32_MIN well defined
    const int64_t v = value;
    return static_cast<int32_t>(v >= 0 ? v / divisor : (v - divisor + 1) / divisor);
}

[[nodiscard]] inline int32_t floor_mod(int32_t value, int32_t divisor) {
    const int32_t result = value % divisor;
    return result >= 0 ? result : result + divisor;
}

}  // namespace detail

// Chunk containing the tile (floor division)
[[nodiscard]] inline ChunkCoords chunk_of(const TileCoords& tile) {
    return ChunkCoords(detail::floor_div(tile.x, CHUNK_WIDTH), detail::floor_div(tile.y, CHUNK_HEIGHT));
}

// Tile position inside its chunk (modulo normalised into the chunk)
[[nodiscard]] inline OffsetCoords offset_of(const TileCoords& tile) {
    return OffsetCoords(static_cast<uint8_t>(detail::floor_mod(tile.x, CHUNK_WIDTH)),
                        static_cast<uint8_t>(detail::floor_mod(tile.y, CHUNK_HEIGHT)));
}

// Inverse of chunk_of/offset_of
[[nodiscard]] inline TileCoords tile_of(const ChunkCoords& chunk, const OffsetCoords& offset) {
    return TileCoords(static_cast<int32_t>(static_cast<int64_t>(chunk.x) * CHUNK_WIDTH + offset.x),
                      static_cast<int32_t>(static_cast<int64_t>(chunk.y) * CHUNK_HEIGHT + offset.y));
}

[[nodiscard]] inline bool is_valid_offset(const OffsetCoords& offset) {
    return offset.x < CHUNK_WIDTH && offset.y < CHUNK_HEIGHT;
}

// Row-major tile index. Saturating: an out-of-range offset logs a warning and
// maps to the last valid index.
[[nodiscard]] size_t calculate_index(const OffsetCoords& offset);

[[nodiscard]] inline OffsetCoords index_to_offset(size_t index) {
    return OffsetCoords(static_cast<uint8_t>(index % CHUNK_WIDTH), static_cast<uint8_t>(index / CHUNK_WIDTH));
}

// Larger of the axis distances between two chunks
[[nodiscard]] int32_t chebyshev_distance(const ChunkCoords& a, const ChunkCoords& b);

[[nodiscard]] std::string to_string(const glm::ivec2& coords);

// ============================================================================
// Directions
// ============================================================================

enum class Direction : uint8_t {
    Up = 0,  // +y
    Down = 1,
    Left = 2,  // -x
    Right = 3,
    Count = 4
};

inline constexpr Direction DEFAULT_DIRECTION = Direction::Down;

inline constexpr glm::ivec2 DIRECTION_OFFSETS[4] = {{0, 1}, {0, -1}, {-1, 0}, {1, 0}};

[[nodiscard]] inline glm::ivec2 direction_offset(Direction dir) {
    return DIRECTION_OFFSETS[static_cast<uint8_t>(dir) & 3];
}

[[nodiscard]] inline TileCoords step(const TileCoords& from, Direction dir) {
    return from + direction_offset(dir);
}

[[nodiscard]] inline bool is_valid_direction(uint8_t value) {
    return value < static_cast<uint8_t>(Direction::Count);
}

[[nodiscard]] inline const char* direction_to_string(Direction dir) {
    switch (dir) {
        case Direction::Up:
            return "Up";
        case Direction::Down:
            return "Down";
        case Direction::Left:
            return "Left";
        case Direction::Right:
            return "Right";
        default:
            return "Unknown";
    }
}

}  // namespace gemgame::world

// ============================================================================
// Hash Functions for using coordinates as map keys
// ============================================================================

namespace std {

template <>
struct hash<glm::ivec2> {
    size_t operator()(const glm::ivec2& pos) const noexcept {
        size_t h1 = std::hash<int32_t>{}(pos.x);
        size_t h2 = std::hash<int32_t>{}(pos.y);
        return h1 ^ (h2 * 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

}  // namespace std
