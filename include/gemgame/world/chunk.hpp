// GemGame World
// chunk.hpp - Fixed 16x16 block of tiles

#pragma once

#include "tile.hpp"
#include "types.hpp"

#include <array>
#include <span>
#include <vector>

namespace gemgame::world {

// A chunk is a plain value. Synchronisation is the owning map's concern: the
// server keeps its chunks behind the world lock and the client map is only
// touched from the frame loop.
class Chunk {
public:
    Chunk();  // All default tiles
    explicit Chunk(const Tile& fill);

    // ========================================================================
    // Tile Access
    // ========================================================================

    // Out-of-range offsets clamp to the last tile (see calculate_index)
    [[nodiscard]] const Tile& tile_at_offset(const OffsetCoords& offset) const;
    void set_tile_at_offset(const OffsetCoords& offset, const Tile& tile);

    [[nodiscard]] const std::array<Tile, CHUNK_TILE_COUNT>& tiles() const { return tiles_; }

    // ========================================================================
    // Serialization
    // ========================================================================

    // u32 tile count followed by every tile in index order
    void serialize(protocol::ByteWriter& writer) const;
    [[nodiscard]] std::vector<uint8_t> serialize() const;

    // A wrong tile count is repaired by truncating or padding with the
    // default tile. Fails only when the count itself cannot be read.
    [[nodiscard]] static bool deserialize(protocol::ByteReader& reader, Chunk& out);
    [[nodiscard]] static bool deserialize(std::span<const uint8_t> data, Chunk& out);

    bool operator==(const Chunk& other) const = default;

private:
    std::array<Tile, CHUNK_TILE_COUNT> tiles_;
};

}  // namespace gemgame::world
