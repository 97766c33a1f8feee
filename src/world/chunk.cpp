// GemGame World
// chunk.cpp - Chunk tile storage and flat serialization

#include <gemgame/core/logger.hpp>
#include <gemgame/protocol/byte_buffer.hpp>
#include <gemgame/world/chunk.hpp>

#include <algorithm>

namespace gemgame::world {

Chunk::Chunk() {
    tiles_.fill(DEFAULT_TILE);
}

Chunk::Chunk(const Tile& fill) {
    tiles_.fill(fill);
}

const Tile& Chunk::tile_at_offset(const OffsetCoords& offset) const {
    return tiles_[calculate_index(offset)];
}

void Chunk::set_tile_at_offset(const OffsetCoords& offset, const Tile& tile) {
    tiles_[calculate_index(offset)] = tile;
}

void Chunk::serialize(protocol::ByteWriter& writer) const {
    writer.write_u32(static_cast<uint32_t>(tiles_.size()));
    for (const Tile& tile : tiles_) {
        tile.encode(writer);
    }
}

std::vector<uint8_t> Chunk::serialize() const {
    protocol::ByteWriter writer;
    serialize(writer);
    return writer.take();
}

bool Chunk::deserialize(protocol::ByteReader& reader, Chunk& out) {
    const uint32_t count = reader.read_u32();
    if (!reader.ok()) {
        GEMGAME_LOG_WARN(core::log_category::WORLD, "Chunk data too short for a tile count");
        return false;
    }

    // Only whole tiles that are actually present are read
    const size_t available = reader.remaining() / TILE_ENCODED_SIZE;
    const size_t readable = std::min<size_t>(count, available);

    if (count != CHUNK_TILE_COUNT || readable != count) {
        GEMGAME_LOG_WARN(core::log_category::WORLD,
                         "Chunk data has {} tiles ({} present), expected {}; repairing", count, readable,
                         CHUNK_TILE_COUNT);
    }

    Chunk chunk;
    for (size_t i = 0; i < readable; ++i) {
        Tile tile = Tile::decode(reader);
        if (i < CHUNK_TILE_COUNT) {
            chunk.tiles_[i] = tile;
        }
    }

    out = chunk;
    return true;
}

bool Chunk::deserialize(std::span<const uint8_t> data, Chunk& out) {
    protocol::ByteReader reader(data);
    return deserialize(reader, out);
}

}  // namespace gemgame::world
