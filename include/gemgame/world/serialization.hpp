// GemGame World
// serialization.hpp - On-disk chunk file format

#pragma once

#include "chunk.hpp"
#include "types.hpp"

#include <filesystem>
#include <memory>
#include <span>
#include <vector>

namespace gemgame::world {

// ============================================================================
// Binary Format Version
// ============================================================================

inline constexpr uint32_t CHUNK_FORMAT_VERSION = 1;

// Magic bytes for file identification
inline constexpr uint32_t CHUNK_MAGIC = 0x4B434747;  // "GGCK" - GemGame ChunK

// Upper bound on either size field of a header. The flat encoding is a tile
// count followed by fixed-size tiles; the slack covers zlib overhead.
inline constexpr size_t MAX_CHUNK_PAYLOAD_SIZE = 2 * (sizeof(uint32_t) + CHUNK_TILE_COUNT * TILE_ENCODED_SIZE);

// ============================================================================
// Chunk Header (binary layout)
// ============================================================================

#pragma pack(push, 1)
struct ChunkFileHeader {
    uint32_t magic = CHUNK_MAGIC;
    uint32_t version = CHUNK_FORMAT_VERSION;
    int32_t chunk_x = 0;
    int32_t chunk_y = 0;
    uint32_t compressed_size = 0;    // Size of the payload following the header
    uint32_t uncompressed_size = 0;  // Size of the flat chunk encoding
    uint8_t compression_type = 1;    // 0=none, 1=zlib
    uint8_t reserved[7] = {};
};
static_assert(sizeof(ChunkFileHeader) == 32, "ChunkFileHeader must be 32 bytes");
#pragma pack(pop)

enum class CompressionType : uint8_t {
    None = 0,
    Zlib = 1,
};

// ============================================================================
// Chunk Serializer
// ============================================================================

// Wraps Chunk::serialize() in a header and an optional zlib payload
class ChunkSerializer {
public:
    ChunkSerializer();
    ~ChunkSerializer();

    // Non-copyable
    ChunkSerializer(const ChunkSerializer&) = delete;
    ChunkSerializer& operator=(const ChunkSerializer&) = delete;

    void set_compression(CompressionType type);
    [[nodiscard]] CompressionType get_compression() const;

    [[nodiscard]] std::vector<uint8_t> serialize(const ChunkCoords& coords, const Chunk& chunk) const;

    // Fails on a bad header, an oversized or truncated or undecompressable
    // payload, or a header naming different coordinates than expected
    bool deserialize(const ChunkCoords& expected, std::span<const uint8_t> data, Chunk& chunk) const;

    bool save_to_file(const ChunkCoords& coords, const Chunk& chunk, const std::filesystem::path& path) const;
    bool load_from_file(const ChunkCoords& expected, const std::filesystem::path& path, Chunk& chunk) const;

    [[nodiscard]] bool validate_header(std::span<const uint8_t> data) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace gemgame::world
