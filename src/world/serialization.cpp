// GemGame World
// serialization.cpp - On-disk chunk file format

#include <cstring>
#include <gemgame/core/logger.hpp>
#include <gemgame/platform/file_io.hpp>
#include <gemgame/world/serialization.hpp>
#include <zlib.h>

namespace gemgame::world {

// ============================================================================
// Compression Helpers
// ============================================================================

namespace {

std::vector<uint8_t> compress_zlib(std::span<const uint8_t> data) {
    if (data.empty()) {
        return {};
    }

    uLong compressed_size = compressBound(static_cast<uLong>(data.size()));
    std::vector<uint8_t> compressed(compressed_size);

    int result = compress2(compressed.data(), &compressed_size, data.data(), static_cast<uLong>(data.size()),
                           Z_DEFAULT_COMPRESSION);

    if (result != Z_OK) {
        GEMGAME_LOG_ERROR(core::log_category::STORAGE, "zlib compression failed: {}", result);
        return {};
    }

    compressed.resize(compressed_size);
    return compressed;
}

std::vector<uint8_t> decompress_zlib(std::span<const uint8_t> data, size_t uncompressed_size) {
    if (data.empty()) {
        return {};
    }

    std::vector<uint8_t> decompressed(uncompressed_size);
    uLongf dest_size = static_cast<uLongf>(uncompressed_size);

    int result = uncompress(decompressed.data(), &dest_size, data.data(), static_cast<uLong>(data.size()));

    if (result != Z_OK) {
        GEMGAME_LOG_ERROR(core::log_category::STORAGE, "zlib decompression failed: {}", result);
        return {};
    }

    decompressed.resize(dest_size);
    return decompressed;
}

}  // namespace

// ============================================================================
// ChunkSerializer Implementation
// ============================================================================

struct ChunkSerializer::Impl {
    CompressionType compression = CompressionType::Zlib;
};

ChunkSerializer::ChunkSerializer() : impl_(std::make_unique<Impl>()) {}

ChunkSerializer::~ChunkSerializer() = default;

void ChunkSerializer::set_compression(CompressionType type) {
    impl_->compression = type;
}

CompressionType ChunkSerializer::get_compression() const {
    return impl_->compression;
}

std::vector<uint8_t> ChunkSerializer::serialize(const ChunkCoords& coords, const Chunk& chunk) const {
    std::vector<uint8_t> raw_data = chunk.serialize();

    ChunkFileHeader header;
    header.chunk_x = coords.x;
    header.chunk_y = coords.y;
    header.uncompressed_size = static_cast<uint32_t>(raw_data.size());
    header.compression_type = static_cast<uint8_t>(impl_->compression);

    std::vector<uint8_t> payload;
    if (impl_->compression == CompressionType::Zlib) {
        payload = compress_zlib(raw_data);
        if (payload.empty() && !raw_data.empty()) {
            // Compression failed, fall back to uncompressed
            header.compression_type = static_cast<uint8_t>(CompressionType::None);
            payload = std::move(raw_data);
        }
    } else {
        payload = std::move(raw_data);
    }

    header.compressed_size = static_cast<uint32_t>(payload.size());

    std::vector<uint8_t> result(sizeof(ChunkFileHeader) + payload.size());
    std::memcpy(result.data(), &header, sizeof(ChunkFileHeader));
    std::memcpy(result.data() + sizeof(ChunkFileHeader), payload.data(), payload.size());

    return result;
}

bool ChunkSerializer::deserialize(const ChunkCoords& expected, std::span<const uint8_t> data, Chunk& chunk) const {
    if (!validate_header(data)) {
        return false;
    }

    ChunkFileHeader header;
    std::memcpy(&header, data.data(), sizeof(ChunkFileHeader));

    if (header.chunk_x != expected.x || header.chunk_y != expected.y) {
        GEMGAME_LOG_ERROR(core::log_category::STORAGE, "Chunk file holds chunk ({}, {}), expected {}",
                          int32_t{header.chunk_x}, int32_t{header.chunk_y}, to_string(expected));
        return false;
    }

    if (header.compressed_size > MAX_CHUNK_PAYLOAD_SIZE || header.uncompressed_size > MAX_CHUNK_PAYLOAD_SIZE) {
        GEMGAME_LOG_ERROR(core::log_category::STORAGE, "Chunk header sizes {}/{} exceed the limit of {} bytes",
                          uint32_t{header.compressed_size}, uint32_t{header.uncompressed_size}, MAX_CHUNK_PAYLOAD_SIZE);
        return false;
    }

    if (data.size() < sizeof(ChunkFileHeader) + header.compressed_size) {
        GEMGAME_LOG_ERROR(core::log_category::STORAGE, "Chunk data truncated");
        return false;
    }

    std::span<const uint8_t> payload(data.data() + sizeof(ChunkFileHeader), header.compressed_size);

    std::vector<uint8_t> raw_data;
    if (header.compression_type == static_cast<uint8_t>(CompressionType::Zlib)) {
        raw_data = decompress_zlib(payload, header.uncompressed_size);
        if (raw_data.empty() && header.uncompressed_size > 0) {
            GEMGAME_LOG_ERROR(core::log_category::STORAGE, "Failed to decompress chunk data");
            return false;
        }
    } else if (header.compression_type == static_cast<uint8_t>(CompressionType::None)) {
        raw_data.assign(payload.begin(), payload.end());
    } else {
        GEMGAME_LOG_ERROR(core::log_category::STORAGE, "Unknown chunk compression type: {}",
                          uint8_t{header.compression_type});
        return false;
    }

    return Chunk::deserialize(raw_data, chunk);
}

bool ChunkSerializer::save_to_file(const ChunkCoords& coords, const Chunk& chunk,
                                   const std::filesystem::path& path) const {
    std::vector<uint8_t> data = serialize(coords, chunk);
    if (!platform::FileSystem::write_binary(path, data)) {
        GEMGAME_LOG_ERROR(core::log_category::STORAGE, "Failed to write chunk file: {}", path.string());
        return false;
    }
    return true;
}

bool ChunkSerializer::load_from_file(const ChunkCoords& expected, const std::filesystem::path& path,
                                     Chunk& chunk) const {
    auto data = platform::FileSystem::read_binary(path);
    if (!data) {
        return false;
    }
    return deserialize(expected, *data, chunk);
}

bool ChunkSerializer::validate_header(std::span<const uint8_t> data) const {
    if (data.size() < sizeof(ChunkFileHeader)) {
        GEMGAME_LOG_ERROR(core::log_category::STORAGE, "Chunk data too small for header");
        return false;
    }

    ChunkFileHeader header;
    std::memcpy(&header, data.data(), sizeof(ChunkFileHeader));

    if (header.magic != CHUNK_MAGIC) {
        GEMGAME_LOG_ERROR(core::log_category::STORAGE, "Invalid chunk magic: 0x{:08X}", uint32_t{header.magic});
        return false;
    }

    if (header.version > CHUNK_FORMAT_VERSION) {
        GEMGAME_LOG_ERROR(core::log_category::STORAGE, "Unsupported chunk version: {}", uint32_t{header.version});
        return false;
    }

    return true;
}

}  // namespace gemgame::world
