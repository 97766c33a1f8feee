// GemGame World
// world_store.cpp - File and in-memory stores

#include <gemgame/core/logger.hpp>
#include <gemgame/platform/file_io.hpp>
#include <gemgame/protocol/byte_buffer.hpp>
#include <gemgame/world/world_store.hpp>

#include <spdlog/fmt/fmt.h>

namespace gemgame::world {

// ============================================================================
// Player Records
// ============================================================================

std::vector<uint8_t> encode_player_record(const PlayerRecord& record) {
    const Entity& entity = record.entity;

    protocol::ByteWriter writer;
    writer.write_i32(entity.pos.x);
    writer.write_i32(entity.pos.y);
    writer.write_u8(static_cast<uint8_t>(entity.direction));
    writer.write_u8(static_cast<uint8_t>(entity.cosmetics.hair_style));
    writer.write_u8(static_cast<uint8_t>(entity.cosmetics.clothing_colour));
    writer.write_u8(static_cast<uint8_t>(entity.cosmetics.skin_colour));
    writer.write_u8(static_cast<uint8_t>(entity.cosmetics.hair_colour));
    writer.write_u8(static_cast<uint8_t>(entity.cosmetics.facial_expression));
    writer.write_u64(record.entity_id.value());
    writer.write_blob(entity.gems.to_blob());
    writer.write_blob(entity.items.to_blob());
    writer.write_u32(entity.bombs_placed_count);
    return writer.take();
}

std::optional<PlayerRecord> decode_player_record(std::span<const uint8_t> data) {
    protocol::ByteReader reader(data);

    PlayerRecord record;
    Entity& entity = record.entity;
    entity.pos.x = reader.read_i32();
    entity.pos.y = reader.read_i32();
    const uint8_t direction = reader.read_u8();
    const uint8_t hair_style = reader.read_u8();
    const uint8_t clothing_colour = reader.read_u8();
    const uint8_t skin_colour = reader.read_u8();
    const uint8_t hair_colour = reader.read_u8();
    const uint8_t facial_expression = reader.read_u8();
    record.entity_id = EntityId(reader.read_u64());
    const auto gem_blob = reader.read_blob();
    const auto item_blob = reader.read_blob();
    entity.bombs_placed_count = reader.read_u32();

    if (!reader.ok()) {
        GEMGAME_LOG_WARN(core::log_category::STORAGE, "Player record truncated ({} bytes)", data.size());
        return std::nullopt;
    }

    if (is_valid_direction(direction)) {
        entity.direction = static_cast<Direction>(direction);
    } else {
        GEMGAME_LOG_WARN(core::log_category::STORAGE, "Invalid stored direction {}, using default", direction);
    }
    entity.cosmetics = Cosmetics::from_indices(hair_style, clothing_colour, skin_colour, hair_colour,
                                               facial_expression);
    entity.gems = gameplay::GemCollection::from_blob(gem_blob);
    entity.items = gameplay::ItemInventory::from_blob(item_blob);
    return record;
}

// ============================================================================
// FileWorldStore
// ============================================================================

FileWorldStore::FileWorldStore(const std::filesystem::path& root) : root_(root) {
    platform::FileSystem::create_directories(root_ / "chunks");
    platform::FileSystem::create_directories(root_ / "players");
    GEMGAME_LOG_INFO(core::log_category::STORAGE, "World store at {}", root_.string());
}

std::filesystem::path FileWorldStore::chunk_path(const ChunkCoords& coords) const {
    return root_ / "chunks" / fmt::format("{}_{}.chunk", coords.x, coords.y);
}

std::filesystem::path FileWorldStore::player_path(ClientId client) const {
    return root_ / "players" / (client.to_string() + ".player");
}

std::optional<Chunk> FileWorldStore::load_chunk(const ChunkCoords& coords) {
    const auto path = chunk_path(coords);
    if (!platform::FileSystem::exists(path)) {
        return std::nullopt;
    }

    Chunk chunk;
    if (!serializer_.load_from_file(coords, path, chunk)) {
        GEMGAME_LOG_WARN(core::log_category::STORAGE, "Chunk file {} is unreadable, repairing to a default chunk",
                         path.string());
        return Chunk();
    }
    return chunk;
}

bool FileWorldStore::save_chunk(const ChunkCoords& coords, const Chunk& chunk) {
    return serializer_.save_to_file(coords, chunk, chunk_path(coords));
}

std::optional<PlayerRecord> FileWorldStore::load_player(ClientId client) {
    const auto path = player_path(client);
    if (!platform::FileSystem::exists(path)) {
        return std::nullopt;
    }

    auto data = platform::FileSystem::read_binary(path);
    if (!data) {
        return std::nullopt;
    }
    return decode_player_record(*data);
}

bool FileWorldStore::save_player(ClientId client, const PlayerRecord& record) {
    const auto path = player_path(client);
    if (!platform::FileSystem::write_binary(path, encode_player_record(record))) {
        GEMGAME_LOG_ERROR(core::log_category::STORAGE, "Failed to save player {}", client.to_string());
        return false;
    }
    return true;
}

// ============================================================================
// MemoryWorldStore
// ============================================================================

std::optional<Chunk> MemoryWorldStore::load_chunk(const ChunkCoords& coords) {
    ++chunk_loads_;
    std::lock_guard lock(mutex_);
    auto it = chunks_.find(coords);
    if (it == chunks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryWorldStore::save_chunk(const ChunkCoords& coords, const Chunk& chunk) {
    ++chunk_saves_;
    std::lock_guard lock(mutex_);
    chunks_.insert_or_assign(coords, chunk);
    return true;
}

std::optional<PlayerRecord> MemoryWorldStore::load_player(ClientId client) {
    std::lock_guard lock(mutex_);
    auto it = players_.find(client);
    if (it == players_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryWorldStore::save_player(ClientId client, const PlayerRecord& record) {
    std::lock_guard lock(mutex_);
    players_.insert_or_assign(client, record);
    return true;
}

size_t MemoryWorldStore::stored_chunk_count() const {
    std::lock_guard lock(mutex_);
    return chunks_.size();
}

}  // namespace gemgame::world
