// GemGame World
// world_store.hpp - Persistence of chunks and players

#pragma once

#include "chunk.hpp"
#include "entity.hpp"
#include "id.hpp"
#include "serialization.hpp"
#include "types.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace gemgame::world {

// A player's saved entity
struct PlayerRecord {
    EntityId entity_id;
    Entity entity;

    bool operator==(const PlayerRecord& other) const = default;
};

// Binary player format: position, cosmetic indices, entity id, gem blob,
// inventory blob, bombs placed. Blobs that fail to decode are replaced by
// empty collections.
[[nodiscard]] std::vector<uint8_t> encode_player_record(const PlayerRecord& record);
[[nodiscard]] std::optional<PlayerRecord> decode_player_record(std::span<const uint8_t> data);

// Store behind the authoritative world. Implementations are safe to call
// from several sessions at once.
class IWorldStore {
public:
    virtual ~IWorldStore() = default;

    // nullopt only when the chunk was never saved. A saved chunk that cannot
    // be decoded comes back as a default chunk so it is never regenerated.
    [[nodiscard]] virtual std::optional<Chunk> load_chunk(const ChunkCoords& coords) = 0;
    virtual bool save_chunk(const ChunkCoords& coords, const Chunk& chunk) = 0;

    [[nodiscard]] virtual std::optional<PlayerRecord> load_player(ClientId client) = 0;
    virtual bool save_player(ClientId client, const PlayerRecord& record) = 0;
};

// <root>/chunks/<x>_<y>.chunk and <root>/players/<client id>.player
class FileWorldStore : public IWorldStore {
public:
    explicit FileWorldStore(const std::filesystem::path& root);

    [[nodiscard]] std::optional<Chunk> load_chunk(const ChunkCoords& coords) override;
    bool save_chunk(const ChunkCoords& coords, const Chunk& chunk) override;

    [[nodiscard]] std::optional<PlayerRecord> load_player(ClientId client) override;
    bool save_player(ClientId client, const PlayerRecord& record) override;

    [[nodiscard]] std::filesystem::path chunk_path(const ChunkCoords& coords) const;
    [[nodiscard]] std::filesystem::path player_path(ClientId client) const;
    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    ChunkSerializer serializer_;
};

// Keeps everything in memory, used by tests and throwaway worlds
class MemoryWorldStore : public IWorldStore {
public:
    [[nodiscard]] std::optional<Chunk> load_chunk(const ChunkCoords& coords) override;
    bool save_chunk(const ChunkCoords& coords, const Chunk& chunk) override;

    [[nodiscard]] std::optional<PlayerRecord> load_player(ClientId client) override;
    bool save_player(ClientId client, const PlayerRecord& record) override;

    [[nodiscard]] size_t chunk_save_count() const { return chunk_saves_.load(); }
    [[nodiscard]] size_t chunk_load_count() const { return chunk_loads_.load(); }
    [[nodiscard]] size_t stored_chunk_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<ChunkCoords, Chunk> chunks_;
    std::unordered_map<ClientId, PlayerRecord> players_;
    std::atomic<size_t> chunk_saves_{0};
    std::atomic<size_t> chunk_loads_{0};
};

}  // namespace gemgame::world
