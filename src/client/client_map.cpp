// GemGame Client
// client_map.cpp - Client map and chunk streaming

#include <gemgame/client/client_map.hpp>
#include <gemgame/core/logger.hpp>

namespace gemgame::client {

using world::Chunk;
using world::ChunkCoords;
using world::Entity;
using world::EntityId;
using world::TileCoords;

ClientMap::ClientMap(float remote_move_duration) : remote_move_duration_(remote_move_duration) {}

// ============================================================================
// Chunks
// ============================================================================

const Chunk* ClientMap::loaded_chunk_at(const ChunkCoords& coords) const {
    auto it = chunks_.find(coords);
    return it != chunks_.end() ? &it->second : nullptr;
}

Chunk* ClientMap::loaded_chunk_at(const ChunkCoords& coords) {
    auto it = chunks_.find(coords);
    return it != chunks_.end() ? &it->second : nullptr;
}

void ClientMap::provide_chunk(const ChunkCoords& coords, const Chunk& chunk) {
    needed_.erase(coords);
    requested_.erase(coords);
    chunks_.insert_or_assign(coords, chunk);
    GEMGAME_LOG_TRACE(core::log_category::CLIENT, "Chunk {} loaded", world::to_string(coords));
}

const world::Tile* ClientMap::tile_at(const TileCoords& coords) {
    const ChunkCoords chunk = world::chunk_of(coords);
    if (!chunks_.contains(chunk) && needed_.insert(chunk).second) {
        GEMGAME_LOG_TRACE(core::log_category::CLIENT, "Chunk {} needed for tile {}", world::to_string(chunk),
                          world::to_string(coords));
    }
    return loaded_tile_at(coords);
}

void ClientMap::request_needed_chunks(protocol::ToServerSink& sink) {
    for (const ChunkCoords& coords : needed_) {
        if (requested_.insert(coords).second) {
            sink.send(protocol::to_server::RequestChunk{coords});
        }
    }
}

void ClientMap::remove_chunk(const ChunkCoords& coords) {
    if (chunks_.erase(coords) == 0) {
        GEMGAME_LOG_WARN(core::log_category::CLIENT, "Asked to unload chunk {} which is not loaded",
                         world::to_string(coords));
    }
    needed_.erase(coords);
    requested_.erase(coords);

    std::erase_if(entities_, [&coords](const auto& entry) { return world::chunk_of(entry.second.entity.pos) == coords; });
}

void ClientMap::clear() {
    chunks_.clear();
    needed_.clear();
    requested_.clear();
    entities_.clear();
}

std::vector<ChunkCoords> ClientMap::loaded_chunk_coords() const {
    std::vector<ChunkCoords> coords;
    coords.reserve(chunks_.size());
    for (const auto& [key, chunk] : chunks_) {
        coords.push_back(key);
    }
    return coords;
}

// ============================================================================
// Entities
// ============================================================================

const Entity* ClientMap::entity_by_id(EntityId id) const {
    auto it = entities_.find(id);
    return it != entities_.end() ? &it->second.entity : nullptr;
}

std::optional<EntityId> ClientMap::entity_at(const TileCoords& coords) const {
    // Linear, the client only holds entities near the player
    for (const auto& [id, remote] : entities_) {
        if (remote.entity.pos == coords) {
            return id;
        }
    }
    return std::nullopt;
}

void ClientMap::add_entity(EntityId id, const Entity& entity) {
    entities_.insert_or_assign(id, RemoteEntity{entity, Transition(entity.pos, entity.pos, 0.0f)});
    GEMGAME_LOG_DEBUG(core::log_category::CLIENT, "Entity {} added at {}", id.to_string(),
                      world::to_string(entity.pos));
}

std::optional<Entity> ClientMap::remove_entity(EntityId id) {
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        return std::nullopt;
    }
    Entity entity = it->second.entity;
    entities_.erase(it);
    GEMGAME_LOG_DEBUG(core::log_category::CLIENT, "Entity {} removed", id.to_string());
    return entity;
}

void ClientMap::move_remote_entity(EntityId id, const TileCoords& position, world::Direction direction) {
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        GEMGAME_LOG_WARN(core::log_category::CLIENT, "Cannot move entity {} as it is not loaded", id.to_string());
        return;
    }

    RemoteEntity& remote = it->second;
    remote.transition = Transition(remote.entity.pos, position, remote_move_duration_);
    remote.entity.pos = position;
    remote.entity.direction = direction;
}

std::optional<glm::vec2> ClientMap::remote_entity_position(EntityId id) const {
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        return std::nullopt;
    }
    return it->second.transition.current();
}

void ClientMap::update(float delta) {
    for (auto& [id, remote] : entities_) {
        remote.transition.update(delta);
    }
}

}  // namespace gemgame::client
