// GemGame Server
// server_map.cpp - Authoritative map implementation

#include <gemgame/core/logger.hpp>
#include <gemgame/server/server_map.hpp>

namespace gemgame::server {

using world::Chunk;
using world::ChunkCoords;
using world::Entity;
using world::EntityId;
using world::TileCoords;

const Chunk* ServerMap::loaded_chunk_at(const ChunkCoords& coords) const {
    auto it = chunks_.find(coords);
    return it != chunks_.end() ? &it->second : nullptr;
}

Chunk* ServerMap::loaded_chunk_at(const ChunkCoords& coords) {
    auto it = chunks_.find(coords);
    return it != chunks_.end() ? &it->second : nullptr;
}

void ServerMap::provide_chunk(const ChunkCoords& coords, const Chunk& chunk) {
    // First install wins, a loaded chunk may already carry changes
    chunks_.try_emplace(coords, chunk);
}

const Entity* ServerMap::entity_by_id(EntityId id) const {
    auto it = entities_.find(id);
    return it != entities_.end() ? &it->second : nullptr;
}

Entity* ServerMap::entity_by_id_mut(EntityId id) {
    auto it = entities_.find(id);
    return it != entities_.end() ? &it->second : nullptr;
}

std::optional<EntityId> ServerMap::entity_at(const TileCoords& coords) const {
    auto it = positions_.find(coords);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ServerMap::add_entity(EntityId id, const Entity& entity) {
    if (entities_.contains(id)) {
        remove_entity(id);
    }
    if (auto other = entity_at(entity.pos)) {
        GEMGAME_LOG_WARN(core::log_category::WORLD, "Entity {} added on top of entity {} at {}", id.to_string(),
                         other->to_string(), world::to_string(entity.pos));
    }
    entities_.emplace(id, entity);
    positions_[entity.pos] = id;
}

std::optional<Entity> ServerMap::remove_entity(EntityId id) {
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        return std::nullopt;
    }

    Entity entity = it->second;
    entities_.erase(it);

    auto pos_it = positions_.find(entity.pos);
    if (pos_it != positions_.end() && pos_it->second == id) {
        positions_.erase(pos_it);
    }
    placed_bombs_.erase(id);
    return entity;
}

bool ServerMap::set_entity_position(EntityId id, const TileCoords& position, world::Direction direction) {
    Entity* entity = entity_by_id_mut(id);
    if (entity == nullptr) {
        return false;
    }

    auto pos_it = positions_.find(entity->pos);
    if (pos_it != positions_.end() && pos_it->second == id) {
        positions_.erase(pos_it);
    }

    entity->pos = position;
    entity->direction = direction;
    positions_[position] = id;
    return true;
}

std::vector<std::pair<EntityId, Entity>> ServerMap::entities_in_chunk(const ChunkCoords& coords) const {
    std::vector<std::pair<EntityId, Entity>> result;
    for (const auto& [id, entity] : entities_) {
        if (world::chunk_of(entity.pos) == coords) {
            result.emplace_back(id, entity);
        }
    }
    return result;
}

void ServerMap::add_placed_bomb(EntityId owner, const TileCoords& coords) {
    placed_bombs_[owner].push_back(coords);
}

std::vector<TileCoords> ServerMap::take_placed_bombs(EntityId owner) {
    auto it = placed_bombs_.find(owner);
    if (it == placed_bombs_.end()) {
        return {};
    }
    std::vector<TileCoords> bombs = std::move(it->second);
    placed_bombs_.erase(it);
    return bombs;
}

}  // namespace gemgame::server
