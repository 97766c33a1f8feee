// GemGame Server
// world_state.cpp - Authoritative world operations

#include <gemgame/core/logger.hpp>
#include <gemgame/server/world_state.hpp>

#include <algorithm>
#include <cstdlib>
#include <limits>

namespace gemgame::server {

using world::Chunk;
using world::ChunkCoords;
using world::ClientId;
using world::Entity;
using world::EntityId;
using world::Tile;
using world::TileCoords;
using world::TileType;

namespace {

// What a detonated bomb or a smashed rock leaves behind
constexpr Tile CRATER_TILE{TileType::Dirt};

const TileCoords SPAWN_POINT{0, 0};

}  // namespace

WorldState::WorldState(std::shared_ptr<world::IWorldStore> store,
                       std::shared_ptr<const world::TerrainGenerator> generator, BroadcastChannel& channel)
    : store_(std::move(store)), generator_(std::move(generator)), channel_(channel), rng_(std::random_device{}()) {}

// ============================================================================
// Chunks
// ============================================================================

Chunk WorldState::chunk_at(const ChunkCoords& coords) {
    {
        std::unique_lock lock(mutex_);
        while (true) {
            if (const Chunk* chunk = map_.loaded_chunk_at(coords)) {
                return *chunk;
            }
            if (!in_flight_.contains(coords)) {
                in_flight_.insert(coords);
                break;
            }
            chunk_ready_.wait(lock);
        }
    }

    // This thread owns the load of these coordinates
    std::optional<Chunk> chunk;
    try {
        chunk = store_->load_chunk(coords);
        if (!chunk) {
            chunk = generator_->generate(coords);
            generated_chunks_.fetch_add(1);
            GEMGAME_LOG_DEBUG(core::log_category::WORLD, "Generated chunk {}", world::to_string(coords));
            if (!store_->save_chunk(coords, *chunk)) {
                GEMGAME_LOG_WARN(core::log_category::STORAGE, "Failed to persist generated chunk {}",
                                 world::to_string(coords));
            }
        }
    } catch (...) {
        std::lock_guard lock(mutex_);
        in_flight_.erase(coords);
        chunk_ready_.notify_all();
        throw;
    }

    std::lock_guard lock(mutex_);
    map_.provide_chunk(coords, *chunk);
    in_flight_.erase(coords);
    chunk_ready_.notify_all();
    return *map_.loaded_chunk_at(coords);
}

void WorldState::ensure_chunk(const ChunkCoords& coords) {
    {
        std::lock_guard lock(mutex_);
        if (map_.loaded_chunk_at(coords) != nullptr) {
            return;
        }
    }
    (void)chunk_at(coords);
}

bool WorldState::is_chunk_loaded(const ChunkCoords& coords) const {
    std::lock_guard lock(mutex_);
    return map_.loaded_chunk_at(coords) != nullptr;
}

size_t WorldState::loaded_chunk_count() const {
    std::lock_guard lock(mutex_);
    return map_.loaded_chunk_count();
}

// ============================================================================
// Players
// ============================================================================

std::optional<JoinResult> WorldState::join(ClientId client) {
    {
        std::lock_guard lock(mutex_);
        if (online_.contains(client) || joining_.contains(client)) {
            GEMGAME_LOG_WARN(core::log_category::SERVER, "Client {} is already connected", client.to_string());
            return std::nullopt;
        }
        joining_.insert(client);
    }

    EntityId id;
    Entity entity;
    TileCoords start = SPAWN_POINT;

    if (auto record = store_->load_player(client)) {
        id = record->entity_id;
        entity = record->entity;
        start = entity.pos;
        GEMGAME_LOG_INFO(core::log_category::SERVER, "Loaded player {} (entity {}) at {}", client.to_string(),
                         id.to_string(), world::to_string(start));
    } else {
        id = EntityId::generate();
        {
            std::lock_guard lock(mutex_);
            entity.cosmetics = world::Cosmetics::random(rng_);
        }
        GEMGAME_LOG_INFO(core::log_category::SERVER, "Creating player {} (entity {})", client.to_string(),
                         id.to_string());
    }

    if (!spawn(client, id, entity, start)) {
        GEMGAME_LOG_ERROR(core::log_category::SERVER, "No free tile within {} tiles of {} for client {}",
                          SPAWN_SEARCH_RADIUS, world::to_string(start), client.to_string());
        std::lock_guard lock(mutex_);
        joining_.erase(client);
        return std::nullopt;
    }

    return JoinResult{id, entity};
}

bool WorldState::spawn(ClientId client, EntityId id, Entity& entity, const TileCoords& start) {
    // Rings of growing Chebyshev radius around the start
    for (int radius = 0; radius <= SPAWN_SEARCH_RADIUS; ++radius) {
        for (int dy = -radius; dy <= radius; ++dy) {
            for (int dx = -radius; dx <= radius; ++dx) {
                if (std::max(std::abs(dx), std::abs(dy)) != radius) {
                    continue;
                }

                const TileCoords candidate = start + TileCoords(dx, dy);
                ensure_chunk(world::chunk_of(candidate));

                std::lock_guard lock(mutex_);
                if (!world::is_position_free(map_, candidate)) {
                    continue;
                }
                entity.pos = candidate;
                map_.add_entity(id, entity);
                joining_.erase(client);
                online_[client] = id;
                channel_.publish(EntityAdded{id, entity});
                return true;
            }
        }
    }
    return false;
}

void WorldState::leave(ClientId client) {
    std::optional<world::PlayerRecord> record;
    {
        std::lock_guard lock(mutex_);
        auto it = online_.find(client);
        if (it == online_.end()) {
            return;
        }
        const EntityId id = it->second;
        online_.erase(it);

        if (auto entity = map_.remove_entity(id)) {
            channel_.publish(EntityRemoved{id, entity->pos});
            record = world::PlayerRecord{id, *entity};
        }
    }

    if (record && !store_->save_player(client, *record)) {
        GEMGAME_LOG_ERROR(core::log_category::STORAGE, "Failed to save player {}", client.to_string());
    }
    GEMGAME_LOG_INFO(core::log_category::SERVER, "Client {} left", client.to_string());
}

std::optional<Entity> WorldState::entity(EntityId id) const {
    std::lock_guard lock(mutex_);
    if (const Entity* entity = map_.entity_by_id(id)) {
        return *entity;
    }
    return std::nullopt;
}

std::vector<std::pair<EntityId, Entity>> WorldState::entities_in_chunk(const ChunkCoords& coords) const {
    std::lock_guard lock(mutex_);
    return map_.entities_in_chunk(coords);
}

size_t WorldState::online_count() const {
    std::lock_guard lock(mutex_);
    return online_.size();
}

// ============================================================================
// Actions
// ============================================================================

std::optional<MoveOutcome> WorldState::move_entity(EntityId id, world::Direction direction) {
    TileCoords destination;
    {
        std::lock_guard lock(mutex_);
        const Entity* entity = map_.entity_by_id(id);
        if (entity == nullptr) {
            return std::nullopt;
        }
        destination = world::step(entity->pos, direction);
    }

    // Loading the destination chunk may hit the store
    ensure_chunk(world::chunk_of(destination));

    std::lock_guard lock(mutex_);
    const Entity* entity = map_.entity_by_id(id);
    if (entity == nullptr) {
        return std::nullopt;
    }

    destination = world::step(entity->pos, direction);
    if (!world::is_position_free(map_, destination)) {
        return MoveOutcome{false, entity->pos, entity->direction};
    }

    map_.set_entity_position(id, destination, direction);
    channel_.publish(EntityMoved{id, destination, direction});
    return MoveOutcome{true, destination, direction};
}

void WorldState::set_tile_locked(const TileCoords& coords, const Tile& tile) {
    if (!map_.set_loaded_tile_at(coords, tile)) {
        GEMGAME_LOG_WARN(core::log_category::WORLD, "Tile change at {} outside loaded chunks",
                         world::to_string(coords));
        return;
    }
    dirty_chunks_.insert(world::chunk_of(coords));
    channel_.publish(TileChanged{coords, tile});
}

std::optional<PlaceBombOutcome> WorldState::place_bomb(EntityId id) {
    std::lock_guard lock(mutex_);
    Entity* entity = map_.entity_by_id_mut(id);
    if (entity == nullptr) {
        return std::nullopt;
    }

    PlaceBombOutcome outcome;
    const TileCoords target = entity->facing_tile();
    const Tile* tile = map_.loaded_tile_at(target);

    if (tile != nullptr && tile->can_hold_bomb() && !map_.entity_at(target) &&
        entity->items.remove(gameplay::Item::Bomb, 1)) {
        entity->bombs_placed_count++;
        map_.add_placed_bomb(id, target);
        set_tile_locked(target, Tile(TileType::Bomb));
        outcome.placed = true;
    }

    outcome.bombs_remaining = entity->items.quantity(gameplay::Item::Bomb);
    return outcome;
}

std::optional<DetonateOutcome> WorldState::detonate_bombs(EntityId id) {
    std::lock_guard lock(mutex_);
    Entity* entity = map_.entity_by_id_mut(id);
    if (entity == nullptr) {
        return std::nullopt;
    }

    DetonateOutcome outcome;
    for (const TileCoords& bomb : map_.take_placed_bombs(id)) {
        const Tile* bomb_tile = map_.loaded_tile_at(bomb);
        if (bomb_tile == nullptr || bomb_tile->type != TileType::Bomb) {
            continue;
        }
        set_tile_locked(bomb, CRATER_TILE);
        outcome.detonated++;

        for (int dy = -1; dy <= 1; ++dy) {
            for (int dx = -1; dx <= 1; ++dx) {
                const TileCoords coords = bomb + TileCoords(dx, dy);
                const Tile* tile = map_.loaded_tile_at(coords);
                if (tile == nullptr) {
                    continue;
                }
                auto yield = gameplay::rock_yield(tile->type);
                if (!yield) {
                    continue;
                }
                const uint32_t amount = gameplay::yield_amount(*yield, static_cast<uint32_t>(rng_()));
                entity->gems.increase(yield->gem, amount);
                outcome.collected.push_back({yield->gem, amount});
                set_tile_locked(coords, CRATER_TILE);
            }
        }
    }

    outcome.gems = entity->gems;
    return outcome;
}

std::optional<PurchaseOutcome> WorldState::purchase(EntityId id, gameplay::Item item, uint32_t quantity) {
    std::lock_guard lock(mutex_);
    Entity* entity = map_.entity_by_id_mut(id);
    if (entity == nullptr) {
        return std::nullopt;
    }

    const gameplay::ItemPrice price = gameplay::item_price(item);
    const uint64_t cost = static_cast<uint64_t>(price.amount) * quantity;

    PurchaseOutcome outcome;
    outcome.gem = price.gem;
    if (quantity > 0 && cost <= std::numeric_limits<uint32_t>::max() &&
        entity->gems.decrease(price.gem, static_cast<uint32_t>(cost))) {
        entity->items.add(item, quantity);
        outcome.purchased = true;
    }

    outcome.item_quantity = entity->items.quantity(item);
    outcome.gem_quantity = entity->gems.quantity(price.gem);
    return outcome;
}

// ============================================================================
// Persistence
// ============================================================================

void WorldState::flush_dirty_chunks() {
    std::lock_guard flush_lock(flush_mutex_);

    std::vector<std::pair<ChunkCoords, Chunk>> pending;
    {
        std::lock_guard lock(mutex_);
        pending.reserve(dirty_chunks_.size());
        for (const ChunkCoords& coords : dirty_chunks_) {
            if (const Chunk* chunk = map_.loaded_chunk_at(coords)) {
                pending.emplace_back(coords, *chunk);
            }
        }
        dirty_chunks_.clear();
    }

    for (const auto& [coords, chunk] : pending) {
        if (!store_->save_chunk(coords, chunk)) {
            GEMGAME_LOG_ERROR(core::log_category::STORAGE, "Failed to save chunk {}", world::to_string(coords));
            std::lock_guard lock(mutex_);
            dirty_chunks_.insert(coords);
        }
    }
}

void WorldState::save_all() {
    flush_dirty_chunks();

    std::vector<std::pair<ClientId, world::PlayerRecord>> players;
    {
        std::lock_guard lock(mutex_);
        players.reserve(online_.size());
        for (const auto& [client, id] : online_) {
            if (const Entity* entity = map_.entity_by_id(id)) {
                players.emplace_back(client, world::PlayerRecord{id, *entity});
            }
        }
    }

    for (const auto& [client, record] : players) {
        if (!store_->save_player(client, record)) {
            GEMGAME_LOG_ERROR(core::log_category::STORAGE, "Failed to save player {}", client.to_string());
        }
    }
    GEMGAME_LOG_INFO(core::log_category::STORAGE, "Saved {} players", players.size());
}

}  // namespace gemgame::server
