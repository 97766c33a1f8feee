// GemGame Server
// session.cpp - Per-client protocol handling

#include <gemgame/core/logger.hpp>
#include <gemgame/server/session.hpp>

#include <type_traits>
#include <vector>

namespace gemgame::server {

namespace ts = protocol::to_server;
namespace tc = protocol::to_client;

using world::ChunkCoords;
using world::EntityId;
using world::TileCoords;

SessionHandler::SessionHandler(WorldState& world, protocol::ToClientSink& sink, const SessionConfig& config)
    : world_(world), sink_(sink), config_(config) {}

// ============================================================================
// Client Messages
// ============================================================================

bool SessionHandler::handle_message(const protocol::ToServer& message) {
    if (const auto* hello = std::get_if<ts::Hello>(&message)) {
        return handle_hello(*hello);
    }

    if (!is_joined()) {
        GEMGAME_LOG_WARN(core::log_category::PROTOCOL, "{} received before Hello", protocol::describe(message));
        return false;
    }

    return std::visit(
        [this](const auto& msg) -> bool {
            using T = std::decay_t<decltype(msg)>;
            if constexpr (std::is_same_v<T, ts::RequestChunk>) {
                handle_request_chunk(msg);
                return true;
            } else if constexpr (std::is_same_v<T, ts::MoveMyEntity>) {
                return handle_move(msg);
            } else if constexpr (std::is_same_v<T, ts::PlaceBomb>) {
                return handle_place_bomb();
            } else if constexpr (std::is_same_v<T, ts::DetonateBombs>) {
                return handle_detonate_bombs();
            } else if constexpr (std::is_same_v<T, ts::PurchaseItem>) {
                return handle_purchase(msg);
            } else {
                return false;
            }
        },
        message);
}

bool SessionHandler::handle_hello(const ts::Hello& hello) {
    if (client_id_) {
        GEMGAME_LOG_WARN(core::log_category::PROTOCOL, "Client {} sent a second Hello", client_id_->to_string());
        return false;
    }
    if (hello.protocol_version != protocol::PROTOCOL_VERSION) {
        GEMGAME_LOG_WARN(core::log_category::PROTOCOL, "Client {} speaks protocol {}, expected {}",
                         hello.client_id.to_string(), hello.protocol_version, protocol::PROTOCOL_VERSION);
        return false;
    }

    auto joined = world_.join(hello.client_id);
    if (!joined) {
        return false;
    }

    client_id_ = hello.client_id;
    entity_id_ = joined->entity_id;
    position_ = joined->entity.pos;
    sink_.send(tc::Welcome{joined->entity_id, joined->entity});
    return true;
}

void SessionHandler::handle_request_chunk(const ts::RequestChunk& request) {
    world::Chunk chunk = world_.chunk_at(request.coords);
    sink_.send(tc::ProvideChunk{request.coords, chunk});
    provided_chunks_.insert(request.coords);

    for (const auto& [id, entity] : world_.entities_in_chunk(request.coords)) {
        if (id == *entity_id_) {
            continue;
        }
        known_entities_[id] = entity.pos;
        sink_.send(tc::ProvideEntity{id, entity});
    }
}

bool SessionHandler::handle_move(const ts::MoveMyEntity& move) {
    auto outcome = world_.move_entity(*entity_id_, move.direction);
    if (!outcome) {
        GEMGAME_LOG_ERROR(core::log_category::SERVER, "Entity {} vanished from the map", entity_id_->to_string());
        return false;
    }

    position_ = outcome->position;
    if (!outcome->committed || outcome->position != move.destination) {
        sink_.send(tc::YourEntityMoved{move.sequence, outcome->position});
    }

    if (outcome->committed) {
        unload_distant_chunks();
    }
    return true;
}

bool SessionHandler::handle_place_bomb() {
    auto outcome = world_.place_bomb(*entity_id_);
    if (!outcome) {
        return false;
    }
    sink_.send(tc::YourInventoryChanged{gameplay::Item::Bomb, outcome->bombs_remaining});
    return true;
}

bool SessionHandler::handle_detonate_bombs() {
    auto outcome = world_.detonate_bombs(*entity_id_);
    if (!outcome) {
        return false;
    }

    std::vector<bool> changed(gameplay::GEM_KIND_COUNT, false);
    for (const auto& collected : outcome->collected) {
        sink_.send(tc::YouCollectedGems{collected.gem, collected.amount});
        changed[static_cast<size_t>(collected.gem)] = true;
    }
    for (size_t i = 0; i < gameplay::GEM_KIND_COUNT; ++i) {
        if (changed[i]) {
            const auto gem = static_cast<gameplay::Gem>(i);
            sink_.send(tc::YourGemsChanged{gem, outcome->gems.quantity(gem)});
        }
    }
    return true;
}

bool SessionHandler::handle_purchase(const ts::PurchaseItem& purchase) {
    auto outcome = world_.purchase(*entity_id_, purchase.item, purchase.quantity);
    if (!outcome) {
        return false;
    }
    if (!outcome->purchased) {
        GEMGAME_LOG_DEBUG(core::log_category::SERVER, "Entity {} cannot afford {} x{}", entity_id_->to_string(),
                          gameplay::item_to_string(purchase.item), purchase.quantity);
    }
    sink_.send(tc::YourInventoryChanged{purchase.item, outcome->item_quantity});
    sink_.send(tc::YourGemsChanged{outcome->gem, outcome->gem_quantity});
    return true;
}

void SessionHandler::unload_distant_chunks() {
    const ChunkCoords centre = world::chunk_of(position_);

    std::vector<ChunkCoords> distant;
    for (const ChunkCoords& coords : provided_chunks_) {
        if (world::chebyshev_distance(coords, centre) > config_.view_distance) {
            distant.push_back(coords);
        }
    }

    for (const ChunkCoords& coords : distant) {
        provided_chunks_.erase(coords);
        sink_.send(tc::ShouldUnloadChunk{coords});
    }

    // The client drops entities standing in unloaded chunks on its own
    std::erase_if(known_entities_, [this](const auto& entry) { return !is_visible(entry.second); });
}

// ============================================================================
// World Changes
// ============================================================================

bool SessionHandler::is_visible(const TileCoords& position) const {
    return provided_chunks_.contains(world::chunk_of(position));
}

void SessionHandler::entity_seen(EntityId id, const TileCoords& position, world::Direction direction) {
    const bool visible = is_visible(position);
    auto known = known_entities_.find(id);

    if (known != known_entities_.end()) {
        if (visible) {
            known->second = position;
            sink_.send(tc::MoveEntity{id, position, direction});
        } else {
            known_entities_.erase(known);
            sink_.send(tc::ShouldUnloadEntity{id});
        }
        return;
    }

    if (visible) {
        // Walked into view, the client needs the whole entity
        if (auto entity = world_.entity(id)) {
            known_entities_[id] = entity->pos;
            sink_.send(tc::ProvideEntity{id, *entity});
        }
    }
}

void SessionHandler::handle_world_change(const WorldChange& change) {
    if (!is_joined()) {
        return;
    }

    std::visit(
        [this](const auto& event) {
            using T = std::decay_t<decltype(event)>;
            if constexpr (std::is_same_v<T, EntityMoved>) {
                if (event.id != *entity_id_) {
                    entity_seen(event.id, event.position, event.direction);
                }
            } else if constexpr (std::is_same_v<T, EntityAdded>) {
                if (event.id != *entity_id_ && is_visible(event.entity.pos)) {
                    known_entities_[event.id] = event.entity.pos;
                    sink_.send(tc::ProvideEntity{event.id, event.entity});
                }
            } else if constexpr (std::is_same_v<T, EntityRemoved>) {
                if (known_entities_.erase(event.id) > 0) {
                    sink_.send(tc::ShouldUnloadEntity{event.id});
                }
            } else if constexpr (std::is_same_v<T, TileChanged>) {
                if (is_visible(event.coords)) {
                    sink_.send(tc::ChangeTile{event.coords, event.tile});
                }
            }
        },
        change);
}

void SessionHandler::close() {
    if (client_id_ && entity_id_) {
        world_.leave(*client_id_);
    }
    entity_id_.reset();
    provided_chunks_.clear();
    known_entities_.clear();
}

}  // namespace gemgame::server
