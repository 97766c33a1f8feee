// GemGame Server
// session.hpp - Protocol handling for one connected client

#pragma once

#include "broadcast.hpp"
#include "world_state.hpp"

#include <gemgame/protocol/messages.hpp>

#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace gemgame::server {

struct SessionConfig {
    // Provided chunks farther than this from the player are unloaded
    int32_t view_distance = 3;
};

/// Turns one client's messages into world operations and world changes into
/// that client's view of them. Not thread-safe: ClientSession drives it from
/// a single thread.
class SessionHandler {
public:
    SessionHandler(WorldState& world, protocol::ToClientSink& sink, const SessionConfig& config = {});

    SessionHandler(const SessionHandler&) = delete;
    SessionHandler& operator=(const SessionHandler&) = delete;

    /// Returns false when the client broke the protocol and must be
    /// disconnected
    [[nodiscard]] bool handle_message(const protocol::ToServer& message);

    void handle_world_change(const WorldChange& change);

    /// Saves and removes the player. Safe to call more than once.
    void close();

    [[nodiscard]] bool is_joined() const { return entity_id_.has_value(); }
    [[nodiscard]] std::optional<world::ClientId> client_id() const { return client_id_; }
    [[nodiscard]] std::optional<world::EntityId> entity_id() const { return entity_id_; }
    [[nodiscard]] const std::unordered_set<world::ChunkCoords>& provided_chunks() const { return provided_chunks_; }
    [[nodiscard]] bool knows_entity(world::EntityId id) const { return known_entities_.contains(id); }

private:
    bool handle_hello(const protocol::to_server::Hello& hello);
    void handle_request_chunk(const protocol::to_server::RequestChunk& request);
    bool handle_move(const protocol::to_server::MoveMyEntity& move);
    bool handle_place_bomb();
    bool handle_detonate_bombs();
    bool handle_purchase(const protocol::to_server::PurchaseItem& purchase);

    void entity_seen(world::EntityId id, const world::TileCoords& position, world::Direction direction);
    void unload_distant_chunks();
    [[nodiscard]] bool is_visible(const world::TileCoords& position) const;

    WorldState& world_;
    protocol::ToClientSink& sink_;
    SessionConfig config_;

    std::optional<world::ClientId> client_id_;
    std::optional<world::EntityId> entity_id_;
    world::TileCoords position_{0, 0};

    std::unordered_set<world::ChunkCoords> provided_chunks_;
    // Other entities this client has been told about, by last sent position
    std::unordered_map<world::EntityId, world::TileCoords> known_entities_;
};

}  // namespace gemgame::server
