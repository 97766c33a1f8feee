// GemGame Client
// game_client.hpp - Frame loop state of a connected client

#pragma once

#include "client_map.hpp"
#include "my_entity.hpp"

#include <gemgame/protocol/messages.hpp>
#include <gemgame/world/entity.hpp>

#include <chrono>
#include <optional>
#include <vector>

namespace gemgame::client {

// Connection to the server as the game loop sees it
class IClientConnection : public protocol::ToServerSink {
public:
    // Messages that arrived since the last call, never blocks.
    // Throws net::NetworkError when the connection is lost or a packet is
    // malformed.
    [[nodiscard]] virtual std::vector<protocol::ToClient> receive() = 0;
};

/// Sends Hello and waits for Welcome. Other messages before it are dropped
/// with a warning. nullopt on timeout.
[[nodiscard]] std::optional<protocol::to_client::Welcome> perform_handshake(IClientConnection& connection,
                                                                          world::ClientId client_id,
                                                                          std::chrono::milliseconds timeout);

class GameClient {
public:
    // Tiles around the player kept loaded, as a renderer would look at them
    static constexpr int VIEW_RADIUS_TILES = 12;

    GameClient(IClientConnection& connection, const protocol::to_client::Welcome& welcome, float move_duration = 0.2f,
               float remote_move_duration = 0.2f);

    /// One frame: advances transitions, applies the input, streams chunks in
    /// view and dispatches what the server sent. Throws net::NetworkError.
    void update(float delta, std::optional<world::Direction> input = std::nullopt);

    void handle_message(const protocol::ToClient& message);

    // ========================================================================
    // Actions
    // ========================================================================

    void place_bomb();
    void detonate_bombs();
    void purchase(gameplay::Item item, uint32_t quantity);

    [[nodiscard]] const MyEntity& my_entity() const { return my_entity_; }
    [[nodiscard]] MyEntity& my_entity() { return my_entity_; }
    [[nodiscard]] const ClientMap& map() const { return map_; }
    [[nodiscard]] ClientMap& map() { return map_; }

private:
    void touch_view();

    IClientConnection& connection_;
    ClientMap map_;
    MyEntity my_entity_;
};

}  // namespace gemgame::client
