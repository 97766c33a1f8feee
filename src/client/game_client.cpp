// GemGame Client
// game_client.cpp - Message dispatch and frame update

#include <gemgame/client/game_client.hpp>
#include <gemgame/core/logger.hpp>

#include <thread>
#include <type_traits>

namespace gemgame::client {

namespace ts = protocol::to_server;
namespace tc = protocol::to_client;

std::optional<tc::Welcome> perform_handshake(IClientConnection& connection, world::ClientId client_id,
                                             std::chrono::milliseconds timeout) {
    connection.send(ts::Hello{protocol::PROTOCOL_VERSION, client_id});

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        for (const protocol::ToClient& message : connection.receive()) {
            if (const auto* welcome = std::get_if<tc::Welcome>(&message)) {
                GEMGAME_LOG_INFO(core::log_category::CLIENT, "Welcomed as entity {} at {}",
                                 welcome->entity_id.to_string(), world::to_string(welcome->entity.pos));
                return *welcome;
            }
            GEMGAME_LOG_WARN(core::log_category::CLIENT, "Ignoring {} before Welcome", protocol::describe(message));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    GEMGAME_LOG_ERROR(core::log_category::CLIENT, "No Welcome within {} ms", timeout.count());
    return std::nullopt;
}

GameClient::GameClient(IClientConnection& connection, const tc::Welcome& welcome, float move_duration,
                       float remote_move_duration)
    : connection_(connection),
      map_(remote_move_duration),
      my_entity_(welcome.entity_id, welcome.entity, move_duration) {}

void GameClient::update(float delta, std::optional<world::Direction> input) {
    my_entity_.update(delta);
    map_.update(delta);

    if (input) {
        my_entity_.move_towards_checked(*input, map_, connection_);
    }

    touch_view();
    map_.request_needed_chunks(connection_);

    for (const protocol::ToClient& message : connection_.receive()) {
        GEMGAME_LOG_TRACE(core::log_category::CLIENT, "Received {}", protocol::describe(message));
        handle_message(message);
    }
}

void GameClient::touch_view() {
    const world::TileCoords centre = my_entity_.entity().pos;
    // Samples closer together than a chunk width touch every chunk in view
    for (int dy = -VIEW_RADIUS_TILES; dy <= VIEW_RADIUS_TILES; dy += VIEW_RADIUS_TILES) {
        for (int dx = -VIEW_RADIUS_TILES; dx <= VIEW_RADIUS_TILES; dx += VIEW_RADIUS_TILES) {
            (void)map_.tile_at(centre + world::TileCoords(dx, dy));
        }
    }
}

void GameClient::handle_message(const protocol::ToClient& message) {
    std::visit(
        [this](const auto& msg) {
            using T = std::decay_t<decltype(msg)>;
            if constexpr (std::is_same_v<T, tc::Welcome>) {
                GEMGAME_LOG_WARN(core::log_category::CLIENT, "Unexpected Welcome for entity {}",
                                 msg.entity_id.to_string());
            } else if constexpr (std::is_same_v<T, tc::ProvideChunk>) {
                map_.provide_chunk(msg.coords, msg.chunk);
            } else if constexpr (std::is_same_v<T, tc::ShouldUnloadChunk>) {
                map_.remove_chunk(msg.coords);
            } else if constexpr (std::is_same_v<T, tc::ChangeTile>) {
                if (!map_.set_loaded_tile_at(msg.coords, msg.tile)) {
                    GEMGAME_LOG_WARN(core::log_category::CLIENT,
                                     "Told to change tile at {} to {} yet its chunk is not loaded",
                                     world::to_string(msg.coords), world::tile_type_to_string(msg.tile.type));
                }
            } else if constexpr (std::is_same_v<T, tc::YourEntityMoved>) {
                my_entity_.received_movement_reconciliation(msg.sequence, msg.position);
            } else if constexpr (std::is_same_v<T, tc::MoveEntity>) {
                map_.move_remote_entity(msg.id, msg.position, msg.direction);
            } else if constexpr (std::is_same_v<T, tc::ProvideEntity>) {
                map_.add_entity(msg.id, msg.entity);
            } else if constexpr (std::is_same_v<T, tc::ShouldUnloadEntity>) {
                map_.remove_entity(msg.id);
            } else if constexpr (std::is_same_v<T, tc::YouCollectedGems>) {
                GEMGAME_LOG_INFO(core::log_category::CLIENT, "Collected {} {}", msg.amount,
                                 gameplay::gem_to_string(msg.gem));
            } else if constexpr (std::is_same_v<T, tc::YourInventoryChanged>) {
                auto& items = my_entity_.entity().items;
                const uint32_t held = items.quantity(msg.item);
                if (msg.quantity > held) {
                    items.add(msg.item, msg.quantity - held);
                } else {
                    items.remove(msg.item, held - msg.quantity);
                }
            } else if constexpr (std::is_same_v<T, tc::YourGemsChanged>) {
                auto& gems = my_entity_.entity().gems;
                const uint32_t held = gems.quantity(msg.gem);
                if (msg.quantity > held) {
                    gems.increase(msg.gem, msg.quantity - held);
                } else {
                    gems.decrease(msg.gem, held - msg.quantity);
                }
            }
        },
        message);
}

// ============================================================================
// Actions
// ============================================================================

void GameClient::place_bomb() {
    connection_.send(ts::PlaceBomb{});
}

void GameClient::detonate_bombs() {
    connection_.send(ts::DetonateBombs{});
}

void GameClient::purchase(gameplay::Item item, uint32_t quantity) {
    connection_.send(ts::PurchaseItem{item, quantity});
}

}  // namespace gemgame::client
