// GemGame Protocol
// messages.hpp - Client/server message set and its binary encoding

#pragma once

#include <gemgame/gameplay/gems.hpp>
#include <gemgame/gameplay/items.hpp>
#include <gemgame/world/chunk.hpp>
#include <gemgame/world/entity.hpp>
#include <gemgame/world/id.hpp>
#include <gemgame/world/tile.hpp>
#include <gemgame/world/types.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace gemgame::protocol {

inline constexpr uint16_t PROTOCOL_VERSION = 1;

// ============================================================================
// Client to Server
// ============================================================================

namespace to_server {

// First message of every connection
struct Hello {
    uint16_t protocol_version = PROTOCOL_VERSION;
    world::ClientId client_id;
    bool operator==(const Hello&) const = default;
};

struct RequestChunk {
    world::ChunkCoords coords{0, 0};
    bool operator==(const RequestChunk&) const = default;
};

// destination is where the client predicted the entity would end up
struct MoveMyEntity {
    uint32_t sequence = 0;
    world::Direction direction = world::DEFAULT_DIRECTION;
    world::TileCoords destination{0, 0};
    bool operator==(const MoveMyEntity&) const = default;
};

// Places one bomb on the tile the entity faces
struct PlaceBomb {
    bool operator==(const PlaceBomb&) const = default;
};

struct DetonateBombs {
    bool operator==(const DetonateBombs&) const = default;
};

struct PurchaseItem {
    gameplay::Item item = gameplay::Item::Bomb;
    uint32_t quantity = 1;
    bool operator==(const PurchaseItem&) const = default;
};

}  // namespace to_server

using ToServer = std::variant<to_server::Hello, to_server::RequestChunk, to_server::MoveMyEntity,
                              to_server::PlaceBomb, to_server::DetonateBombs, to_server::PurchaseItem>;

// ============================================================================
// Server to Client
// ============================================================================

namespace to_client {

struct Welcome {
    world::EntityId entity_id;
    world::Entity entity;
    bool operator==(const Welcome&) const = default;
};

struct ProvideChunk {
    world::ChunkCoords coords{0, 0};
    world::Chunk chunk;
    bool operator==(const ProvideChunk&) const = default;
};

struct ShouldUnloadChunk {
    world::ChunkCoords coords{0, 0};
    bool operator==(const ShouldUnloadChunk&) const = default;
};

struct ChangeTile {
    world::TileCoords coords{0, 0};
    world::Tile tile;
    bool operator==(const ChangeTile&) const = default;
};

// Authoritative position after the move with the given sequence number
struct YourEntityMoved {
    uint32_t sequence = 0;
    world::TileCoords position{0, 0};
    bool operator==(const YourEntityMoved&) const = default;
};

struct MoveEntity {
    world::EntityId id;
    world::TileCoords position{0, 0};
    world::Direction direction = world::DEFAULT_DIRECTION;
    bool operator==(const MoveEntity&) const = default;
};

struct ProvideEntity {
    world::EntityId id;
    world::Entity entity;
    bool operator==(const ProvideEntity&) const = default;
};

struct ShouldUnloadEntity {
    world::EntityId id;
    bool operator==(const ShouldUnloadEntity&) const = default;
};

struct YouCollectedGems {
    gameplay::Gem gem = gameplay::Gem::Emerald;
    uint32_t amount = 0;
    bool operator==(const YouCollectedGems&) const = default;
};

// New totals after a purchase or a placement
struct YourInventoryChanged {
    gameplay::Item item = gameplay::Item::Bomb;
    uint32_t quantity = 0;
    bool operator==(const YourInventoryChanged&) const = default;
};

struct YourGemsChanged {
    gameplay::Gem gem = gameplay::Gem::Emerald;
    uint32_t quantity = 0;
    bool operator==(const YourGemsChanged&) const = default;
};

}  // namespace to_client

using ToClient =
    std::variant<to_client::Welcome, to_client::ProvideChunk, to_client::ShouldUnloadChunk, to_client::ChangeTile,
                 to_client::YourEntityMoved, to_client::MoveEntity, to_client::ProvideEntity,
                 to_client::ShouldUnloadEntity, to_client::YouCollectedGems, to_client::YourInventoryChanged,
                 to_client::YourGemsChanged>;

// ============================================================================
// Encoding
// ============================================================================

// First byte is the alternative index, integers are little-endian
[[nodiscard]] std::vector<uint8_t> encode(const ToServer& message);
[[nodiscard]] std::vector<uint8_t> encode(const ToClient& message);

// nullopt for an unknown tag, a short payload, an invalid enum value or
// trailing bytes
[[nodiscard]] std::optional<ToServer> decode_to_server(std::span<const uint8_t> data);
[[nodiscard]] std::optional<ToClient> decode_to_client(std::span<const uint8_t> data);

// One-line summaries for logging
[[nodiscard]] std::string describe(const ToServer& message);
[[nodiscard]] std::string describe(const ToClient& message);

// ============================================================================
// Message Sinks
// ============================================================================

// Where one side hands messages to be delivered to the other
template<typename Message>
class IMessageSink {
public:
    virtual ~IMessageSink() = default;

    virtual void send(const Message& message) = 0;
};

using ToServerSink = IMessageSink<ToServer>;
using ToClientSink = IMessageSink<ToClient>;

}  // namespace gemgame::protocol
