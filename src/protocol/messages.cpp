// GemGame Protocol
// messages.cpp - Message encoding, decoding and descriptions

#include <gemgame/core/logger.hpp>
#include <gemgame/protocol/byte_buffer.hpp>
#include <gemgame/protocol/messages.hpp>

#include <spdlog/fmt/fmt.h>
#include <type_traits>

namespace gemgame::protocol {

namespace {

// ============================================================================
// Field Helpers
// ============================================================================

void write_coords(ByteWriter& writer, const glm::ivec2& coords) {
    writer.write_i32(coords.x);
    writer.write_i32(coords.y);
}

glm::ivec2 read_coords(ByteReader& reader) {
    const int32_t x = reader.read_i32();
    const int32_t y = reader.read_i32();
    return {x, y};
}

world::Direction read_direction(ByteReader& reader) {
    const uint8_t value = reader.read_u8();
    if (!world::is_valid_direction(value)) {
        reader.fail();
        return world::DEFAULT_DIRECTION;
    }
    return static_cast<world::Direction>(value);
}

gameplay::Gem read_gem(ByteReader& reader) {
    const uint8_t value = reader.read_u8();
    if (!gameplay::is_valid_gem(value)) {
        reader.fail();
        return gameplay::Gem::Emerald;
    }
    return static_cast<gameplay::Gem>(value);
}

gameplay::Item read_item(ByteReader& reader) {
    const uint8_t value = reader.read_u8();
    if (!gameplay::is_valid_item(value)) {
        reader.fail();
        return gameplay::Item::Bomb;
    }
    return static_cast<gameplay::Item>(value);
}

world::Entity read_entity(ByteReader& reader) {
    auto entity = world::Entity::decode(reader);
    return entity ? *entity : world::Entity{};
}

// ============================================================================
// Client to Server
// ============================================================================

void write_body(ByteWriter& writer, const to_server::Hello& m) {
    writer.write_u16(m.protocol_version);
    writer.write_u64(m.client_id.value());
}

void write_body(ByteWriter& writer, const to_server::RequestChunk& m) {
    write_coords(writer, m.coords);
}

void write_body(ByteWriter& writer, const to_server::MoveMyEntity& m) {
    writer.write_u32(m.sequence);
    writer.write_u8(static_cast<uint8_t>(m.direction));
    write_coords(writer, m.destination);
}

void write_body(ByteWriter&, const to_server::PlaceBomb&) {}

void write_body(ByteWriter&, const to_server::DetonateBombs&) {}

void write_body(ByteWriter& writer, const to_server::PurchaseItem& m) {
    writer.write_u8(static_cast<uint8_t>(m.item));
    writer.write_u32(m.quantity);
}

// ============================================================================
// Server to Client
// ============================================================================

void write_body(ByteWriter& writer, const to_client::Welcome& m) {
    writer.write_u64(m.entity_id.value());
    m.entity.encode(writer);
}

void write_body(ByteWriter& writer, const to_client::ProvideChunk& m) {
    write_coords(writer, m.coords);
    m.chunk.serialize(writer);
}

void write_body(ByteWriter& writer, const to_client::ShouldUnloadChunk& m) {
    write_coords(writer, m.coords);
}

void write_body(ByteWriter& writer, const to_client::ChangeTile& m) {
    write_coords(writer, m.coords);
    m.tile.encode(writer);
}

void write_body(ByteWriter& writer, const to_client::YourEntityMoved& m) {
    writer.write_u32(m.sequence);
    write_coords(writer, m.position);
}

void write_body(ByteWriter& writer, const to_client::MoveEntity& m) {
    writer.write_u64(m.id.value());
    write_coords(writer, m.position);
    writer.write_u8(static_cast<uint8_t>(m.direction));
}

void write_body(ByteWriter& writer, const to_client::ProvideEntity& m) {
    writer.write_u64(m.id.value());
    m.entity.encode(writer);
}

void write_body(ByteWriter& writer, const to_client::ShouldUnloadEntity& m) {
    writer.write_u64(m.id.value());
}

void write_body(ByteWriter& writer, const to_client::YouCollectedGems& m) {
    writer.write_u8(static_cast<uint8_t>(m.gem));
    writer.write_u32(m.amount);
}

void write_body(ByteWriter& writer, const to_client::YourInventoryChanged& m) {
    writer.write_u8(static_cast<uint8_t>(m.item));
    writer.write_u32(m.quantity);
}

void write_body(ByteWriter& writer, const to_client::YourGemsChanged& m) {
    writer.write_u8(static_cast<uint8_t>(m.gem));
    writer.write_u32(m.quantity);
}

template<typename Variant>
std::vector<uint8_t> encode_variant(const Variant& message) {
    ByteWriter writer;
    writer.write_u8(static_cast<uint8_t>(message.index()));
    std::visit([&writer](const auto& body) { write_body(writer, body); }, message);
    return writer.take();
}

// Shared tail of both decoders: the whole payload must be consumed
template<typename Message>
std::optional<Message> finish(const ByteReader& reader, Message message, uint8_t tag) {
    if (!reader.ok() || !reader.at_end()) {
        GEMGAME_LOG_WARN(core::log_category::PROTOCOL, "Malformed payload for message tag {}", tag);
        return std::nullopt;
    }
    return message;
}

}  // namespace

std::vector<uint8_t> encode(const ToServer& message) {
    return encode_variant(message);
}

std::vector<uint8_t> encode(const ToClient& message) {
    return encode_variant(message);
}

std::optional<ToServer> decode_to_server(std::span<const uint8_t> data) {
    ByteReader reader(data);
    const uint8_t tag = reader.read_u8();
    if (!reader.ok()) {
        GEMGAME_LOG_WARN(core::log_category::PROTOCOL, "Empty message");
        return std::nullopt;
    }

    switch (tag) {
        case 0: {
            to_server::Hello m;
            m.protocol_version = reader.read_u16();
            m.client_id = world::ClientId(reader.read_u64());
            return finish<ToServer>(reader, m, tag);
        }
        case 1: {
            to_server::RequestChunk m;
            m.coords = read_coords(reader);
            return finish<ToServer>(reader, m, tag);
        }
        case 2: {
            to_server::MoveMyEntity m;
            m.sequence = reader.read_u32();
            m.direction = read_direction(reader);
            m.destination = read_coords(reader);
            return finish<ToServer>(reader, m, tag);
        }
        case 3:
            return finish<ToServer>(reader, to_server::PlaceBomb{}, tag);
        case 4:
            return finish<ToServer>(reader, to_server::DetonateBombs{}, tag);
        case 5: {
            to_server::PurchaseItem m;
            m.item = read_item(reader);
            m.quantity = reader.read_u32();
            return finish<ToServer>(reader, m, tag);
        }
        default:
            GEMGAME_LOG_WARN(core::log_category::PROTOCOL, "Unknown client message tag {}", tag);
            return std::nullopt;
    }
}

std::optional<ToClient> decode_to_client(std::span<const uint8_t> data) {
    ByteReader reader(data);
    const uint8_t tag = reader.read_u8();
    if (!reader.ok()) {
        GEMGAME_LOG_WARN(core::log_category::PROTOCOL, "Empty message");
        return std::nullopt;
    }

    switch (tag) {
        case 0: {
            to_client::Welcome m;
            m.entity_id = world::EntityId(reader.read_u64());
            m.entity = read_entity(reader);
            return finish<ToClient>(reader, m, tag);
        }
        case 1: {
            to_client::ProvideChunk m;
            m.coords = read_coords(reader);
            if (!world::Chunk::deserialize(reader, m.chunk)) {
                reader.fail();
            }
            return finish<ToClient>(reader, std::move(m), tag);
        }
        case 2: {
            to_client::ShouldUnloadChunk m;
            m.coords = read_coords(reader);
            return finish<ToClient>(reader, m, tag);
        }
        case 3: {
            to_client::ChangeTile m;
            m.coords = read_coords(reader);
            m.tile = world::Tile::decode(reader);
            return finish<ToClient>(reader, m, tag);
        }
        case 4: {
            to_client::YourEntityMoved m;
            m.sequence = reader.read_u32();
            m.position = read_coords(reader);
            return finish<ToClient>(reader, m, tag);
        }
        case 5: {
            to_client::MoveEntity m;
            m.id = world::EntityId(reader.read_u64());
            m.position = read_coords(reader);
            m.direction = read_direction(reader);
            return finish<ToClient>(reader, m, tag);
        }
        case 6: {
            to_client::ProvideEntity m;
            m.id = world::EntityId(reader.read_u64());
            m.entity = read_entity(reader);
            return finish<ToClient>(reader, m, tag);
        }
        case 7: {
            to_client::ShouldUnloadEntity m;
            m.id = world::EntityId(reader.read_u64());
            return finish<ToClient>(reader, m, tag);
        }
        case 8: {
            to_client::YouCollectedGems m;
            m.gem = read_gem(reader);
            m.amount = reader.read_u32();
            return finish<ToClient>(reader, m, tag);
        }
        case 9: {
            to_client::YourInventoryChanged m;
            m.item = read_item(reader);
            m.quantity = reader.read_u32();
            return finish<ToClient>(reader, m, tag);
        }
        case 10: {
            to_client::YourGemsChanged m;
            m.gem = read_gem(reader);
            m.quantity = reader.read_u32();
            return finish<ToClient>(reader, m, tag);
        }
        default:
            GEMGAME_LOG_WARN(core::log_category::PROTOCOL, "Unknown server message tag {}", tag);
            return std::nullopt;
    }
}

// ============================================================================
// Descriptions
// ============================================================================

std::string describe(const ToServer& message) {
    return std::visit(
        [](const auto& m) -> std::string {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, to_server::Hello>) {
                return fmt::format("Hello(v{}, client {})", m.protocol_version, m.client_id.to_string());
            } else if constexpr (std::is_same_v<T, to_server::RequestChunk>) {
                return fmt::format("RequestChunk{}", world::to_string(m.coords));
            } else if constexpr (std::is_same_v<T, to_server::MoveMyEntity>) {
                return fmt::format("MoveMyEntity(#{}, {}, to {})", m.sequence, world::direction_to_string(m.direction),
                                   world::to_string(m.destination));
            } else if constexpr (std::is_same_v<T, to_server::PlaceBomb>) {
                return "PlaceBomb";
            } else if constexpr (std::is_same_v<T, to_server::DetonateBombs>) {
                return "DetonateBombs";
            } else {
                return fmt::format("PurchaseItem({} x{})", gameplay::item_to_string(m.item), m.quantity);
            }
        },
        message);
}

std::string describe(const ToClient& message) {
    return std::visit(
        [](const auto& m) -> std::string {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, to_client::Welcome>) {
                return fmt::format("Welcome(entity {} at {})", m.entity_id.to_string(), world::to_string(m.entity.pos));
            } else if constexpr (std::is_same_v<T, to_client::ProvideChunk>) {
                return fmt::format("ProvideChunk{}", world::to_string(m.coords));
            } else if constexpr (std::is_same_v<T, to_client::ShouldUnloadChunk>) {
                return fmt::format("ShouldUnloadChunk{}", world::to_string(m.coords));
            } else if constexpr (std::is_same_v<T, to_client::ChangeTile>) {
                return fmt::format("ChangeTile({} -> {})", world::to_string(m.coords),
                                   world::tile_type_to_string(m.tile.type));
            } else if constexpr (std::is_same_v<T, to_client::YourEntityMoved>) {
                return fmt::format("YourEntityMoved(#{}, {})", m.sequence, world::to_string(m.position));
            } else if constexpr (std::is_same_v<T, to_client::MoveEntity>) {
                return fmt::format("MoveEntity({}, {})", m.id.to_string(), world::to_string(m.position));
            } else if constexpr (std::is_same_v<T, to_client::ProvideEntity>) {
                return fmt::format("ProvideEntity({} at {})", m.id.to_string(), world::to_string(m.entity.pos));
            } else if constexpr (std::is_same_v<T, to_client::ShouldUnloadEntity>) {
                return fmt::format("ShouldUnloadEntity({})", m.id.to_string());
            } else if constexpr (std::is_same_v<T, to_client::YouCollectedGems>) {
                return fmt::format("YouCollectedGems({} x{})", gameplay::gem_to_string(m.gem), m.amount);
            } else if constexpr (std::is_same_v<T, to_client::YourInventoryChanged>) {
                return fmt::format("YourInventoryChanged({} = {})", gameplay::item_to_string(m.item), m.quantity);
            } else {
                return fmt::format("YourGemsChanged({} = {})", gameplay::gem_to_string(m.gem), m.quantity);
            }
        },
        message);
}

}  // namespace gemgame::protocol
