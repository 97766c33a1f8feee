// GemGame Gameplay
// items.cpp - Item inventory implementation

#include <gemgame/core/logger.hpp>
#include <gemgame/gameplay/items.hpp>
#include <gemgame/protocol/byte_buffer.hpp>

#include <limits>

namespace gemgame::gameplay {

const char* item_to_string(Item item) {
    switch (item) {
        case Item::Bomb:
            return "Bomb";
        default:
            return "Unknown";
    }
}

ItemPrice item_price(Item item) {
    switch (item) {
        case Item::Bomb:
        default:
            return ItemPrice{Gem::Emerald, 5};
    }
}

uint32_t ItemInventory::quantity(Item item) const {
    return quantities_[static_cast<size_t>(item) % ITEM_KIND_COUNT];
}

void ItemInventory::add(Item item, uint32_t amount) {
    auto& value = quantities_[static_cast<size_t>(item) % ITEM_KIND_COUNT];
    const uint32_t room = std::numeric_limits<uint32_t>::max() - value;
    value += amount > room ? room : amount;
}

bool ItemInventory::remove(Item item, uint32_t amount) {
    auto& value = quantities_[static_cast<size_t>(item) % ITEM_KIND_COUNT];
    if (value < amount) {
        return false;
    }
    value -= amount;
    return true;
}

void ItemInventory::encode(protocol::ByteWriter& writer) const {
    writer.write_u8(static_cast<uint8_t>(ITEM_KIND_COUNT));
    for (size_t i = 0; i < ITEM_KIND_COUNT; ++i) {
        writer.write_u8(static_cast<uint8_t>(i));
        writer.write_u32(quantities_[i]);
    }
}

ItemInventory ItemInventory::decode(protocol::ByteReader& reader) {
    ItemInventory inventory;
    const uint8_t count = reader.read_u8();
    for (uint8_t i = 0; i < count && reader.ok(); ++i) {
        const uint8_t item = reader.read_u8();
        const uint32_t amount = reader.read_u32();
        if (!is_valid_item(item)) {
            reader.fail();
            break;
        }
        inventory.quantities_[item] = amount;
    }
    return inventory;
}

std::vector<uint8_t> ItemInventory::to_blob() const {
    protocol::ByteWriter writer;
    encode(writer);
    return writer.take();
}

ItemInventory ItemInventory::from_blob(std::span<const uint8_t> blob) {
    protocol::ByteReader reader(blob);
    ItemInventory inventory = decode(reader);
    if (!reader.ok() || !reader.at_end()) {
        GEMGAME_LOG_WARN(core::log_category::STORAGE, "Undecodable item inventory blob ({} bytes), using empty",
                         blob.size());
        return ItemInventory{};
    }
    return inventory;
}

}  // namespace gemgame::gameplay
