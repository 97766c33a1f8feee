// GemGame Gameplay
// items.hpp - Purchasable items and the per-entity item inventory

#pragma once

#include "gems.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace gemgame::gameplay {

enum class Item : uint8_t {
    Bomb = 0,
    Count = 1
};

inline constexpr size_t ITEM_KIND_COUNT = static_cast<size_t>(Item::Count);

[[nodiscard]] const char* item_to_string(Item item);

[[nodiscard]] inline bool is_valid_item(uint8_t value) {
    return value < static_cast<uint8_t>(Item::Count);
}

// Price of one unit
struct ItemPrice {
    Gem gem = Gem::Emerald;
    uint32_t amount = 0;
};

[[nodiscard]] ItemPrice item_price(Item item);

class ItemInventory {
public:
    ItemInventory() = default;

    [[nodiscard]] uint32_t quantity(Item item) const;
    void add(Item item, uint32_t amount);
    // Removes the amount only if it is all there
    bool remove(Item item, uint32_t amount);

    // Persisted blob: u8 entry count, then (u8 item, u32 quantity) pairs
    [[nodiscard]] std::vector<uint8_t> to_blob() const;
    // An undecodable blob yields an empty inventory with a warning
    [[nodiscard]] static ItemInventory from_blob(std::span<const uint8_t> blob);

    void encode(protocol::ByteWriter& writer) const;
    [[nodiscard]] static ItemInventory decode(protocol::ByteReader& reader);

    bool operator==(const ItemInventory& other) const = default;

private:
    std::array<uint32_t, ITEM_KIND_COUNT> quantities_{};
};

}  // namespace gemgame::gameplay
