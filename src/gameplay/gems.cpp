// GemGame Gameplay
// gems.cpp - Gem collection implementation

#include <gemgame/core/logger.hpp>
#include <gemgame/gameplay/gems.hpp>
#include <gemgame/protocol/byte_buffer.hpp>

#include <limits>

namespace gemgame::gameplay {

const char* gem_to_string(Gem gem) {
    switch (gem) {
        case Gem::Emerald:
            return "Emerald";
        case Gem::Ruby:
            return "Ruby";
        case Gem::Diamond:
            return "Diamond";
        default:
            return "Unknown";
    }
}

uint32_t GemCollection::quantity(Gem gem) const {
    return quantities_[static_cast<size_t>(gem) % GEM_KIND_COUNT];
}

void GemCollection::increase(Gem gem, uint32_t amount) {
    auto& value = quantities_[static_cast<size_t>(gem) % GEM_KIND_COUNT];
    const uint32_t room = std::numeric_limits<uint32_t>::max() - value;
    value += amount > room ? room : amount;
}

bool GemCollection::decrease(Gem gem, uint32_t amount) {
    auto& value = quantities_[static_cast<size_t>(gem) % GEM_KIND_COUNT];
    if (value < amount) {
        return false;
    }
    value -= amount;
    return true;
}

bool GemCollection::is_empty() const {
    for (uint32_t value : quantities_) {
        if (value != 0) {
            return false;
        }
    }
    return true;
}

void GemCollection::encode(protocol::ByteWriter& writer) const {
    writer.write_u8(static_cast<uint8_t>(GEM_KIND_COUNT));
    for (size_t i = 0; i < GEM_KIND_COUNT; ++i) {
        writer.write_u8(static_cast<uint8_t>(i));
        writer.write_u32(quantities_[i]);
    }
}

GemCollection GemCollection::decode(protocol::ByteReader& reader) {
    GemCollection gems;
    const uint8_t count = reader.read_u8();
    for (uint8_t i = 0; i < count && reader.ok(); ++i) {
        const uint8_t gem = reader.read_u8();
        const uint32_t amount = reader.read_u32();
        if (!is_valid_gem(gem)) {
            reader.fail();
            break;
        }
        gems.quantities_[gem] = amount;
    }
    return gems;
}

std::vector<uint8_t> GemCollection::to_blob() const {
    protocol::ByteWriter writer;
    encode(writer);
    return writer.take();
}

GemCollection GemCollection::from_blob(std::span<const uint8_t> blob) {
    protocol::ByteReader reader(blob);
    GemCollection gems = decode(reader);
    if (!reader.ok() || !reader.at_end()) {
        GEMGAME_LOG_WARN(core::log_category::STORAGE, "Undecodable gem collection blob ({} bytes), using empty",
                         blob.size());
        return GemCollection{};
    }
    return gems;
}

std::optional<GemYield> rock_yield(world::TileType type) {
    switch (type) {
        case world::TileType::Rock:
            return GemYield{Gem::Emerald, 1, 2};
        case world::TileType::EmeraldRock:
            return GemYield{Gem::Emerald, 3, 6};
        case world::TileType::RubyRock:
            return GemYield{Gem::Ruby, 2, 4};
        case world::TileType::DiamondRock:
            return GemYield{Gem::Diamond, 1, 2};
        default:
            return std::nullopt;
    }
}

uint32_t yield_amount(const GemYield& yield, uint32_t roll) {
    if (yield.maximum <= yield.minimum) {
        return yield.minimum;
    }
    return yield.minimum + roll % (yield.maximum - yield.minimum + 1);
}

}  // namespace gemgame::gameplay
