// GemGame World
// entity.cpp - Entity encoding and cosmetic helpers

#include <gemgame/core/logger.hpp>
#include <gemgame/protocol/byte_buffer.hpp>
#include <gemgame/world/entity.hpp>

namespace gemgame::world {

namespace {

template<typename Enum>
Enum random_variant(std::mt19937& rng) {
    std::uniform_int_distribution<int> dist(0, static_cast<int>(Enum::Count) - 1);
    return static_cast<Enum>(dist(rng));
}

template<typename Enum>
Enum variant_or_default(uint8_t index, Enum fallback, const char* what) {
    if (index >= static_cast<uint8_t>(Enum::Count)) {
        GEMGAME_LOG_WARN(core::log_category::WORLD, "Invalid {} index {}, using default", what, index);
        return fallback;
    }
    return static_cast<Enum>(index);
}

}  // namespace

Cosmetics Cosmetics::random(std::mt19937& rng) {
    Cosmetics cosmetics;
    cosmetics.hair_style = random_variant<HairStyle>(rng);
    cosmetics.clothing_colour = random_variant<ClothingColour>(rng);
    cosmetics.skin_colour = random_variant<SkinColour>(rng);
    cosmetics.hair_colour = random_variant<HairColour>(rng);
    return cosmetics;
}

Cosmetics Cosmetics::from_indices(uint8_t hair_style, uint8_t clothing_colour, uint8_t skin_colour,
                                  uint8_t hair_colour, uint8_t facial_expression) {
    const Cosmetics defaults;
    Cosmetics cosmetics;
    cosmetics.hair_style = variant_or_default(hair_style, defaults.hair_style, "hair style");
    cosmetics.clothing_colour = variant_or_default(clothing_colour, defaults.clothing_colour, "clothing colour");
    cosmetics.skin_colour = variant_or_default(skin_colour, defaults.skin_colour, "skin colour");
    cosmetics.hair_colour = variant_or_default(hair_colour, defaults.hair_colour, "hair colour");
    cosmetics.facial_expression =
        variant_or_default(facial_expression, defaults.facial_expression, "facial expression");
    return cosmetics;
}

void Entity::encode(protocol::ByteWriter& writer) const {
    writer.write_i32(pos.x);
    writer.write_i32(pos.y);
    writer.write_u8(static_cast<uint8_t>(direction));
    writer.write_u8(static_cast<uint8_t>(cosmetics.hair_style));
    writer.write_u8(static_cast<uint8_t>(cosmetics.clothing_colour));
    writer.write_u8(static_cast<uint8_t>(cosmetics.skin_colour));
    writer.write_u8(static_cast<uint8_t>(cosmetics.hair_colour));
    writer.write_u8(static_cast<uint8_t>(cosmetics.facial_expression));
    gems.encode(writer);
    items.encode(writer);
    writer.write_u32(bombs_placed_count);
}

std::optional<Entity> Entity::decode(protocol::ByteReader& reader) {
    Entity entity;
    entity.pos.x = reader.read_i32();
    entity.pos.y = reader.read_i32();
    const uint8_t direction = reader.read_u8();
    const uint8_t hair_style = reader.read_u8();
    const uint8_t clothing_colour = reader.read_u8();
    const uint8_t skin_colour = reader.read_u8();
    const uint8_t hair_colour = reader.read_u8();
    const uint8_t facial_expression = reader.read_u8();
    entity.gems = gameplay::GemCollection::decode(reader);
    entity.items = gameplay::ItemInventory::decode(reader);
    entity.bombs_placed_count = reader.read_u32();

    if (!reader.ok() || !is_valid_direction(direction)) {
        reader.fail();
        return std::nullopt;
    }

    entity.direction = static_cast<Direction>(direction);
    entity.cosmetics = Cosmetics::from_indices(hair_style, clothing_colour, skin_colour, hair_colour,
                                               facial_expression);
    return entity;
}

}  // namespace gemgame::world
