// GemGame Client
// my_entity.cpp - Client-side prediction and reconciliation

#include <gemgame/client/my_entity.hpp>
#include <gemgame/core/logger.hpp>

#include <cmath>

namespace gemgame::client {

using world::TileCoords;

MyEntity::MyEntity(world::EntityId id, const world::Entity& entity, float move_duration)
    : id_(id), entity_(entity), move_duration_(move_duration), transition_(entity.pos, entity.pos, 0.0f) {}

bool MyEntity::move_towards_checked(world::Direction direction, ClientMap& map, protocol::ToServerSink& sink) {
    if (is_moving()) {
        return false;
    }

    entity_.direction = direction;

    const TileCoords from = entity_.pos;
    const TileCoords target = world::step(from, direction);

    // Marks the chunk as needed when it is missing
    (void)map.tile_at(target);
    if (!world::is_position_free(map, target)) {
        return false;
    }

    const uint32_t sequence = ++last_sequence_;
    entity_.pos = target;
    transition_ = Transition(from, target, move_duration_);

    state_ = Predicted{sequence, from, target};

    sink.send(protocol::to_server::MoveMyEntity{sequence, direction, target});
    return true;
}

void MyEntity::received_movement_reconciliation(uint32_t sequence, const TileCoords& position) {
    if (last_correction_ && sequence < *last_correction_) {
        GEMGAME_LOG_DEBUG(core::log_category::CLIENT, "Ignoring stale correction {} (already applied {})", sequence,
                          *last_correction_);
        return;
    }
    last_correction_ = sequence;

    GEMGAME_LOG_DEBUG(core::log_category::CLIENT, "Move {} corrected from {} to {}", sequence,
                      world::to_string(entity_.pos), world::to_string(position));

    // Start from wherever the entity is drawn right now
    const glm::vec2 shown = transition_.current();
    const TileCoords from(static_cast<int32_t>(std::round(shown.x)), static_cast<int32_t>(std::round(shown.y)));

    entity_.pos = position;
    transition_ = Transition(from, position, move_duration_ / CORRECTION_SPEEDUP);
    state_ = Correcting{sequence, from, position};
}

void MyEntity::update(float delta) {
    transition_.update(delta);
    if (transition_.is_complete() && !std::holds_alternative<Idle>(state_)) {
        state_ = Idle{};
    }
}

}  // namespace gemgame::client
