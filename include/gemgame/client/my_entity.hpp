// GemGame Client
// my_entity.hpp - The player's own entity with movement prediction

#pragma once

#include "client_map.hpp"
#include "transition.hpp"

#include <gemgame/protocol/messages.hpp>
#include <gemgame/world/entity.hpp>

#include <cstdint>
#include <optional>
#include <variant>

namespace gemgame::client {

// ============================================================================
// Movement State
// ============================================================================

struct Idle {
    bool operator==(const Idle&) const = default;
};

// Moving towards a tile the server has not confirmed
struct Predicted {
    uint32_t sequence = 0;
    world::TileCoords from{0, 0};
    world::TileCoords target{0, 0};
    bool operator==(const Predicted&) const = default;
};

// Moving back to where the server says the entity is
struct Correcting {
    uint32_t sequence = 0;
    world::TileCoords from{0, 0};
    world::TileCoords target{0, 0};
    bool operator==(const Correcting&) const = default;
};

using MovementState = std::variant<Idle, Predicted, Correcting>;

// ============================================================================
// MyEntity
// ============================================================================

/// Moves immediately on input and lets the server correct it. Every move
/// sent carries a sequence number one higher than the last.
class MyEntity {
public:
    // Corrections play faster than regular moves
    static constexpr float CORRECTION_SPEEDUP = 2.0f;

    MyEntity(world::EntityId id, const world::Entity& entity, float move_duration = 0.2f);

    /// Attempts one step in the direction. Faces the direction and, when the
    /// local map shows the destination free, moves there and tells the
    /// server. Ignored while a transition is playing. Returns whether a move
    /// was sent.
    bool move_towards_checked(world::Direction direction, ClientMap& map, protocol::ToServerSink& sink);

    /// Applies the server's position for a move. Corrections older than one
    /// already applied are ignored.
    void received_movement_reconciliation(uint32_t sequence, const world::TileCoords& position);

    void update(float delta);

    [[nodiscard]] world::EntityId id() const { return id_; }
    [[nodiscard]] const world::Entity& entity() const { return entity_; }
    [[nodiscard]] world::Entity& entity() { return entity_; }

    [[nodiscard]] const MovementState& state() const { return state_; }
    [[nodiscard]] bool is_moving() const { return !transition_.is_complete(); }
    // Sequence number of the most recent move sent, 0 before the first
    [[nodiscard]] uint32_t last_sequence() const { return last_sequence_; }

    // Interpolated position for drawing
    [[nodiscard]] glm::vec2 display_position() const { return transition_.current(); }

private:
    world::EntityId id_;
    world::Entity entity_;
    float move_duration_;

    MovementState state_ = Idle{};
    Transition transition_;
    uint32_t last_sequence_ = 0;
    std::optional<uint32_t> last_correction_;
};

}  // namespace gemgame::client
