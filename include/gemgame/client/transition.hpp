// GemGame Client
// transition.hpp - Linear interpolation between two tile positions

#pragma once

#include <gemgame/world/types.hpp>

#include <glm/glm.hpp>

namespace gemgame::client {

// Visual movement from one tile to another over a fixed duration
class Transition {
public:
    Transition() = default;
    Transition(const world::TileCoords& from, const world::TileCoords& to, float duration);

    // Advances by delta seconds, never past the end
    void update(float delta);

    // Position between the two tiles, in tile units
    [[nodiscard]] glm::vec2 current() const;
    // 0 at the start, 1 when complete
    [[nodiscard]] float progress() const;
    [[nodiscard]] bool is_complete() const { return elapsed_ >= duration_; }

    [[nodiscard]] const world::TileCoords& from() const { return from_; }
    [[nodiscard]] const world::TileCoords& to() const { return to_; }

private:
    world::TileCoords from_{0, 0};
    world::TileCoords to_{0, 0};
    float duration_ = 0.0f;
    float elapsed_ = 0.0f;
};

}  // namespace gemgame::client
