// GemGame Client
// transition.cpp - Tile-to-tile interpolation

#include <gemgame/client/transition.hpp>

#include <algorithm>

namespace gemgame::client {

Transition::Transition(const world::TileCoords& from, const world::TileCoords& to, float duration)
    : from_(from), to_(to), duration_(std::max(duration, 0.0f)) {}

void Transition::update(float delta) {
    elapsed_ = std::min(elapsed_ + std::max(delta, 0.0f), duration_);
}

float Transition::progress() const {
    if (duration_ <= 0.0f) {
        return 1.0f;
    }
    return elapsed_ / duration_;
}

glm::vec2 Transition::current() const {
    return glm::mix(glm::vec2(from_), glm::vec2(to_), progress());
}

}  // namespace gemgame::client
