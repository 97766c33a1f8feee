// GemGame Server
// broadcast.hpp - Fan-out of world changes to every connected session

#pragma once

#include <gemgame/world/entity.hpp>
#include <gemgame/world/id.hpp>
#include <gemgame/world/tile.hpp>
#include <gemgame/world/types.hpp>

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <variant>
#include <vector>

namespace gemgame::server {

// ============================================================================
// World Changes
// ============================================================================

struct EntityMoved {
    world::EntityId id;
    world::TileCoords position{0, 0};
    world::Direction direction = world::DEFAULT_DIRECTION;
};

struct EntityAdded {
    world::EntityId id;
    world::Entity entity;
};

struct EntityRemoved {
    world::EntityId id;
    world::TileCoords last_position{0, 0};
};

struct TileChanged {
    world::TileCoords coords{0, 0};
    world::Tile tile;
};

using WorldChange = std::variant<EntityMoved, EntityAdded, EntityRemoved, TileChanged>;

// ============================================================================
// Subscription
// ============================================================================

// One session's mailbox. Events arrive in publish order. A full mailbox
// stops accepting events and reports itself overflowed, so its owner never
// works from a view with holes in it.
class Subscription {
public:
    explicit Subscription(size_t capacity);

    // Called after every push, from the publishing thread, with the
    // subscription locked. It must not call back into the subscription.
    void set_wakeup(std::function<void()> wakeup);

    [[nodiscard]] std::vector<WorldChange> drain();
    [[nodiscard]] bool has_pending() const;
    // Set once an event arrived while the mailbox was full
    [[nodiscard]] bool has_overflowed() const;

private:
    friend class BroadcastChannel;
    void push(const WorldChange& change);

    mutable std::mutex mutex_;
    std::deque<WorldChange> pending_;
    std::function<void()> wakeup_;
    size_t capacity_;
    bool overflowed_ = false;
};

// ============================================================================
// BroadcastChannel
// ============================================================================

class BroadcastChannel {
public:
    static constexpr size_t DEFAULT_CAPACITY = 4096;

    explicit BroadcastChannel(size_t capacity = DEFAULT_CAPACITY);

    // The subscription stays registered while the caller holds it
    [[nodiscard]] std::shared_ptr<Subscription> subscribe();

    void publish(const WorldChange& change);

    [[nodiscard]] size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<Subscription>> subscribers_;
    size_t capacity_;
};

}  // namespace gemgame::server
