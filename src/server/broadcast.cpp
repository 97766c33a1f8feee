// GemGame Server
// broadcast.cpp - World change fan-out

#include <gemgame/core/logger.hpp>
#include <gemgame/server/broadcast.hpp>

#include <algorithm>

namespace gemgame::server {

// ============================================================================
// Subscription
// ============================================================================

Subscription::Subscription(size_t capacity) : capacity_(capacity) {}

void Subscription::set_wakeup(std::function<void()> wakeup) {
    std::lock_guard lock(mutex_);
    wakeup_ = std::move(wakeup);
}

void Subscription::push(const WorldChange& change) {
    std::lock_guard lock(mutex_);
    if (overflowed_) {
        return;
    }
    if (pending_.size() >= capacity_) {
        // The receiver can no longer rebuild a consistent view from this mailbox
        overflowed_ = true;
        GEMGAME_LOG_WARN(core::log_category::SERVER, "Session mailbox full after {} world changes", capacity_);
    } else {
        pending_.push_back(change);
    }
    // Under the lock so clearing the wakeup waits for a running call
    if (wakeup_) {
        wakeup_();
    }
}

std::vector<WorldChange> Subscription::drain() {
    std::lock_guard lock(mutex_);
    std::vector<WorldChange> changes(std::make_move_iterator(pending_.begin()),
                                     std::make_move_iterator(pending_.end()));
    pending_.clear();
    return changes;
}

bool Subscription::has_pending() const {
    std::lock_guard lock(mutex_);
    return !pending_.empty();
}

bool Subscription::has_overflowed() const {
    std::lock_guard lock(mutex_);
    return overflowed_;
}

// ============================================================================
// BroadcastChannel
// ============================================================================

BroadcastChannel::BroadcastChannel(size_t capacity) : capacity_(capacity) {}

std::shared_ptr<Subscription> BroadcastChannel::subscribe() {
    auto subscription = std::make_shared<Subscription>(capacity_);
    std::lock_guard lock(mutex_);
    subscribers_.push_back(subscription);
    return subscription;
}

void BroadcastChannel::publish(const WorldChange& change) {
    std::vector<std::shared_ptr<Subscription>> targets;
    {
        std::lock_guard lock(mutex_);
        std::erase_if(subscribers_, [](const std::weak_ptr<Subscription>& weak) { return weak.expired(); });
        targets.reserve(subscribers_.size());
        for (const auto& weak : subscribers_) {
            if (auto subscription = weak.lock()) {
                targets.push_back(std::move(subscription));
            }
        }
    }

    for (const auto& subscription : targets) {
        subscription->push(change);
    }
}

size_t BroadcastChannel::subscriber_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(subscribers_.begin(), subscribers_.end(),
                                             [](const std::weak_ptr<Subscription>& weak) { return !weak.expired(); }));
}

}  // namespace gemgame::server
