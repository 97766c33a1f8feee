// GemGame Server
// client_session.cpp - Session thread

#include <gemgame/core/logger.hpp>
#include <gemgame/server/client_session.hpp>

namespace gemgame::server {

ClientSession::ClientSession(WorldState& world, BroadcastChannel& channel, protocol::ToClientSink& outbound,
                             const SessionConfig& config, RejectCallback on_reject)
    : handler_(world, outbound, config), subscription_(channel.subscribe()), on_reject_(std::move(on_reject)) {
    subscription_->set_wakeup([this]() {
        {
            std::lock_guard lock(mutex_);
            world_changed_ = true;
        }
        wake_.notify_one();
    });
}

ClientSession::~ClientSession() {
    stop();
    // No wakeup may run into a destroyed session
    subscription_->set_wakeup(nullptr);
}

void ClientSession::start() {
    std::lock_guard lock(mutex_);
    if (thread_.joinable() || stopping_) {
        return;
    }
    thread_ = std::thread(&ClientSession::run, this);
}

void ClientSession::enqueue(protocol::ToServer message) {
    {
        std::lock_guard lock(mutex_);
        if (rejected_ || stopping_) {
            return;
        }
        inbound_.push_back(std::move(message));
    }
    wake_.notify_one();
}

void ClientSession::stop() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_one();

    if (thread_.joinable()) {
        thread_.join();
    }
    handler_.close();
}

bool ClientSession::is_running() const {
    std::lock_guard lock(mutex_);
    return thread_.joinable() && !stopping_;
}

bool ClientSession::drain_world_changes() {
    if (subscription_->has_overflowed()) {
        GEMGAME_LOG_WARN(core::log_category::SERVER, "Dropping client that fell behind on world changes");
        return false;
    }
    for (const WorldChange& change : subscription_->drain()) {
        handler_.handle_world_change(change);
    }
    return true;
}

void ClientSession::reject() {
    {
        std::lock_guard lock(mutex_);
        rejected_ = true;
        inbound_.clear();
    }
    if (on_reject_) {
        on_reject_();
    }
}

void ClientSession::run() {
    while (true) {
        std::deque<protocol::ToServer> inbound;
        {
            std::unique_lock lock(mutex_);
            // A rejected session only waits for stop()
            wake_.wait(lock, [this]() { return stopping_ || (!rejected_ && (world_changed_ || !inbound_.empty())); });
            if (stopping_) {
                break;
            }
            inbound.swap(inbound_);
            world_changed_ = false;
        }

        // The world lock is taken below, never with the session lock held
        if (!drain_world_changes()) {
            reject();
            continue;
        }
        for (const protocol::ToServer& message : inbound) {
            if (!handler_.handle_message(message)) {
                GEMGAME_LOG_INFO(core::log_category::SERVER, "Dropping client after {}",
                                 protocol::describe(message));
                reject();
                break;
            }
            if (!drain_world_changes()) {
                reject();
                break;
            }
        }
    }
}

}  // namespace gemgame::server
