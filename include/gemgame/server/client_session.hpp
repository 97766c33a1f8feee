// GemGame Server
// client_session.hpp - Thread driving one SessionHandler

#pragma once

#include "broadcast.hpp"
#include "session.hpp"
#include "world_state.hpp"

#include <gemgame/protocol/messages.hpp>

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace gemgame::server {

/// Runs a session on its own thread. The thread sleeps on one condition
/// variable woken by inbound messages and by world changes, so neither
/// direction waits on the other.
class ClientSession {
public:
    // Invoked from the session thread when the client must be dropped
    using RejectCallback = std::function<void()>;

    ClientSession(WorldState& world, BroadcastChannel& channel, protocol::ToClientSink& outbound,
                  const SessionConfig& config, RejectCallback on_reject);
    ~ClientSession();

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    void start();

    /// Queues a message from the client. Thread-safe.
    void enqueue(protocol::ToServer message);

    /// Stops the thread, then saves and removes the player
    void stop();

    [[nodiscard]] bool is_running() const;

private:
    void run();
    // False once the mailbox has overflowed
    bool drain_world_changes();
    void reject();

    SessionHandler handler_;
    std::shared_ptr<Subscription> subscription_;
    RejectCallback on_reject_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<protocol::ToServer> inbound_;
    bool world_changed_ = false;
    bool stopping_ = false;
    bool rejected_ = false;

    std::thread thread_;
};

}  // namespace gemgame::server
