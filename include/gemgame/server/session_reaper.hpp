// GemGame Server
// session_reaper.hpp - Background shutdown of finished sessions

#pragma once

#include "client_session.hpp"

#include <gemgame/protocol/messages.hpp>

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace gemgame::server {

/// Stops and destroys sessions on its own thread. Stopping a session saves
/// its player, so the thread that retires it never waits on the disk.
class SessionReaper {
public:
    SessionReaper();
    /// Finishes every retired session before returning
    ~SessionReaper();

    SessionReaper(const SessionReaper&) = delete;
    SessionReaper& operator=(const SessionReaper&) = delete;

    /// Takes ownership of a session and the sink it writes to. The sink is
    /// destroyed after the session. Thread-safe and never blocks on I/O.
    void retire(std::unique_ptr<ClientSession> session, std::unique_ptr<protocol::ToClientSink> sink = nullptr);

    /// Blocks until every session retired so far is destroyed
    void wait_until_idle();

    /// Sessions retired but not yet destroyed
    [[nodiscard]] size_t pending_count() const;

private:
    struct Retired {
        std::unique_ptr<ClientSession> session;
        std::unique_ptr<protocol::ToClientSink> sink;
    };

    void worker_thread();

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    std::deque<Retired> queue_;
    size_t in_progress_ = 0;
    bool should_stop_ = false;

    std::thread thread_;
};

}  // namespace gemgame::server
