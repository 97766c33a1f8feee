// GemGame Server
// session_reaper.cpp - Background shutdown of finished sessions

#include <gemgame/core/logger.hpp>
#include <gemgame/server/session_reaper.hpp>

namespace gemgame::server {

SessionReaper::SessionReaper() : thread_([this]() { worker_thread(); }) {}

SessionReaper::~SessionReaper() {
    {
        std::lock_guard lock(mutex_);
        should_stop_ = true;
    }
    wake_.notify_one();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void SessionReaper::retire(std::unique_ptr<ClientSession> session, std::unique_ptr<protocol::ToClientSink> sink) {
    if (!session) {
        return;
    }
    {
        std::lock_guard lock(mutex_);
        queue_.push_back({std::move(session), std::move(sink)});
    }
    wake_.notify_one();
}

void SessionReaper::wait_until_idle() {
    std::unique_lock lock(mutex_);
    idle_.wait(lock, [this]() { return queue_.empty() && in_progress_ == 0; });
}

size_t SessionReaper::pending_count() const {
    std::lock_guard lock(mutex_);
    return queue_.size() + in_progress_;
}

void SessionReaper::worker_thread() {
    while (true) {
        Retired retired;
        {
            std::unique_lock lock(mutex_);
            wake_.wait(lock, [this]() { return should_stop_ || !queue_.empty(); });

            // The queue is drained before the thread exits
            if (queue_.empty()) {
                break;
            }
            retired = std::move(queue_.front());
            queue_.pop_front();
            ++in_progress_;
        }

        retired.session->stop();
        retired.session.reset();
        retired.sink.reset();
        GEMGAME_LOG_DEBUG(core::log_category::SERVER, "Session retired");

        {
            std::lock_guard lock(mutex_);
            --in_progress_;
        }
        idle_.notify_all();
    }
}

}  // namespace gemgame::server
