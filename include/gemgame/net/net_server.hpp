// GemGame Net
// net_server.hpp - ENet host feeding client sessions

#pragma once

#include <gemgame/server/broadcast.hpp>
#include <gemgame/server/session.hpp>
#include <gemgame/server/world_state.hpp>

#include <cstdint>
#include <memory>

namespace gemgame::net {

struct NetServerConfig {
    uint16_t port = 5678;
    size_t max_clients = 32;
    server::SessionConfig session;
};

/// Accepts connections and runs one ClientSession per peer. The ENet host is
/// only touched from the network thread; sessions hand it outbound packets
/// through a queue.
class NetServer {
public:
    /// Binds the port. Throws NetworkError if the host cannot be created.
    NetServer(server::WorldState& world, server::BroadcastChannel& channel, const NetServerConfig& config);
    ~NetServer();

    NetServer(const NetServer&) = delete;
    NetServer& operator=(const NetServer&) = delete;

    /// Starts the network thread
    void start();

    /// Disconnects every peer, stops their sessions and joins the thread
    void stop();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] size_t connection_count() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace gemgame::net
