// GemGame Net
// client_connection.hpp - ENet connection from a client to the server

#pragma once

#include <gemgame/client/game_client.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace gemgame::net {

/// Single-threaded: the client's frame loop owns it. Every failure throws
/// NetworkError and leaves the connection unusable.
class ClientConnection final : public client::IClientConnection {
public:
    /// Blocks until connected or the timeout passes (ConnectionFault)
    ClientConnection(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);
    ~ClientConnection() override;

    ClientConnection(const ClientConnection&) = delete;
    ClientConnection& operator=(const ClientConnection&) = delete;

    void send(const protocol::ToServer& message) override;
    [[nodiscard]] std::vector<protocol::ToClient> receive() override;

    /// Graceful disconnect, waiting briefly for the server to acknowledge
    void disconnect();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace gemgame::net
