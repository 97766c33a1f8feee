// GemGame Net
// client_connection.cpp - ENet client transport

#include <gemgame/core/logger.hpp>
#include <gemgame/net/client_connection.hpp>
#include <gemgame/net/enet_library.hpp>
#include <gemgame/net/net_error.hpp>

#include <enet/enet.h>
#include <spdlog/fmt/fmt.h>

namespace gemgame::net {

namespace {

constexpr enet_uint32 DISCONNECT_TIMEOUT_MS = 1000;

}  // namespace

struct ClientConnection::Impl {
    EnetLibrary enet;
    ENetHost* host = nullptr;
    ENetPeer* peer = nullptr;
    bool connected = false;

    ~Impl() {
        if (peer != nullptr) {
            enet_peer_reset(peer);
        }
        if (host != nullptr) {
            enet_host_destroy(host);
        }
    }

    [[noreturn]] void fail(NetErrorKind kind, const std::string& message) {
        connected = false;
        throw NetworkError(kind, message);
    }
};

ClientConnection::ClientConnection(const std::string& host, uint16_t port, std::chrono::milliseconds timeout)
    : impl_(std::make_unique<Impl>()) {
    impl_->host = enet_host_create(nullptr, 1, CHANNEL_COUNT, 0, 0);
    if (impl_->host == nullptr) {
        throw NetworkError(NetErrorKind::ConnectionFault, "couldn't create ENet client host");
    }

    ENetAddress address;
    if (enet_address_set_host(&address, host.c_str()) != 0) {
        throw NetworkError(NetErrorKind::ConnectionFault, fmt::format("couldn't resolve {}", host));
    }
    address.port = port;

    impl_->peer = enet_host_connect(impl_->host, &address, CHANNEL_COUNT, 0);
    if (impl_->peer == nullptr) {
        throw NetworkError(NetErrorKind::ConnectionFault, "no free ENet peer for the connection");
    }

    ENetEvent event;
    if (enet_host_service(impl_->host, &event, static_cast<enet_uint32>(timeout.count())) > 0 &&
        event.type == ENET_EVENT_TYPE_CONNECT) {
        impl_->connected = true;
        GEMGAME_LOG_INFO(core::log_category::NETWORK, "Connected to {}:{}", host, port);
        return;
    }

    throw NetworkError(NetErrorKind::ConnectionFault,
                       fmt::format("couldn't connect to {}:{} within {} ms", host, port, timeout.count()));
}

ClientConnection::~ClientConnection() = default;

void ClientConnection::send(const protocol::ToServer& message) {
    if (!impl_->connected) {
        impl_->fail(NetErrorKind::ConnectionFault, "send on a closed connection");
    }

    const std::vector<uint8_t> bytes = protocol::encode(message);
    ENetPacket* packet = enet_packet_create(bytes.data(), bytes.size(), ENET_PACKET_FLAG_RELIABLE);
    if (packet == nullptr) {
        impl_->fail(NetErrorKind::ConnectionFault, "couldn't allocate packet");
    }
    if (enet_peer_send(impl_->peer, MESSAGE_CHANNEL, packet) < 0) {
        enet_packet_destroy(packet);
        impl_->fail(NetErrorKind::ConnectionFault, fmt::format("couldn't send {}", protocol::describe(message)));
    }
    enet_host_flush(impl_->host);
}

std::vector<protocol::ToClient> ClientConnection::receive() {
    if (!impl_->connected) {
        impl_->fail(NetErrorKind::ConnectionFault, "receive on a closed connection");
    }

    std::vector<protocol::ToClient> messages;
    ENetEvent event;
    int result = enet_host_service(impl_->host, &event, 0);
    while (result > 0) {
        switch (event.type) {
            case ENET_EVENT_TYPE_RECEIVE: {
                auto message = protocol::decode_to_client(
                    std::span<const uint8_t>(event.packet->data, event.packet->dataLength));
                const size_t length = event.packet->dataLength;
                enet_packet_destroy(event.packet);
                if (!message) {
                    impl_->fail(NetErrorKind::MalformedPayload, fmt::format("undecodable {}-byte packet", length));
                }
                messages.push_back(std::move(*message));
                break;
            }
            case ENET_EVENT_TYPE_DISCONNECT:
                impl_->peer = nullptr;
                impl_->fail(NetErrorKind::PeerClosed, "server closed the connection");
                break;
            case ENET_EVENT_TYPE_CONNECT:
            case ENET_EVENT_TYPE_NONE:
                break;
        }
        result = enet_host_check_events(impl_->host, &event);
    }

    if (result < 0) {
        impl_->fail(NetErrorKind::ConnectionFault, "ENet host service failed");
    }
    return messages;
}

void ClientConnection::disconnect() {
    if (!impl_->connected || impl_->peer == nullptr) {
        return;
    }
    impl_->connected = false;
    enet_peer_disconnect(impl_->peer, 0);

    ENetEvent event;
    while (enet_host_service(impl_->host, &event, DISCONNECT_TIMEOUT_MS) > 0) {
        if (event.type == ENET_EVENT_TYPE_RECEIVE) {
            enet_packet_destroy(event.packet);
        } else if (event.type == ENET_EVENT_TYPE_DISCONNECT) {
            impl_->peer = nullptr;
            GEMGAME_LOG_INFO(core::log_category::NETWORK, "Disconnected");
            return;
        }
    }
    // No acknowledgement, drop it hard in the destructor
}

}  // namespace gemgame::net
