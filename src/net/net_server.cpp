// GemGame Net
// net_server.cpp - ENet host and per-peer sessions

#include <gemgame/core/logger.hpp>
#include <gemgame/net/enet_library.hpp>
#include <gemgame/net/net_error.hpp>
#include <gemgame/net/net_server.hpp>
#include <gemgame/server/client_session.hpp>
#include <gemgame/server/session_reaper.hpp>

#include <enet/enet.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace gemgame::net {

namespace {

// Milliseconds the network thread blocks waiting for events
constexpr enet_uint32 SERVICE_TIMEOUT_MS = 5;

[[nodiscard]] std::string peer_address(const ENetPeer* peer) {
    char host[64] = {};
    if (enet_address_get_host_ip(&peer->address, host, sizeof(host)) != 0) {
        return "unknown";
    }
    return fmt::format("{}:{}", host, peer->address.port);
}

[[nodiscard]] uint32_t connection_of(const ENetPeer* peer) {
    return static_cast<uint32_t>(reinterpret_cast<uintptr_t>(peer->data));
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct NetServer::Impl {
    // Hands a session's messages to the network thread
    class PeerSink : public protocol::ToClientSink {
    public:
        PeerSink(Impl& impl, uint32_t connection) : impl_(impl), connection_(connection) {}

        void send(const protocol::ToClient& message) override {
            impl_.queue_packet(connection_, protocol::encode(message));
        }

    private:
        Impl& impl_;
        uint32_t connection_;
    };

    struct Connection {
        ENetPeer* peer = nullptr;
        std::unique_ptr<PeerSink> sink;
        std::unique_ptr<server::ClientSession> session;
        bool closing = false;
    };

    struct Outgoing {
        uint32_t connection = 0;
        std::vector<uint8_t> bytes;
    };

    server::WorldState& world;
    server::BroadcastChannel& channel;
    NetServerConfig config;

    EnetLibrary enet;
    ENetHost* host = nullptr;

    std::thread thread;
    std::atomic<bool> running{false};
    std::atomic<size_t> connection_count{0};

    // Network thread only
    std::unordered_map<uint32_t, Connection> connections;
    uint32_t next_connection = 1;

    std::mutex outbox_mutex;
    std::vector<Outgoing> outbox;
    std::vector<uint32_t> rejected;

    // Declared last so finished sessions are gone before the queues above
    server::SessionReaper reaper;

    Impl(server::WorldState& w, server::BroadcastChannel& c, const NetServerConfig& cfg)
        : world(w), channel(c), config(cfg) {
        ENetAddress address;
        address.host = ENET_HOST_ANY;
        address.port = config.port;
        host = enet_host_create(&address, config.max_clients, CHANNEL_COUNT, 0, 0);
        if (host == nullptr) {
            throw NetworkError(NetErrorKind::ConnectionFault,
                               fmt::format("couldn't create ENet host on port {}", config.port));
        }
        GEMGAME_LOG_INFO(core::log_category::NETWORK, "Listening on port {} ({} clients max)", config.port,
                         config.max_clients);
    }

    ~Impl() {
        if (host != nullptr) {
            enet_host_destroy(host);
        }
    }

    void queue_packet(uint32_t connection, std::vector<uint8_t> bytes) {
        std::lock_guard lock(outbox_mutex);
        outbox.push_back({connection, std::move(bytes)});
    }

    void queue_rejection(uint32_t connection) {
        std::lock_guard lock(outbox_mutex);
        rejected.push_back(connection);
    }

    void run() {
        GEMGAME_LOG_INFO(core::log_category::NETWORK, "Network thread started");
        while (running.load()) {
            ENetEvent event;
            int result = enet_host_service(host, &event, SERVICE_TIMEOUT_MS);
            while (result > 0) {
                handle_event(event);
                result = enet_host_check_events(host, &event);
            }
            if (result < 0) {
                GEMGAME_LOG_ERROR(core::log_category::NETWORK, "ENet host service failed");
            }
            flush_outbox();
        }
        GEMGAME_LOG_INFO(core::log_category::NETWORK, "Network thread stopped");
    }

    void handle_event(ENetEvent& event) {
        switch (event.type) {
            case ENET_EVENT_TYPE_CONNECT:
                handle_connect(event.peer);
                break;
            case ENET_EVENT_TYPE_RECEIVE:
                handle_receive(event.peer, event.packet);
                enet_packet_destroy(event.packet);
                break;
            case ENET_EVENT_TYPE_DISCONNECT:
                handle_disconnect(event.peer);
                break;
            case ENET_EVENT_TYPE_NONE:
                break;
        }
    }

    void handle_connect(ENetPeer* peer) {
        const uint32_t id = next_connection++;
        peer->data = reinterpret_cast<void*>(static_cast<uintptr_t>(id));

        Connection connection;
        connection.peer = peer;
        connection.sink = std::make_unique<PeerSink>(*this, id);
        connection.session = std::make_unique<server::ClientSession>(
            world, channel, *connection.sink, config.session, [this, id]() { queue_rejection(id); });
        connection.session->start();

        connections.emplace(id, std::move(connection));
        connection_count.store(connections.size());
        GEMGAME_LOG_INFO(core::log_category::NETWORK, "Peer {} connected from {}", id, peer_address(peer));
    }

    void handle_receive(ENetPeer* peer, const ENetPacket* packet) {
        auto it = connections.find(connection_of(peer));
        if (it == connections.end() || it->second.closing) {
            return;
        }

        auto message = protocol::decode_to_server(std::span<const uint8_t>(packet->data, packet->dataLength));
        if (!message) {
            GEMGAME_LOG_WARN(core::log_category::NETWORK, "Peer {}: {}, disconnecting", it->first,
                             net_error_kind_to_string(NetErrorKind::MalformedPayload));
            begin_close(it->second);
            return;
        }
        it->second.session->enqueue(std::move(*message));
    }

    void handle_disconnect(ENetPeer* peer) {
        const uint32_t id = connection_of(peer);
        auto it = connections.find(id);
        if (it == connections.end()) {
            return;
        }
        GEMGAME_LOG_INFO(core::log_category::NETWORK, "Peer {} disconnected", id);
        // Leaving the world saves the player, which stays off this thread
        reaper.retire(std::move(it->second.session), std::move(it->second.sink));
        connections.erase(it);
        connection_count.store(connections.size());
        peer->data = nullptr;
    }

    void begin_close(Connection& connection) {
        if (connection.closing) {
            return;
        }
        connection.closing = true;
        // The disconnect event finishes the session
        enet_peer_disconnect_later(connection.peer, 0);
    }

    void flush_outbox() {
        std::vector<Outgoing> packets;
        std::vector<uint32_t> rejections;
        {
            std::lock_guard lock(outbox_mutex);
            packets.swap(outbox);
            rejections.swap(rejected);
        }

        for (Outgoing& outgoing : packets) {
            auto it = connections.find(outgoing.connection);
            if (it == connections.end() || it->second.closing) {
                continue;
            }
            ENetPacket* packet =
                enet_packet_create(outgoing.bytes.data(), outgoing.bytes.size(), ENET_PACKET_FLAG_RELIABLE);
            if (packet == nullptr || enet_peer_send(it->second.peer, MESSAGE_CHANNEL, packet) < 0) {
                if (packet != nullptr) {
                    enet_packet_destroy(packet);
                }
                GEMGAME_LOG_WARN(core::log_category::NETWORK, "Peer {}: {}, disconnecting", it->first,
                                 net_error_kind_to_string(NetErrorKind::ConnectionFault));
                begin_close(it->second);
            }
        }

        for (uint32_t id : rejections) {
            auto it = connections.find(id);
            if (it != connections.end()) {
                begin_close(it->second);
            }
        }

        if (!packets.empty() || !rejections.empty()) {
            enet_host_flush(host);
        }
    }

    void close_all() {
        for (auto& [id, connection] : connections) {
            reaper.retire(std::move(connection.session), std::move(connection.sink));
            enet_peer_disconnect_now(connection.peer, 0);
            connection.peer->data = nullptr;
        }
        connections.clear();
        connection_count.store(0);
        enet_host_flush(host);
        reaper.wait_until_idle();
    }
};

// ============================================================================
// NetServer
// ============================================================================

NetServer::NetServer(server::WorldState& world, server::BroadcastChannel& channel, const NetServerConfig& config)
    : impl_(std::make_unique<Impl>(world, channel, config)) {}

NetServer::~NetServer() {
    stop();
}

void NetServer::start() {
    if (impl_->running.exchange(true)) {
        return;
    }
    impl_->thread = std::thread([this]() { impl_->run(); });
}

void NetServer::stop() {
    if (!impl_) {
        return;
    }
    impl_->running.store(false);
    if (impl_->thread.joinable()) {
        impl_->thread.join();
    }
    // The network thread is gone, so the host is ours
    impl_->close_all();
}

bool NetServer::is_running() const {
    return impl_->running.load();
}

size_t NetServer::connection_count() const {
    return impl_->connection_count.load();
}

}  // namespace gemgame::net
