#include "enet_server.hpp"

#include <enet/enet.h>
#include <cstdio>

namespace voxrelay::transport {

// ============================================================================
// ENetInitializer
// ============================================================================

ENetInitializer::ENetInitializer() {
    initialized_ = (enet_initialize() == 0);
    if (!initialized_) {
        std::fprintf(stderr, "[enet_server] enet_initialize failed, transport unusable\n");
    }
}

ENetInitializer::~ENetInitializer() {
    if (initialized_) {
        enet_deinitialize();
    }
}

// ============================================================================
// ENetServerTransport
// ============================================================================

ENetServerTransport::ENetServerTransport() = default;

ENetServerTransport::~ENetServerTransport() {
    stop();
}

bool ENetServerTransport::start(std::uint16_t port, std::size_t maxClients) {
    if (running_) {
        return false;
    }
    if (!enet_.is_initialized()) {
        std::fprintf(stderr, "[enet_server] refusing to start on port %u: ENet not initialized\n", port);
        return false;
    }

    ENetAddress address;
    address.host = ENET_HOST_ANY;
    address.port = port;

    std::fprintf(stderr, "[enet_server] starting on port %u, maxClients=%zu\n",
                 port, maxClients);

    host_ = enet_host_create(
        &address,
        maxClients,
        config::kChannelCount,
        0,  // Unlimited incoming bandwidth
        0   // Unlimited outgoing bandwidth
    );

    if (!host_) {
        std::fprintf(stderr, "[enet_server] enet_host_create FAILED\n");
        return false;
    }

    running_ = true;
    std::fprintf(stderr, "[enet_server] started successfully\n");
    return true;
}

void ENetServerTransport::stop() {
    if (!running_) {
        return;
    }

    running_ = false;

    // Anything still connected gets a graceful disconnect after its queue drains
    for (auto& [id, peer] : clients_) {
        enet_peer_disconnect_later(peer, 0);
    }

    if (host_) {
        for (int i = 0; i < config::kFlushIterations; ++i) {
            ENetEvent event;
            while (enet_host_service(host_, &event, config::kFlushWaitMs) > 0) {
                if (event.type == ENET_EVENT_TYPE_RECEIVE) {
                    enet_packet_destroy(event.packet);
                }
            }
        }
        enet_host_destroy(host_);
        host_ = nullptr;
    }

    clients_.clear();
    peerToClient_.clear();

    std::fprintf(stderr, "[enet_server] stopped\n");
}

bool ENetServerTransport::send(ConnectionId id, std::span<const std::uint8_t> data) {
    auto it = clients_.find(id);
    if (it == clients_.end()) return false;

    ENetPacket* packet = enet_packet_create(
        data.data(),
        data.size(),
        ENET_PACKET_FLAG_RELIABLE
    );
    if (!packet) return false;

    if (enet_peer_send(it->second, static_cast<std::uint8_t>(Channel::Reliable), packet) < 0) {
        // ENet only takes ownership on success
        enet_packet_destroy(packet);
        return false;
    }
    return true;
}

void ENetServerTransport::poll(std::uint32_t timeoutMs) {
    if (!host_) return;

    ENetEvent event;
    while (enet_host_service(host_, &event, timeoutMs) > 0) {
        switch (event.type) {
            case ENET_EVENT_TYPE_CONNECT: {
                ConnectionId id = next_connection_id();
                clients_[id] = event.peer;
                peerToClient_[event.peer] = id;

                std::fprintf(stderr, "[enet_server] connection %u opened from %x:%u\n",
                             id, event.peer->address.host, event.peer->address.port);

                if (onConnect) {
                    onConnect(id);
                }
                break;
            }

            case ENET_EVENT_TYPE_DISCONNECT: {
                ConnectionId id = find_connection_id(event.peer);
                if (id != kInvalidConnectionId) {
                    std::fprintf(stderr, "[enet_server] connection %u closed\n", id);

                    clients_.erase(id);
                    peerToClient_.erase(event.peer);

                    if (onDisconnect) {
                        onDisconnect(id);
                    }
                }
                break;
            }

            case ENET_EVENT_TYPE_RECEIVE: {
                ConnectionId id = find_connection_id(event.peer);
                if (id != kInvalidConnectionId && onReceive) {
                    onReceive(id, std::span<const std::uint8_t>(
                        event.packet->data,
                        event.packet->dataLength
                    ));
                }
                enet_packet_destroy(event.packet);
                break;
            }

            default:
                break;
        }

        // Only wait on first iteration
        timeoutMs = 0;
    }
}

void ENetServerTransport::disconnect(ConnectionId id) {
    auto it = clients_.find(id);
    if (it == clients_.end()) return;

    ENetPeer* peer = it->second;
    enet_peer_disconnect_later(peer, 0);

    peerToClient_.erase(peer);
    clients_.erase(it);

    if (onDisconnect) {
        onDisconnect(id);
    }
}

bool ENetServerTransport::is_open(ConnectionId id) const {
    auto it = clients_.find(id);
    if (it == clients_.end()) return false;
    return it->second->state == ENET_PEER_STATE_CONNECTED;
}

ConnectionId ENetServerTransport::next_connection_id() {
    return nextConnectionId_++;
}

ConnectionId ENetServerTransport::find_connection_id(ENetPeer* peer) const {
    auto it = peerToClient_.find(peer);
    return (it != peerToClient_.end()) ? it->second : kInvalidConnectionId;
}

} // namespace voxrelay::transport
