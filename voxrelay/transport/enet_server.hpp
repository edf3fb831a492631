#pragma once

#include "transport.hpp"
#include "enet_common.hpp"

#include <cstdint>
#include <unordered_map>

namespace voxrelay::transport {

// ============================================================================
// ENetServerTransport - Server-side ENet transport
// ============================================================================

class ENetServerTransport : public IServerTransport {
public:
    ENetServerTransport();
    ~ENetServerTransport() override;

    ENetServerTransport(const ENetServerTransport&) = delete;
    ENetServerTransport& operator=(const ENetServerTransport&) = delete;

    // --- Server control ---

    /// Start listening on the specified port.
    /// @param port Port to listen on.
    /// @param maxClients Maximum number of concurrent connections.
    /// @return true if the host was created.
    bool start(std::uint16_t port = config::kDefaultPort,
               std::size_t maxClients = config::kDefaultMaxClients);

    /// Flush pending packets, disconnect everyone and destroy the host.
    void stop();

    bool is_running() const { return running_; }

    std::size_t connection_count() const { return clients_.size(); }

    // --- IServerTransport implementation ---

    bool send(ConnectionId id, std::span<const std::uint8_t> data) override;
    void poll(std::uint32_t timeoutMs = 0) override;
    void disconnect(ConnectionId id) override;
    bool is_open(ConnectionId id) const override;

private:
    ConnectionId next_connection_id();
    ConnectionId find_connection_id(ENetPeer* peer) const;

    ENetInitializer enet_;
    ENetHost* host_{nullptr};
    bool running_{false};

    ConnectionId nextConnectionId_{1};
    std::unordered_map<ConnectionId, ENetPeer*> clients_;
    std::unordered_map<ENetPeer*, ConnectionId> peerToClient_;
};

} // namespace voxrelay::transport
