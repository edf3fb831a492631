#pragma once

#include "transport.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <queue>
#include <unordered_map>
#include <vector>

namespace voxrelay::transport {

// ============================================================================
// LocalTransport - In-process transport
// ============================================================================

/// Any number of in-process clients linked to one server transport.
/// No network overhead; used by tests and by embedders that drive the relay
/// from the same process.

class LocalServerTransport;

// ============================================================================
// LocalClientTransport
// ============================================================================

class LocalClientTransport {
    friend class LocalServerTransport;

public:
    /// Send raw data to the server. Dropped if the link is down.
    void send(std::span<const std::uint8_t> data);

    /// Pop the next payload delivered by the server.
    bool try_recv(std::vector<std::uint8_t>& out);

    /// Number of payloads waiting in the inbox.
    std::size_t pending() const;

    /// Graceful close: the server sees a disconnect event on its next poll.
    void close();

    /// Link failure without a close event. The server only notices through is_open().
    void drop();

    bool is_connected() const { return open_.load(); }

    ConnectionId id() const { return id_; }

private:
    LocalClientTransport(ConnectionId id, std::weak_ptr<LocalServerTransport> server)
        : id_(id), server_(std::move(server)) {}

    void receive(std::vector<std::uint8_t> data);

    ConnectionId id_{kInvalidConnectionId};
    std::weak_ptr<LocalServerTransport> server_;

    mutable std::mutex mutex_;
    std::queue<std::vector<std::uint8_t>> incoming_;
    std::atomic<bool> open_{true};
};

// ============================================================================
// LocalServerTransport
// ============================================================================

class LocalServerTransport : public IServerTransport,
                             public std::enable_shared_from_this<LocalServerTransport> {
    friend class LocalClientTransport;

public:
    static std::shared_ptr<LocalServerTransport> create();

    /// Open a new client link. The server sees the connect on its next poll.
    std::shared_ptr<LocalClientTransport> connect_client();

    bool send(ConnectionId id, std::span<const std::uint8_t> data) override;
    void poll(std::uint32_t timeoutMs = 0) override;
    void disconnect(ConnectionId id) override;
    bool is_open(ConnectionId id) const override;

private:
    LocalServerTransport() = default;

    enum class EventType : std::uint8_t {
        Connect,
        Receive,
        Disconnect,
    };

    struct Event {
        EventType type{EventType::Receive};
        ConnectionId id{kInvalidConnectionId};
        std::vector<std::uint8_t> data;
    };

    void push_event(Event event);
    std::shared_ptr<LocalClientTransport> find_client(ConnectionId id) const;

    mutable std::mutex mutex_;
    std::queue<Event> events_;
    std::unordered_map<ConnectionId, std::shared_ptr<LocalClientTransport>> clients_;
    ConnectionId nextConnectionId_{1};
};

} // namespace voxrelay::transport
