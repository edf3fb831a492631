#pragma once

// =============================================================================
// Server transport interface
// Raw byte channel per connection; the relay core never sees sockets.
// =============================================================================

#include <voxrelay/core/types.hpp>

#include <cstdint>
#include <functional>
#include <span>

namespace voxrelay::transport {

/// Callback for received data from a specific connection.
using OnReceiveCallback = std::function<void(ConnectionId id, std::span<const std::uint8_t> data)>;

/// Callbacks for connection events.
using OnConnectCallback = std::function<void(ConnectionId id)>;
using OnDisconnectCallback = std::function<void(ConnectionId id)>;

class IServerTransport {
public:
    virtual ~IServerTransport() = default;

    /// Send raw data to a specific connection.
    /// @return false if the connection is unknown, closed, or the packet could not be queued.
    virtual bool send(ConnectionId id, std::span<const std::uint8_t> data) = 0;

    /// Poll for network events. Must be called every tick.
    /// @param timeoutMs 0 for non-blocking.
    virtual void poll(std::uint32_t timeoutMs = 0) = 0;

    /// Close a specific connection. Queued outbound data is flushed first.
    /// Fires onDisconnect once; a second call is a no-op.
    virtual void disconnect(ConnectionId id) = 0;

    /// Whether the connection is known and its link is still up.
    virtual bool is_open(ConnectionId id) const = 0;

    // Callbacks
    OnReceiveCallback onReceive;
    OnConnectCallback onConnect;
    OnDisconnectCallback onDisconnect;
};

} // namespace voxrelay::transport
