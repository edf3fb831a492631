#pragma once

#include <voxrelay/core/types.hpp>

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace voxrelay::server {

// ============================================================================
// Connection - Core-side state of one accepted transport connection
// ============================================================================

/// The transport owns the link; this only records what the relay knows about it.
struct Connection {
    ConnectionId id{kInvalidConnectionId};
    bool admin{false};

    // Bound at login, cleared when the player is closed or reaped
    std::optional<PlayerId> playerId;

    bool authenticated() const { return playerId.has_value(); }
};

// ============================================================================
// ConnectionTable
// ============================================================================

class ConnectionTable {
public:
    /// Track a new anonymous connection (existing state is reset).
    Connection& add(ConnectionId id);

    Connection* find(ConnectionId id);
    const Connection* find(ConnectionId id) const;

    /// @return false if the connection was not tracked.
    bool remove(ConnectionId id);

    /// All tracked connection ids, ascending.
    std::vector<ConnectionId> ids() const;

    /// Connections flagged admin, ascending.
    std::vector<ConnectionId> admins() const;

    std::size_t size() const { return connections_.size(); }
    void clear() { connections_.clear(); }

private:
    std::unordered_map<ConnectionId, Connection> connections_;
};

} // namespace voxrelay::server
