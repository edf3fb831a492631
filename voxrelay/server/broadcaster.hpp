#pragma once

#include "connection_table.hpp"
#include "session_registry.hpp"

#include <voxrelay/core/server_interface.hpp>
#include <voxrelay/protocol/messages.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace voxrelay::server {

// ============================================================================
// Broadcaster - Fan-out of one message to a world and to admin connections
// ============================================================================

class Broadcaster {
public:
    Broadcaster(IServerServices& services,
                const SessionRegistry& sessions,
                const ConnectionTable& connections);

    /// Deliver @p msg to every connected member of @p world whose connection
    /// is open (skipping @p exclude), then to every open admin connection.
    /// A failed delivery is logged and does not stop the fan-out.
    /// @return Number of successful deliveries.
    std::size_t broadcast(const std::string& world,
                          const proto::ServerMessage& msg,
                          const std::optional<PlayerId>& exclude = std::nullopt);

    /// Unicast reply to a single connection.
    bool send_to(ConnectionId id, const proto::ServerMessage& msg);

private:
    bool deliver(ConnectionId id, std::span<const std::uint8_t> bytes, std::string_view kind);

    IServerServices& services_;
    const SessionRegistry& sessions_;
    const ConnectionTable& connections_;
};

} // namespace voxrelay::server
