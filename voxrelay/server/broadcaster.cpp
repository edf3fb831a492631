#include "broadcaster.hpp"

#include <voxrelay/protocol/serialization.hpp>

#include <exception>
#include <string>

namespace voxrelay::server {

Broadcaster::Broadcaster(IServerServices& services,
                         const SessionRegistry& sessions,
                         const ConnectionTable& connections)
    : services_(services)
    , sessions_(sessions)
    , connections_(connections) {
}

std::size_t Broadcaster::broadcast(const std::string& world,
                                   const proto::ServerMessage& msg,
                                   const std::optional<PlayerId>& exclude) {
    // Encode once for every recipient
    const auto bytes = proto::serialize(msg);
    const auto kind = proto::type_name(msg);
    std::size_t delivered = 0;

    for (const auto& playerId : sessions_.world_members(world)) {
        if (exclude && playerId == *exclude) continue;

        const Player* player = sessions_.find(playerId);
        if (!player || !player->connected) continue;
        if (!services_.is_open(player->connection)) continue;

        if (deliver(player->connection, bytes, kind)) {
            ++delivered;
        }
    }

    // Observers see everything, whatever the world
    for (ConnectionId adminId : connections_.admins()) {
        if (!services_.is_open(adminId)) continue;

        if (deliver(adminId, bytes, kind)) {
            ++delivered;
        }
    }

    return delivered;
}

bool Broadcaster::send_to(ConnectionId id, const proto::ServerMessage& msg) {
    const auto bytes = proto::serialize(msg);
    return deliver(id, bytes, proto::type_name(msg));
}

bool Broadcaster::deliver(ConnectionId id, std::span<const std::uint8_t> bytes, std::string_view kind) {
    try {
        if (services_.send(id, bytes)) {
            return true;
        }
        services_.log_warning("Delivery of " + std::string(kind) + " to connection " +
                              std::to_string(id) + " failed");
    } catch (const std::exception& e) {
        services_.log_warning("Delivery of " + std::string(kind) + " to connection " +
                              std::to_string(id) + " failed: " + e.what());
    }
    return false;
}

} // namespace voxrelay::server
