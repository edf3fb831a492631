#include "connection_lifecycle.hpp"

#include <string>
#include <utility>
#include <vector>

namespace voxrelay::server {

ConnectionLifecycle::ConnectionLifecycle(IServerServices& services,
                                         SessionRegistry& sessions,
                                         ConnectionTable& connections,
                                         Broadcaster& broadcaster,
                                         Options opts)
    : services_(services)
    , sessions_(sessions)
    , connections_(connections)
    , broadcaster_(broadcaster)
    , reapTask_("reap", opts.reapIntervalSeconds, [this]() { reap_sweep(); })
    , statsTask_("stats", opts.statsIntervalSeconds, [this]() { log_stats(); }) {
}

// ============================================================================
// Transport events
// ============================================================================

void ConnectionLifecycle::on_connect(ConnectionId id) {
    if (!accepting_) {
        services_.log_info("Connection " + std::to_string(id) + " refused: not accepting");
        services_.disconnect(id);
        return;
    }

    connections_.add(id);
    services_.log_debug("Connection " + std::to_string(id) + " opened");
}

void ConnectionLifecycle::on_close(ConnectionId id) {
    Connection* conn = connections_.find(id);
    if (!conn) return;

    std::optional<PlayerId> playerId = std::move(conn->playerId);
    connections_.remove(id);

    if (playerId) {
        close_player(*playerId, !shuttingDown_);
    }
    services_.log_debug("Connection " + std::to_string(id) + " closed");
}

// ============================================================================
// Periodic work
// ============================================================================

void ConnectionLifecycle::tick(float dt) {
    reapTask_.advance(dt);
    statsTask_.advance(dt);
}

std::size_t ConnectionLifecycle::reap_sweep() {
    // Collect first: closing re-enters on_close through the transport callback
    std::vector<std::pair<PlayerId, ConnectionId>> stale;
    for (const auto& [id, player] : sessions_.players()) {
        if (!services_.is_open(player.connection)) {
            stale.emplace_back(id, player.connection);
        }
    }

    std::size_t reaped = 0;
    for (const auto& [playerId, connId] : stale) {
        if (close_player(playerId)) {
            ++reaped;
        }
        services_.disconnect(connId);
        on_close(connId);
    }

    // Dead admin or anonymous links hold no player but still occupy a slot
    for (ConnectionId id : connections_.ids()) {
        if (!services_.is_open(id)) {
            services_.disconnect(id);
            on_close(id);
        }
    }

    if (reaped > 0) {
        services_.log_info("Reaped " + std::to_string(reaped) + " stale player(s)");
    }
    return reaped;
}

void ConnectionLifecycle::log_stats() {
    if (sessions_.size() == 0) return;
    services_.log_info("Players online: " + std::to_string(sessions_.size()));
}

bool ConnectionLifecycle::close_player(const PlayerId& id, bool announce) {
    auto removed = sessions_.unregister(id);
    if (!removed) return false;

    if (Connection* conn = connections_.find(removed->connection)) {
        conn->playerId.reset();
    }

    if (announce) {
        proto::PlayerLeave leave;
        leave.playerId = removed->id;
        leave.username = removed->username;
        broadcaster_.broadcast(removed->world, leave);
    }

    services_.log_info("Player " + removed->username + " (" + removed->id + ") left");
    return true;
}

// ============================================================================
// Shutdown / control
// ============================================================================

void ConnectionLifecycle::shutdown(std::string_view message) {
    accepting_ = false;
    shuttingDown_ = true;

    const auto ids = connections_.ids();

    proto::ServerShutdown notice;
    notice.message = std::string(message);

    std::size_t notified = 0;
    for (ConnectionId id : ids) {
        if (services_.is_open(id) && broadcaster_.send_to(id, notice)) {
            ++notified;
        }
    }

    for (ConnectionId id : ids) {
        services_.disconnect(id);
        on_close(id);
    }

    sessions_.clear();
    connections_.clear();
    shuttingDown_ = false;

    services_.log_info("Shutdown notice sent to " + std::to_string(notified) + " connection(s)");
}

void ConnectionLifecycle::cancel_tasks() {
    reapTask_.cancel();
    statsTask_.cancel();
}

} // namespace voxrelay::server
