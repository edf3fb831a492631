#pragma once

#include "broadcaster.hpp"
#include "connection_table.hpp"
#include "periodic_task.hpp"
#include "session_registry.hpp"

#include <voxrelay/core/server_interface.hpp>

#include <cstddef>
#include <string_view>

namespace voxrelay::server {

// ============================================================================
// ConnectionLifecycle - Accept, close, reap and shutdown of connections
// ============================================================================

/// Connection states: anonymous -> authenticated (login) -> closed.
/// Closing an authenticated connection removes its player and announces
/// player_leave to the rest of the world exactly once, whether the close
/// came from the transport or from the reap sweep.
class ConnectionLifecycle {
public:
    struct Options {
        float reapIntervalSeconds{30.0f};
        float statsIntervalSeconds{60.0f};
    };

    ConnectionLifecycle(IServerServices& services,
                        SessionRegistry& sessions,
                        ConnectionTable& connections,
                        Broadcaster& broadcaster,
                        Options opts);

    ConnectionLifecycle(const ConnectionLifecycle&) = delete;
    ConnectionLifecycle& operator=(const ConnectionLifecycle&) = delete;

    // --- Transport events ---

    /// Track a new anonymous connection, or refuse it while not accepting.
    void on_connect(ConnectionId id);

    /// Explicit close. Safe to call more than once.
    void on_close(ConnectionId id);

    // --- Periodic work ---

    /// Advance the reap and stats timers.
    void tick(float dt);

    /// Close every player whose connection the transport no longer reports open.
    /// @return Number of players removed by this sweep.
    std::size_t reap_sweep();

    /// Log the online player count (only when someone is online).
    void log_stats();

    /// Remove a player and (optionally) announce its departure.
    /// @return false if the player was already gone.
    bool close_player(const PlayerId& id, bool announce = true);

    // --- Shutdown / control ---

    /// Send server_shutdown to every open connection, close them all, clear
    /// the registries and stop accepting. No player_leave is sent meanwhile.
    void shutdown(std::string_view message);

    /// Accept connections and traffic again after shutdown().
    void start_accepting() { accepting_ = true; }
    bool accepting() const { return accepting_; }

    /// Stop the periodic tasks for good (engine shutdown).
    void cancel_tasks();

    const PeriodicTask& reap_task() const { return reapTask_; }
    const PeriodicTask& stats_task() const { return statsTask_; }

private:
    IServerServices& services_;
    SessionRegistry& sessions_;
    ConnectionTable& connections_;
    Broadcaster& broadcaster_;

    PeriodicTask reapTask_;
    PeriodicTask statsTask_;

    bool accepting_{true};
    bool shuttingDown_{false};
};

} // namespace voxrelay::server
