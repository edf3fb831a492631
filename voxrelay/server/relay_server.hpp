#pragma once

#include "broadcaster.hpp"
#include "connection_lifecycle.hpp"
#include "connection_table.hpp"
#include "message_router.hpp"
#include "session_registry.hpp"
#include "world_registry.hpp"

#include <voxrelay/core/server_interface.hpp>
#include <voxrelay/protocol/messages.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace voxrelay::server {

// ============================================================================
// World configuration
// ============================================================================

struct WorldConfig {
    std::string name;
    Vec3 spawn;
};

// ============================================================================
// RelayServer - Session relay driven by the engine loop
// ============================================================================

class RelayServer : public IServerApp {
public:
    struct Options {
        // First entry is the world new players join
        std::vector<WorldConfig> worlds{WorldConfig{"overworld", Vec3{0.0, 64.0, 0.0}}};

        float reapIntervalSeconds{30.0f};
        float statsIntervalSeconds{60.0f};

        std::string shutdownMessage{proto::text::kShutdown};
    };

    RelayServer();
    explicit RelayServer(Options opts);
    ~RelayServer() override;

    // --- IServerApp ---
    void on_init(IServerServices& services) override;
    void on_shutdown() override;
    void on_tick(float dt) override;
    void on_connect(ConnectionId id) override;
    void on_disconnect(ConnectionId id) override;
    void on_message(ConnectionId id, std::span<const std::uint8_t> data) override;

    // --- Control surface ---

    /// "online" while accepting, "stopped" otherwise.
    proto::StatusReport status() const;

    void start_accepting();

    /// Notify and close every connection, then refuse new ones until
    /// start_accepting().
    void stop_accepting(std::string_view reason = proto::text::kStoppedByAdmin);

    bool accepting() const;

    // --- Inspection (tests, admin tooling) ---
    const SessionRegistry& sessions() const { return sessions_; }
    const WorldRegistry& worlds() const { return worlds_; }
    const ConnectionTable& connections() const { return connections_; }
    const ConnectionLifecycle* lifecycle() const { return lifecycle_.get(); }

private:
    Options opts_;
    IServerServices* services_{nullptr};

    WorldRegistry worlds_;
    SessionRegistry sessions_;
    ConnectionTable connections_;

    std::unique_ptr<Broadcaster> broadcaster_;
    std::unique_ptr<MessageRouter> router_;
    std::unique_ptr<ConnectionLifecycle> lifecycle_;
};

} // namespace voxrelay::server
