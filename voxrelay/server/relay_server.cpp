#include "relay_server.hpp"

#include <utility>

namespace voxrelay::server {

RelayServer::RelayServer()
    : RelayServer(Options{}) {
}

RelayServer::RelayServer(Options opts)
    : opts_(std::move(opts))
    , sessions_(worlds_) {
}

RelayServer::~RelayServer() = default;

// ============================================================================
// Lifecycle
// ============================================================================

void RelayServer::on_init(IServerServices& services) {
    services_ = &services;

    for (const auto& world : opts_.worlds) {
        if (!worlds_.add_world(world.name, world.spawn)) {
            services.log_warning("Duplicate world '" + world.name + "' ignored");
        }
    }
    if (worlds_.size() == 0) {
        services.log_warning("No worlds configured; every login will be rejected");
    }

    broadcaster_ = std::make_unique<Broadcaster>(services, sessions_, connections_);
    router_ = std::make_unique<MessageRouter>(services, sessions_, worlds_, connections_, *broadcaster_);

    ConnectionLifecycle::Options lifecycleOpts;
    lifecycleOpts.reapIntervalSeconds = opts_.reapIntervalSeconds;
    lifecycleOpts.statsIntervalSeconds = opts_.statsIntervalSeconds;
    lifecycle_ = std::make_unique<ConnectionLifecycle>(services, sessions_, connections_,
                                                       *broadcaster_, lifecycleOpts);

    services.log_info("Relay ready: " + std::to_string(worlds_.size()) + " world(s), default '" +
                      worlds_.default_world() + "'");
}

void RelayServer::on_shutdown() {
    if (!lifecycle_) return;

    lifecycle_->shutdown(opts_.shutdownMessage);
    lifecycle_->cancel_tasks();

    sessions_.clear();
    connections_.clear();

    // Router and lifecycle reference the broadcaster
    lifecycle_.reset();
    router_.reset();
    broadcaster_.reset();
    services_ = nullptr;
}

void RelayServer::on_tick(float dt) {
    if (lifecycle_) {
        lifecycle_->tick(dt);
    }
}

// ============================================================================
// Connections
// ============================================================================

void RelayServer::on_connect(ConnectionId id) {
    if (lifecycle_) {
        lifecycle_->on_connect(id);
    }
}

void RelayServer::on_disconnect(ConnectionId id) {
    if (lifecycle_) {
        lifecycle_->on_close(id);
    }
}

void RelayServer::on_message(ConnectionId id, std::span<const std::uint8_t> data) {
    if (!router_ || !lifecycle_->accepting()) return;
    router_->route(id, data);
}

// ============================================================================
// Control surface
// ============================================================================

proto::StatusReport RelayServer::status() const {
    proto::StatusReport report;
    report.status = accepting() ? "online" : "stopped";
    report.playerCount = sessions_.size();
    report.uptimeSeconds = services_ ? services_->uptime_seconds() : 0;
    return report;
}

void RelayServer::start_accepting() {
    if (!lifecycle_ || lifecycle_->accepting()) return;

    lifecycle_->start_accepting();
    services_->log_info("Accepting connections again");
}

void RelayServer::stop_accepting(std::string_view reason) {
    if (!lifecycle_) return;

    services_->log_info("Stopping: " + std::string(reason));
    lifecycle_->shutdown(reason);
}

bool RelayServer::accepting() const {
    return lifecycle_ && lifecycle_->accepting();
}

} // namespace voxrelay::server
