#pragma once

#include "types.hpp"

#include <cstdint>
#include <span>
#include <string_view>

namespace voxrelay {

// ============================================================================
// IServerServices - Engine provides this to the relay server
// ============================================================================

class IServerServices {
public:
    virtual ~IServerServices() = default;

    // --- Networking ---

    /// Send a raw payload to one connection.
    /// @return false if the connection is unknown or the send failed.
    virtual bool send(ConnectionId id, std::span<const std::uint8_t> data) = 0;

    /// Close a connection from the server side.
    virtual void disconnect(ConnectionId id) = 0;

    /// Whether the transport still considers the connection open.
    virtual bool is_open(ConnectionId id) const = 0;

    // --- Time ---

    /// Current server tick (increments each loop iteration).
    virtual Tick current_tick() const = 0;

    /// Loop tick rate (ticks per second).
    virtual float tick_rate() const = 0;

    /// Seconds since the engine started running.
    virtual std::uint64_t uptime_seconds() const = 0;

    // --- Logging ---

    virtual void log(LogLevel level, std::string_view msg) = 0;

    void log_debug(std::string_view msg) { log(LogLevel::Debug, msg); }
    void log_info(std::string_view msg) { log(LogLevel::Info, msg); }
    void log_warning(std::string_view msg) { log(LogLevel::Warning, msg); }
    void log_error(std::string_view msg) { log(LogLevel::Error, msg); }
};

// ============================================================================
// IServerApp - Relay logic implements this
// ============================================================================

class IServerApp {
public:
    virtual ~IServerApp() = default;

    // --- Lifecycle ---

    /// Called once when the engine starts, on the loop thread.
    virtual void on_init(IServerServices& services) = 0;

    /// Called once when the engine stops, on the loop thread.
    /// Transport is still alive here, so farewell messages can be sent.
    virtual void on_shutdown() = 0;

    /// Called every loop tick with the elapsed time in seconds.
    virtual void on_tick(float dt) = 0;

    // --- Connections ---

    virtual void on_connect(ConnectionId id) = 0;
    virtual void on_disconnect(ConnectionId id) = 0;

    /// Called for every inbound payload. The app decodes it.
    virtual void on_message(ConnectionId id, std::span<const std::uint8_t> data) = 0;
};

} // namespace voxrelay
