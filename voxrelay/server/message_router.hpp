#pragma once

#include "broadcaster.hpp"
#include "connection_table.hpp"
#include "session_registry.hpp"
#include "world_registry.hpp"

#include <voxrelay/core/server_interface.hpp>
#include <voxrelay/protocol/messages.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace voxrelay::server {

// ============================================================================
// MessageRouter - Decode an inbound payload and run the handler for its kind
// ============================================================================

class MessageRouter {
public:
    MessageRouter(IServerServices& services,
                  SessionRegistry& sessions,
                  WorldRegistry& worlds,
                  ConnectionTable& connections,
                  Broadcaster& broadcaster);

    /// Handle one payload from @p id. Malformed payloads, unknown kinds and
    /// handler failures are answered with a single error to the sender; the
    /// connection stays open either way.
    void route(ConnectionId id, std::span<const std::uint8_t> data);

private:
    void dispatch(Connection& conn, const proto::ClientMessage& msg);
    void reply_malformed(ConnectionId id);

    // --- Message handlers ---
    void handle_admin_connect(Connection& conn, const proto::AdminConnect& msg);
    void handle_login(Connection& conn, const proto::Login& msg);
    void handle_move(Connection& conn, const proto::Move& msg);
    void handle_block_action(Connection& conn, const proto::BlockAction& msg);
    void handle_chat(Connection& conn, const proto::ChatSend& msg);
    void handle_ping(Connection& conn, const proto::Ping& msg);

    /// Player bound to the connection, or nullptr (action is then dropped).
    Player* authenticated_player(const Connection& conn, std::string_view kind);

    IServerServices& services_;
    SessionRegistry& sessions_;
    WorldRegistry& worlds_;
    ConnectionTable& connections_;
    Broadcaster& broadcaster_;
};

} // namespace voxrelay::server
