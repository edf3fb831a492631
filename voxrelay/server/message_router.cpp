#include "message_router.hpp"

#include <voxrelay/protocol/serialization.hpp>

#include <chrono>
#include <exception>
#include <string>
#include <type_traits>

namespace voxrelay::server {

namespace {

std::int64_t now_epoch_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

MessageRouter::MessageRouter(IServerServices& services,
                             SessionRegistry& sessions,
                             WorldRegistry& worlds,
                             ConnectionTable& connections,
                             Broadcaster& broadcaster)
    : services_(services)
    , sessions_(sessions)
    , worlds_(worlds)
    , connections_(connections)
    , broadcaster_(broadcaster) {
}

void MessageRouter::route(ConnectionId id, std::span<const std::uint8_t> data) {
    Connection* conn = connections_.find(id);
    if (!conn) {
        services_.log_warning("Message from untracked connection " + std::to_string(id) + " dropped");
        return;
    }

    std::string error;
    auto msg = proto::parse_client_message(data, &error);
    if (!msg) {
        services_.log_warning("Malformed message from connection " + std::to_string(id) + ": " + error);
        reply_malformed(id);
        return;
    }

    try {
        dispatch(*conn, *msg);
    } catch (const std::exception& e) {
        services_.log_error("Handler for " + std::string(proto::type_name(*msg)) +
                            " failed on connection " + std::to_string(id) + ": " + e.what());
        reply_malformed(id);
    }
}

void MessageRouter::dispatch(Connection& conn, const proto::ClientMessage& msg) {
    std::visit([this, &conn](const auto& m) {
        using T = std::decay_t<decltype(m)>;

        if constexpr (std::is_same_v<T, proto::AdminConnect>) {
            handle_admin_connect(conn, m);
        }
        else if constexpr (std::is_same_v<T, proto::Login>) {
            handle_login(conn, m);
        }
        else if constexpr (std::is_same_v<T, proto::Move>) {
            handle_move(conn, m);
        }
        else if constexpr (std::is_same_v<T, proto::BlockAction>) {
            handle_block_action(conn, m);
        }
        else if constexpr (std::is_same_v<T, proto::ChatSend>) {
            handle_chat(conn, m);
        }
        else if constexpr (std::is_same_v<T, proto::Ping>) {
            handle_ping(conn, m);
        }
        else {
            static_assert(proto::kUnhandledAlternative<T>, "unhandled ClientMessage alternative");
        }
    }, msg);
}

void MessageRouter::reply_malformed(ConnectionId id) {
    broadcaster_.send_to(id, proto::Error{std::string(proto::text::kMalformed)});
}

// ============================================================================
// Message Handlers
// ============================================================================

void MessageRouter::handle_admin_connect(Connection& conn, const proto::AdminConnect& /*msg*/) {
    if (conn.authenticated()) {
        services_.log_warning("admin_connect on player connection " + std::to_string(conn.id) + " ignored");
        return;
    }

    conn.admin = true;
    services_.log_info("Admin observer attached on connection " + std::to_string(conn.id));

    proto::AdminUpdate update;
    update.players = sessions_.snapshot();
    broadcaster_.send_to(conn.id, update);
}

void MessageRouter::handle_login(Connection& conn, const proto::Login& msg) {
    if (conn.admin) {
        services_.log_debug("login on admin connection " + std::to_string(conn.id) + " ignored");
        return;
    }
    if (conn.authenticated()) {
        broadcaster_.send_to(conn.id, proto::Error{std::string(proto::text::kAlreadyLoggedIn)});
        return;
    }

    LoginError error = LoginError::None;
    Player* player = sessions_.register_player(conn.id, msg.username, msg.version, error);
    if (!player) {
        if (error == LoginError::VersionMismatch) {
            services_.log_info("Login of '" + msg.username + "' rejected: version " + msg.version);
            broadcaster_.send_to(conn.id, proto::Error{std::string(proto::text::kVersionMismatch)});
        } else {
            services_.log_error("Login of '" + msg.username + "' failed: no world registered");
            broadcaster_.send_to(conn.id, proto::Error{std::string(proto::text::kNoWorld)});
        }
        return;
    }

    conn.playerId = player->id;

    const World* world = worlds_.find(player->world);

    proto::LoginSuccess success;
    success.playerId = player->id;
    success.spawn = world ? world->spawn : player->position;
    broadcaster_.send_to(conn.id, success);

    proto::ExistingPlayers existing;
    for (const auto& memberId : worlds_.members(player->world)) {
        if (memberId == player->id) continue;
        if (const Player* other = sessions_.find(memberId)) {
            existing.players.push_back(other->snapshot());
        }
    }
    broadcaster_.send_to(conn.id, existing);

    broadcaster_.broadcast(player->world, proto::PlayerJoin{player->snapshot()}, player->id);

    services_.log_info("Player " + player->username + " (" + player->id + ") joined " + player->world);
}

void MessageRouter::handle_move(Connection& conn, const proto::Move& msg) {
    Player* player = authenticated_player(conn, proto::type::kMove);
    if (!player) return;

    sessions_.update_position(player->id, Vec3{msg.x, msg.y, msg.z});

    proto::PlayerMove move;
    move.playerId = player->id;
    move.x = msg.x;
    move.y = msg.y;
    move.z = msg.z;
    broadcaster_.broadcast(player->world, move, player->id);
}

void MessageRouter::handle_block_action(Connection& conn, const proto::BlockAction& msg) {
    Player* player = authenticated_player(conn, proto::type::kBlockAction);
    if (!player) return;

    proto::BlockUpdate update;
    update.x = msg.x;
    update.y = msg.y;
    update.z = msg.z;
    update.blockId = msg.blockId;
    update.action = msg.action;
    update.playerId = player->id;
    broadcaster_.broadcast(player->world, update, player->id);
}

void MessageRouter::handle_chat(Connection& conn, const proto::ChatSend& msg) {
    Player* player = authenticated_player(conn, proto::type::kChat);
    if (!player) return;

    proto::Chat chat;
    chat.username = player->username;
    chat.message = msg.message;
    chat.timestamp = now_epoch_ms();

    // Chat echoes back to the sender
    broadcaster_.broadcast(player->world, chat);
    services_.log_info("[chat] " + player->username + ": " + msg.message);
}

void MessageRouter::handle_ping(Connection& conn, const proto::Ping& /*msg*/) {
    broadcaster_.send_to(conn.id, proto::Pong{});
}

Player* MessageRouter::authenticated_player(const Connection& conn, std::string_view kind) {
    Player* player = conn.playerId ? sessions_.find(*conn.playerId) : nullptr;
    if (!player) {
        services_.log_debug(std::string(kind) + " from unauthenticated connection " +
                            std::to_string(conn.id) + " dropped");
    }
    return player;
}

} // namespace voxrelay::server
