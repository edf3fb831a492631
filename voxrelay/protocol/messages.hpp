#pragma once

// Relay Protocol Messages
// Every payload is a UTF-8 JSON object whose "type" string selects the message.

#include <voxrelay/core/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace voxrelay::proto {

// ============================================================================
// Protocol Version
// ============================================================================

/// The single client version token accepted at login.
static constexpr std::string_view kSupportedVersion = "1.12.2";

// ============================================================================
// Wire type names
// ============================================================================

namespace type {
    // Client -> server
    constexpr std::string_view kAdminConnect = "admin_connect";
    constexpr std::string_view kLogin = "login";
    constexpr std::string_view kMove = "move";
    constexpr std::string_view kBlockAction = "block_action";
    constexpr std::string_view kChat = "chat";
    constexpr std::string_view kPing = "ping";

    // Server -> client
    constexpr std::string_view kError = "error";
    constexpr std::string_view kAdminUpdate = "admin_update";
    constexpr std::string_view kLoginSuccess = "login_success";
    constexpr std::string_view kExistingPlayers = "existing_players";
    constexpr std::string_view kPlayerJoin = "player_join";
    constexpr std::string_view kPlayerMove = "player_move";
    constexpr std::string_view kBlockUpdate = "block_update";
    constexpr std::string_view kPong = "pong";
    constexpr std::string_view kPlayerLeave = "player_leave";
    constexpr std::string_view kServerShutdown = "server_shutdown";
}

// ============================================================================
// Shared payload types
// ============================================================================

/// Public view of a player as sent to other clients.
struct PlayerSnapshot {
    PlayerId id;
    std::string username;
    double x{0.0};
    double y{0.0};
    double z{0.0};
};

// ============================================================================
// Client -> server
// ============================================================================

struct AdminConnect {};

struct Login {
    std::string username;
    std::string version;
};

struct Move {
    double x{0.0};
    double y{0.0};
    double z{0.0};
};

/// Block coordinates and id are whatever JSON the client sent; the relay
/// never interprets them.
struct BlockAction {
    nlohmann::json x;
    nlohmann::json y;
    nlohmann::json z;
    nlohmann::json blockId;
    std::string action;     // "place" or "break", not validated
};

struct ChatSend {
    std::string message;
};

struct Ping {};

using ClientMessage = std::variant<
    AdminConnect,
    Login,
    Move,
    BlockAction,
    ChatSend,
    Ping
>;

// ============================================================================
// Server -> client
// ============================================================================

struct Error {
    std::string message;
};

struct AdminUpdate {
    std::vector<PlayerSnapshot> players;
};

struct LoginSuccess {
    PlayerId playerId;
    Vec3 spawn;
};

struct ExistingPlayers {
    std::vector<PlayerSnapshot> players;
};

struct PlayerJoin {
    PlayerSnapshot player;
};

struct PlayerMove {
    PlayerId playerId;
    double x{0.0};
    double y{0.0};
    double z{0.0};
};

struct BlockUpdate {
    nlohmann::json x;
    nlohmann::json y;
    nlohmann::json z;
    nlohmann::json blockId;
    std::string action;
    PlayerId playerId;
};

struct Chat {
    std::string username;
    std::string message;
    std::int64_t timestamp{0};  // Unix epoch milliseconds
};

struct Pong {};

struct PlayerLeave {
    PlayerId playerId;
    std::string username;
};

struct ServerShutdown {
    std::string message;
};

using ServerMessage = std::variant<
    Error,
    AdminUpdate,
    LoginSuccess,
    ExistingPlayers,
    PlayerJoin,
    PlayerMove,
    BlockUpdate,
    Chat,
    Pong,
    PlayerLeave,
    ServerShutdown
>;

// ============================================================================
// Status report (control surface)
// ============================================================================

struct StatusReport {
    std::string status;         // "online" while accepting, "stopped" otherwise
    std::size_t playerCount{0};
    std::uint64_t uptimeSeconds{0};
};

/// For exhaustive std::visit chains: a static_assert on this fires only
/// when an alternative is left unhandled.
template <typename>
inline constexpr bool kUnhandledAlternative = false;

// ============================================================================
// Canned texts
// ============================================================================

namespace text {
    constexpr std::string_view kMalformed = "Invalid message format";
    constexpr std::string_view kVersionMismatch = "Only version 1.12.2 is supported";
    constexpr std::string_view kAlreadyLoggedIn = "Already logged in";
    constexpr std::string_view kNoWorld = "No world available";
    constexpr std::string_view kShutdown = "Server is shutting down";
    constexpr std::string_view kStoppedByAdmin = "Server was stopped by an administrator";
}

} // namespace voxrelay::proto
