#include "serialization.hpp"

#include <nlohmann/json.hpp>

#include <type_traits>

namespace voxrelay::proto {

using nlohmann::json;

namespace {

// ============================================================================
// Helpers
// ============================================================================

std::vector<std::uint8_t> to_bytes(const json& j) {
    // Replace invalid UTF-8 instead of throwing; payloads are relayed verbatim
    std::string text = j.dump(-1, ' ', false, json::error_handler_t::replace);
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

json snapshot_to_json(const PlayerSnapshot& p) {
    return json{{"id", p.id}, {"username", p.username}, {"x", p.x}, {"y", p.y}, {"z", p.z}};
}

json snapshots_to_json(const std::vector<PlayerSnapshot>& players) {
    json arr = json::array();
    for (const auto& p : players) {
        arr.push_back(snapshot_to_json(p));
    }
    return arr;
}

bool fail(std::string* error, const char* reason) {
    if (error) *error = reason;
    return false;
}

bool read_string(const json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

bool read_number(const json& j, const char* key, double& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return false;
    out = it->get<double>();
    return true;
}

/// Any value, copied as-is. Only a missing key fails.
bool read_value(const json& j, const char* key, json& out) {
    auto it = j.find(key);
    if (it == j.end()) return false;
    out = *it;
    return true;
}

bool read_i64(const json& j, const char* key, std::int64_t& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) return false;
    out = it->get<std::int64_t>();
    return true;
}

bool read_snapshot(const json& j, PlayerSnapshot& out) {
    return j.is_object() &&
           read_string(j, "id", out.id) &&
           read_string(j, "username", out.username) &&
           read_number(j, "x", out.x) &&
           read_number(j, "y", out.y) &&
           read_number(j, "z", out.z);
}

bool read_snapshots(const json& j, const char* key, std::vector<PlayerSnapshot>& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return false;
    out.clear();
    for (const auto& item : *it) {
        PlayerSnapshot p;
        if (!read_snapshot(item, p)) return false;
        out.push_back(std::move(p));
    }
    return true;
}

/// Parse the envelope: a JSON object with a string "type".
bool parse_envelope(std::span<const std::uint8_t> data, json& out, std::string& kind, std::string* error) {
    out = json::parse(data.begin(), data.end(), nullptr, /*allow_exceptions=*/false);
    if (out.is_discarded()) return fail(error, "payload is not valid JSON");
    if (!out.is_object()) return fail(error, "payload is not a JSON object");
    if (!read_string(out, "type", kind)) return fail(error, "missing \"type\" string");
    return true;
}

} // namespace

// ============================================================================
// Serialize
// ============================================================================

std::vector<std::uint8_t> serialize(const ServerMessage& msg) {
    json j;
    j["type"] = std::string(type_name(msg));

    std::visit([&j](const auto& m) {
        using T = std::decay_t<decltype(m)>;

        if constexpr (std::is_same_v<T, Error>) {
            j["message"] = m.message;
        }
        else if constexpr (std::is_same_v<T, AdminUpdate>) {
            j["players"] = snapshots_to_json(m.players);
        }
        else if constexpr (std::is_same_v<T, LoginSuccess>) {
            j["playerId"] = m.playerId;
            j["spawn"] = json{{"x", m.spawn.x}, {"y", m.spawn.y}, {"z", m.spawn.z}};
        }
        else if constexpr (std::is_same_v<T, ExistingPlayers>) {
            j["players"] = snapshots_to_json(m.players);
        }
        else if constexpr (std::is_same_v<T, PlayerJoin>) {
            j["player"] = snapshot_to_json(m.player);
        }
        else if constexpr (std::is_same_v<T, PlayerMove>) {
            j["playerId"] = m.playerId;
            j["x"] = m.x;
            j["y"] = m.y;
            j["z"] = m.z;
        }
        else if constexpr (std::is_same_v<T, BlockUpdate>) {
            j["x"] = m.x;
            j["y"] = m.y;
            j["z"] = m.z;
            j["blockId"] = m.blockId;
            j["action"] = m.action;
            j["playerId"] = m.playerId;
        }
        else if constexpr (std::is_same_v<T, Chat>) {
            j["username"] = m.username;
            j["message"] = m.message;
            j["timestamp"] = m.timestamp;
        }
        else if constexpr (std::is_same_v<T, Pong>) {
            // type only
        }
        else if constexpr (std::is_same_v<T, PlayerLeave>) {
            j["playerId"] = m.playerId;
            j["username"] = m.username;
        }
        else if constexpr (std::is_same_v<T, ServerShutdown>) {
            j["message"] = m.message;
        }
        else {
            static_assert(kUnhandledAlternative<T>, "unhandled ServerMessage alternative");
        }
    }, msg);

    return to_bytes(j);
}

std::vector<std::uint8_t> serialize(const ClientMessage& msg) {
    json j;
    j["type"] = std::string(type_name(msg));

    std::visit([&j](const auto& m) {
        using T = std::decay_t<decltype(m)>;

        if constexpr (std::is_same_v<T, AdminConnect> || std::is_same_v<T, Ping>) {
            // type only
        }
        else if constexpr (std::is_same_v<T, Login>) {
            j["username"] = m.username;
            j["version"] = m.version;
        }
        else if constexpr (std::is_same_v<T, Move>) {
            j["x"] = m.x;
            j["y"] = m.y;
            j["z"] = m.z;
        }
        else if constexpr (std::is_same_v<T, BlockAction>) {
            j["x"] = m.x;
            j["y"] = m.y;
            j["z"] = m.z;
            j["blockId"] = m.blockId;
            j["action"] = m.action;
        }
        else if constexpr (std::is_same_v<T, ChatSend>) {
            j["message"] = m.message;
        }
        else {
            static_assert(kUnhandledAlternative<T>, "unhandled ClientMessage alternative");
        }
    }, msg);

    return to_bytes(j);
}

// ============================================================================
// Deserialize
// ============================================================================

std::optional<ClientMessage> parse_client_message(std::span<const std::uint8_t> data, std::string* error) {
    json j;
    std::string kind;
    if (!parse_envelope(data, j, kind, error)) return std::nullopt;

    if (kind == type::kAdminConnect) {
        return AdminConnect{};
    }
    if (kind == type::kLogin) {
        Login m;
        if (!read_string(j, "username", m.username) || !read_string(j, "version", m.version)) {
            fail(error, "login requires string username and version");
            return std::nullopt;
        }
        return m;
    }
    if (kind == type::kMove) {
        Move m;
        if (!read_number(j, "x", m.x) || !read_number(j, "y", m.y) || !read_number(j, "z", m.z)) {
            fail(error, "move requires numeric x, y, z");
            return std::nullopt;
        }
        return m;
    }
    if (kind == type::kBlockAction) {
        BlockAction m;
        if (!read_value(j, "x", m.x) || !read_value(j, "y", m.y) || !read_value(j, "z", m.z) ||
            !read_value(j, "blockId", m.blockId) || !read_string(j, "action", m.action)) {
            fail(error, "block_action requires x, y, z, blockId and string action");
            return std::nullopt;
        }
        return m;
    }
    if (kind == type::kChat) {
        ChatSend m;
        if (!read_string(j, "message", m.message)) {
            fail(error, "chat requires string message");
            return std::nullopt;
        }
        return m;
    }
    if (kind == type::kPing) {
        return Ping{};
    }

    if (error) *error = "unknown message type \"" + kind + "\"";
    return std::nullopt;
}

std::optional<ServerMessage> parse_server_message(std::span<const std::uint8_t> data, std::string* error) {
    json j;
    std::string kind;
    if (!parse_envelope(data, j, kind, error)) return std::nullopt;

    bool ok = false;
    std::optional<ServerMessage> out;

    if (kind == type::kError) {
        Error m;
        ok = read_string(j, "message", m.message);
        out = std::move(m);
    }
    else if (kind == type::kAdminUpdate) {
        AdminUpdate m;
        ok = read_snapshots(j, "players", m.players);
        out = std::move(m);
    }
    else if (kind == type::kLoginSuccess) {
        LoginSuccess m;
        auto spawn = j.find("spawn");
        ok = read_string(j, "playerId", m.playerId) && spawn != j.end() && spawn->is_object() &&
             read_number(*spawn, "x", m.spawn.x) &&
             read_number(*spawn, "y", m.spawn.y) &&
             read_number(*spawn, "z", m.spawn.z);
        out = std::move(m);
    }
    else if (kind == type::kExistingPlayers) {
        ExistingPlayers m;
        ok = read_snapshots(j, "players", m.players);
        out = std::move(m);
    }
    else if (kind == type::kPlayerJoin) {
        PlayerJoin m;
        auto player = j.find("player");
        ok = player != j.end() && read_snapshot(*player, m.player);
        out = std::move(m);
    }
    else if (kind == type::kPlayerMove) {
        PlayerMove m;
        ok = read_string(j, "playerId", m.playerId) &&
             read_number(j, "x", m.x) && read_number(j, "y", m.y) && read_number(j, "z", m.z);
        out = std::move(m);
    }
    else if (kind == type::kBlockUpdate) {
        BlockUpdate m;
        ok = read_value(j, "x", m.x) && read_value(j, "y", m.y) && read_value(j, "z", m.z) &&
             read_value(j, "blockId", m.blockId) && read_string(j, "action", m.action) &&
             read_string(j, "playerId", m.playerId);
        out = std::move(m);
    }
    else if (kind == type::kChat) {
        Chat m;
        ok = read_string(j, "username", m.username) && read_string(j, "message", m.message) &&
             read_i64(j, "timestamp", m.timestamp);
        out = std::move(m);
    }
    else if (kind == type::kPong) {
        ok = true;
        out = Pong{};
    }
    else if (kind == type::kPlayerLeave) {
        PlayerLeave m;
        ok = read_string(j, "playerId", m.playerId) && read_string(j, "username", m.username);
        out = std::move(m);
    }
    else if (kind == type::kServerShutdown) {
        ServerShutdown m;
        ok = read_string(j, "message", m.message);
        out = std::move(m);
    }
    else {
        if (error) *error = "unknown message type \"" + kind + "\"";
        return std::nullopt;
    }

    if (!ok) {
        fail(error, "missing or mistyped field");
        return std::nullopt;
    }
    return out;
}

// ============================================================================
// Type names
// ============================================================================

std::string_view type_name(const ClientMessage& msg) {
    return std::visit([](const auto& m) -> std::string_view {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, AdminConnect>) return type::kAdminConnect;
        else if constexpr (std::is_same_v<T, Login>) return type::kLogin;
        else if constexpr (std::is_same_v<T, Move>) return type::kMove;
        else if constexpr (std::is_same_v<T, BlockAction>) return type::kBlockAction;
        else if constexpr (std::is_same_v<T, ChatSend>) return type::kChat;
        else if constexpr (std::is_same_v<T, Ping>) return type::kPing;
        else static_assert(kUnhandledAlternative<T>, "unhandled ClientMessage alternative");
    }, msg);
}

std::string_view type_name(const ServerMessage& msg) {
    return std::visit([](const auto& m) -> std::string_view {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Error>) return type::kError;
        else if constexpr (std::is_same_v<T, AdminUpdate>) return type::kAdminUpdate;
        else if constexpr (std::is_same_v<T, LoginSuccess>) return type::kLoginSuccess;
        else if constexpr (std::is_same_v<T, ExistingPlayers>) return type::kExistingPlayers;
        else if constexpr (std::is_same_v<T, PlayerJoin>) return type::kPlayerJoin;
        else if constexpr (std::is_same_v<T, PlayerMove>) return type::kPlayerMove;
        else if constexpr (std::is_same_v<T, BlockUpdate>) return type::kBlockUpdate;
        else if constexpr (std::is_same_v<T, Chat>) return type::kChat;
        else if constexpr (std::is_same_v<T, Pong>) return type::kPong;
        else if constexpr (std::is_same_v<T, PlayerLeave>) return type::kPlayerLeave;
        else if constexpr (std::is_same_v<T, ServerShutdown>) return type::kServerShutdown;
        else static_assert(kUnhandledAlternative<T>, "unhandled ServerMessage alternative");
    }, msg);
}

// ============================================================================
// Status
// ============================================================================

std::string to_json(const StatusReport& status) {
    json j{
        {"status", status.status},
        {"playerCount", status.playerCount},
        {"uptimeSeconds", status.uptimeSeconds},
    };
    return j.dump();
}

} // namespace voxrelay::proto
