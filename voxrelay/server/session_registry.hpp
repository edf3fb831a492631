#pragma once

#include "world_registry.hpp"

#include <voxrelay/core/types.hpp>
#include <voxrelay/protocol/messages.hpp>

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace voxrelay::server {

// ============================================================================
// Player
// ============================================================================

struct Player {
    PlayerId id;
    std::string username;
    ConnectionId connection{kInvalidConnectionId};

    // Relayed verbatim, never validated
    Vec3 position;
    std::string world;

    // Initialized for clients that expect them; nothing reads or changes them
    std::uint8_t health{20};
    std::uint8_t food{20};

    bool connected{true};

    proto::PlayerSnapshot snapshot() const;
};

enum class LoginError : std::uint8_t {
    None = 0,
    VersionMismatch = 1,
    NoWorld = 2,         // No world registered to place the player in
};

// ============================================================================
// SessionRegistry - Player id -> player state, kept in sync with world membership
// ============================================================================

class SessionRegistry {
public:
    explicit SessionRegistry(WorldRegistry& worlds);

    /// Log a connection in as a new player in the default world.
    /// Fails without touching either registry if @p version is not the
    /// supported token.
    /// @return The new player, or nullptr with @p error set.
    Player* register_player(ConnectionId connection, const std::string& username,
                            std::string_view version, LoginError& error);

    /// Remove a player from its world and from the registry.
    /// Unknown ids are a no-op.
    /// @return The removed player (connected == false), if there was one.
    std::optional<Player> unregister(const PlayerId& id);

    Player* find(const PlayerId& id);
    const Player* find(const PlayerId& id) const;

    /// Player bound to a transport connection, if any.
    const Player* find_by_connection(ConnectionId connection) const;

    /// Members of a world; empty for an unknown world.
    const std::unordered_set<PlayerId>& world_members(const std::string& world) const;

    /// @return false if the player is unknown.
    bool update_position(const PlayerId& id, Vec3 position);

    /// Every registered player, for admin views.
    std::vector<proto::PlayerSnapshot> snapshot() const;

    const std::unordered_map<PlayerId, Player>& players() const { return players_; }
    std::size_t size() const { return players_.size(); }

    /// Drop every player and every world membership.
    void clear();

private:
    PlayerId next_player_id();

    WorldRegistry& worlds_;
    std::unordered_map<PlayerId, Player> players_;
    std::mt19937_64 rng_;
};

/// Random (version 4) UUID in canonical 8-4-4-4-12 lowercase hex form.
std::string make_uuid_v4(std::mt19937_64& rng);

} // namespace voxrelay::server
