#include "session_registry.hpp"

#include <cstdio>

namespace voxrelay::server {

// ============================================================================
// Player
// ============================================================================

proto::PlayerSnapshot Player::snapshot() const {
    proto::PlayerSnapshot s;
    s.id = id;
    s.username = username;
    s.x = position.x;
    s.y = position.y;
    s.z = position.z;
    return s;
}

// ============================================================================
// UUID
// ============================================================================

std::string make_uuid_v4(std::mt19937_64& rng) {
    std::uint64_t hi = rng();
    std::uint64_t lo = rng();

    // Version 4 in the high nibble of time_hi, RFC 4122 variant in clock_seq
    hi = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    lo = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFull));
    return std::string(buf);
}

// ============================================================================
// SessionRegistry
// ============================================================================

SessionRegistry::SessionRegistry(WorldRegistry& worlds)
    : worlds_(worlds) {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
    rng_.seed(seq);
}

Player* SessionRegistry::register_player(ConnectionId connection, const std::string& username,
                                         std::string_view version, LoginError& error) {
    if (version != proto::kSupportedVersion) {
        error = LoginError::VersionMismatch;
        return nullptr;
    }

    const std::string& worldName = worlds_.default_world();
    const World* world = worlds_.find(worldName);
    if (!world) {
        error = LoginError::NoWorld;
        return nullptr;
    }

    Player player;
    player.id = next_player_id();
    player.username = username;
    player.connection = connection;
    player.position = world->spawn;
    player.world = worldName;

    auto [it, inserted] = players_.emplace(player.id, std::move(player));
    worlds_.add_member(worldName, it->first);

    error = LoginError::None;
    return &it->second;
}

std::optional<Player> SessionRegistry::unregister(const PlayerId& id) {
    auto it = players_.find(id);
    if (it == players_.end()) return std::nullopt;

    Player removed = std::move(it->second);
    players_.erase(it);

    removed.connected = false;
    worlds_.remove_member(removed.world, removed.id);
    return removed;
}

Player* SessionRegistry::find(const PlayerId& id) {
    auto it = players_.find(id);
    return (it != players_.end()) ? &it->second : nullptr;
}

const Player* SessionRegistry::find(const PlayerId& id) const {
    auto it = players_.find(id);
    return (it != players_.end()) ? &it->second : nullptr;
}

const Player* SessionRegistry::find_by_connection(ConnectionId connection) const {
    for (const auto& [id, player] : players_) {
        if (player.connection == connection) {
            return &player;
        }
    }
    return nullptr;
}

const std::unordered_set<PlayerId>& SessionRegistry::world_members(const std::string& world) const {
    return worlds_.members(world);
}

bool SessionRegistry::update_position(const PlayerId& id, Vec3 position) {
    Player* player = find(id);
    if (!player) return false;
    player->position = position;
    return true;
}

std::vector<proto::PlayerSnapshot> SessionRegistry::snapshot() const {
    std::vector<proto::PlayerSnapshot> out;
    out.reserve(players_.size());
    for (const auto& [id, player] : players_) {
        out.push_back(player.snapshot());
    }
    return out;
}

void SessionRegistry::clear() {
    players_.clear();
    worlds_.clear_members();
}

PlayerId SessionRegistry::next_player_id() {
    // Skip ids that are still live
    for (;;) {
        PlayerId id = make_uuid_v4(rng_);
        if (players_.find(id) == players_.end()) {
            return id;
        }
    }
}

} // namespace voxrelay::server
