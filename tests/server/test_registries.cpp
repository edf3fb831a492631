/**
 * @file test_registries.cpp
 * @brief Unit tests for world, session and connection bookkeeping.
 */

#include <catch2/catch.hpp>

#include <voxrelay/server/connection_table.hpp>
#include <voxrelay/server/session_registry.hpp>
#include <voxrelay/server/world_registry.hpp>

#include <cctype>
#include <set>

using namespace voxrelay;
using namespace voxrelay::server;

// =============================================================================
// WorldRegistry
// =============================================================================

TEST_CASE("WorldRegistry: first world is the default", "[server][world]") {
    WorldRegistry worlds;
    REQUIRE(worlds.default_world().empty());

    REQUIRE(worlds.add_world("overworld", Vec3{0.0, 64.0, 0.0}));
    REQUIRE(worlds.add_world("nether", Vec3{0.0, 32.0, 0.0}));

    REQUIRE(worlds.default_world() == "overworld");
    REQUIRE(worlds.size() == 2);
    REQUIRE(worlds.names() == std::vector<std::string>{"nether", "overworld"});
}

TEST_CASE("WorldRegistry: duplicate world name is refused", "[server][world]") {
    WorldRegistry worlds;
    REQUIRE(worlds.add_world("overworld", Vec3{0.0, 64.0, 0.0}));
    REQUIRE_FALSE(worlds.add_world("overworld", Vec3{1.0, 2.0, 3.0}));

    REQUIRE(worlds.find("overworld")->spawn == Vec3{0.0, 64.0, 0.0});
}

TEST_CASE("WorldRegistry: membership of unknown world is empty", "[server][world]") {
    WorldRegistry worlds;
    REQUIRE(worlds.members("nowhere").empty());
    REQUIRE_FALSE(worlds.add_member("nowhere", "p1"));
    REQUIRE_FALSE(worlds.remove_member("nowhere", "p1"));
}

// =============================================================================
// SessionRegistry
// =============================================================================

TEST_CASE("SessionRegistry: login places player at default spawn", "[server][session]") {
    WorldRegistry worlds;
    worlds.add_world("overworld", Vec3{0.0, 64.0, 0.0});
    SessionRegistry sessions(worlds);

    LoginError error = LoginError::None;
    Player* player = sessions.register_player(7, "Alice", "1.12.2", error);

    REQUIRE(player != nullptr);
    REQUIRE(error == LoginError::None);
    REQUIRE(player->username == "Alice");
    REQUIRE(player->connection == 7);
    REQUIRE(player->world == "overworld");
    REQUIRE(player->position == Vec3{0.0, 64.0, 0.0});
    REQUIRE(player->health == 20);
    REQUIRE(player->food == 20);
    REQUIRE(player->connected);

    REQUIRE(worlds.members("overworld").count(player->id) == 1);
    REQUIRE(sessions.size() == 1);
}

TEST_CASE("SessionRegistry: version mismatch leaves registries untouched", "[server][session]") {
    WorldRegistry worlds;
    worlds.add_world("overworld", Vec3{0.0, 64.0, 0.0});
    SessionRegistry sessions(worlds);

    LoginError error = LoginError::None;
    REQUIRE(sessions.register_player(1, "Alice", "1.8.9", error) == nullptr);
    REQUIRE(error == LoginError::VersionMismatch);
    REQUIRE(sessions.size() == 0);
    REQUIRE(worlds.members("overworld").empty());
}

TEST_CASE("SessionRegistry: login without any world fails", "[server][session]") {
    WorldRegistry worlds;
    SessionRegistry sessions(worlds);

    LoginError error = LoginError::None;
    REQUIRE(sessions.register_player(1, "Alice", "1.12.2", error) == nullptr);
    REQUIRE(error == LoginError::NoWorld);
    REQUIRE(sessions.size() == 0);
}

TEST_CASE("SessionRegistry: ids are unique even for repeated usernames", "[server][session]") {
    WorldRegistry worlds;
    worlds.add_world("overworld", Vec3{0.0, 64.0, 0.0});
    SessionRegistry sessions(worlds);

    std::set<PlayerId> ids;
    LoginError error = LoginError::None;
    for (ConnectionId conn = 1; conn <= 50; ++conn) {
        Player* player = sessions.register_player(conn, "Steve", "1.12.2", error);
        REQUIRE(player != nullptr);
        ids.insert(player->id);
    }

    REQUIRE(ids.size() == 50);
    REQUIRE(sessions.size() == 50);
    REQUIRE(worlds.members("overworld").size() == 50);
}

TEST_CASE("SessionRegistry: unregister is idempotent", "[server][session]") {
    WorldRegistry worlds;
    worlds.add_world("overworld", Vec3{0.0, 64.0, 0.0});
    SessionRegistry sessions(worlds);

    LoginError error = LoginError::None;
    PlayerId id = sessions.register_player(1, "Alice", "1.12.2", error)->id;

    auto removed = sessions.unregister(id);
    REQUIRE(removed.has_value());
    REQUIRE(removed->username == "Alice");
    REQUIRE_FALSE(removed->connected);
    REQUIRE(sessions.find(id) == nullptr);
    REQUIRE(worlds.members("overworld").empty());

    REQUIRE_FALSE(sessions.unregister(id).has_value());
    REQUIRE_FALSE(sessions.unregister("never-existed").has_value());
}

TEST_CASE("SessionRegistry: lookup by connection", "[server][session]") {
    WorldRegistry worlds;
    worlds.add_world("overworld", Vec3{0.0, 64.0, 0.0});
    SessionRegistry sessions(worlds);

    LoginError error = LoginError::None;
    PlayerId alice = sessions.register_player(4, "Alice", "1.12.2", error)->id;

    REQUIRE(sessions.find_by_connection(4) != nullptr);
    REQUIRE(sessions.find_by_connection(4)->id == alice);
    REQUIRE(sessions.find_by_connection(5) == nullptr);

    sessions.unregister(alice);
    REQUIRE(sessions.find_by_connection(4) == nullptr);
}

TEST_CASE("SessionRegistry: position updates are stored verbatim", "[server][session]") {
    WorldRegistry worlds;
    worlds.add_world("overworld", Vec3{0.0, 64.0, 0.0});
    SessionRegistry sessions(worlds);

    LoginError error = LoginError::None;
    PlayerId id = sessions.register_player(1, "Alice", "1.12.2", error)->id;

    REQUIRE(sessions.update_position(id, Vec3{1e9, -5000.5, 0.25}));
    REQUIRE(sessions.find(id)->position == Vec3{1e9, -5000.5, 0.25});
    REQUIRE_FALSE(sessions.update_position("ghost", Vec3{}));
}

TEST_CASE("SessionRegistry: clear drops players and memberships", "[server][session]") {
    WorldRegistry worlds;
    worlds.add_world("overworld", Vec3{0.0, 64.0, 0.0});
    SessionRegistry sessions(worlds);

    LoginError error = LoginError::None;
    sessions.register_player(1, "Alice", "1.12.2", error);
    sessions.register_player(2, "Bob", "1.12.2", error);

    sessions.clear();
    REQUIRE(sessions.size() == 0);
    REQUIRE(worlds.members("overworld").empty());
    REQUIRE(worlds.size() == 1);
}

TEST_CASE("make_uuid_v4 produces canonical version 4 text", "[server][session]") {
    std::mt19937_64 rng(12345);
    const std::string id = make_uuid_v4(rng);

    REQUIRE(id.size() == 36);
    REQUIRE(id[8] == '-');
    REQUIRE(id[13] == '-');
    REQUIRE(id[18] == '-');
    REQUIRE(id[23] == '-');
    REQUIRE(id[14] == '4');
    REQUIRE((id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b'));

    for (char c : id) {
        if (c == '-') continue;
        REQUIRE(std::isxdigit(static_cast<unsigned char>(c)));
        REQUIRE_FALSE(std::isupper(static_cast<unsigned char>(c)));
    }
}

// =============================================================================
// ConnectionTable
// =============================================================================

TEST_CASE("ConnectionTable: tracks anonymous, admin and player connections", "[server][connection]") {
    ConnectionTable table;
    table.add(3);
    table.add(1);
    table.add(2).admin = true;

    REQUIRE(table.size() == 3);
    REQUIRE(table.ids() == std::vector<ConnectionId>{1, 2, 3});
    REQUIRE(table.admins() == std::vector<ConnectionId>{2});
    REQUIRE_FALSE(table.find(1)->authenticated());

    table.find(1)->playerId = "p1";
    REQUIRE(table.find(1)->authenticated());

    SECTION("re-adding resets state") {
        table.add(1);
        REQUIRE_FALSE(table.find(1)->authenticated());
    }

    SECTION("remove is idempotent") {
        REQUIRE(table.remove(3));
        REQUIRE_FALSE(table.remove(3));
        REQUIRE(table.find(3) == nullptr);
    }
}
