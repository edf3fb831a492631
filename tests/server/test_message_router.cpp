/**
 * @file test_message_router.cpp
 * @brief Handler behaviour for every inbound message kind, driven through RelayServer.
 */

#include <catch2/catch.hpp>

#include <voxrelay/server/relay_server.hpp>

#include "test_utils.hpp"

using namespace voxrelay;
using namespace voxrelay::proto;
using namespace voxrelay::server;
using namespace test_helpers;

namespace {

struct Fixture {
    MockServerServices services;
    RelayServer server;

    Fixture() {
        services.onDisconnect = [this](ConnectionId id) { server.on_disconnect(id); };
        server.on_init(services);
    }

    void connect(ConnectionId id) {
        services.open(id);
        server.on_connect(id);
    }

    void send(ConnectionId id, const ClientMessage& msg) {
        server.on_message(id, encode(msg));
    }

    void send_raw(ConnectionId id, std::string_view text) {
        server.on_message(id, bytes_of(text));
    }
};

} // namespace

// =============================================================================
// login
// =============================================================================

TEST_CASE("Router: login replies success then existing players", "[server][router][login]") {
    Fixture f;
    PlayerId alice = login_player(f.server, f.services, 1, "Alice");
    REQUIRE_FALSE(alice.empty());

    const auto& sent = f.services.sent(1);
    REQUIRE(sent.size() == 2);
    REQUIRE(std::holds_alternative<LoginSuccess>(sent[0]));
    REQUIRE(std::holds_alternative<ExistingPlayers>(sent[1]));

    const auto& success = std::get<LoginSuccess>(sent[0]);
    REQUIRE(success.playerId == alice);
    REQUIRE(success.spawn == Vec3{0.0, 64.0, 0.0});
    REQUIRE(std::get<ExistingPlayers>(sent[1]).players.empty());

    REQUIRE(f.server.sessions().find(alice) != nullptr);
    REQUIRE(f.server.worlds().members("overworld").count(alice) == 1);
}

TEST_CASE("Router: wrong version gets exactly one error", "[server][router][login]") {
    Fixture f;
    f.connect(1);
    f.send(1, make_login("Alice", "1.8.9"));

    const auto& sent = f.services.sent(1);
    REQUIRE(sent.size() == 1);
    REQUIRE(std::get<Error>(sent[0]).message == "Only version 1.12.2 is supported");
    REQUIRE(f.server.sessions().size() == 0);
    REQUIRE(f.server.worlds().members("overworld").empty());

    // Connection stays usable
    REQUIRE(f.services.disconnects().empty());
    f.send(1, make_login("Alice"));
    REQUIRE(count_of<LoginSuccess>(f.services.sent(1)) == 1);
}

TEST_CASE("Router: second login on the same connection is rejected", "[server][router][login]") {
    Fixture f;
    PlayerId alice = login_player(f.server, f.services, 1, "Alice");
    f.services.clear_sent();

    f.send(1, make_login("Alice2"));

    const auto& sent = f.services.sent(1);
    REQUIRE(sent.size() == 1);
    REQUIRE(std::get<Error>(sent[0]).message == "Already logged in");
    REQUIRE(f.server.sessions().size() == 1);
    REQUIRE(f.server.sessions().find(alice)->username == "Alice");
}

TEST_CASE("Router: login with no world configured is rejected", "[server][router][login]") {
    MockServerServices services;
    RelayServer::Options opts;
    opts.worlds.clear();
    RelayServer server(opts);
    server.on_init(services);

    services.open(1);
    server.on_connect(1);
    server.on_message(1, encode(make_login("Alice")));

    REQUIRE(std::get<Error>(services.sent(1).at(0)).message == "No world available");
    REQUIRE(server.sessions().size() == 0);
}

TEST_CASE("Router: players join the first configured world", "[server][router][login]") {
    MockServerServices services;
    RelayServer::Options opts;
    opts.worlds = {WorldConfig{"lobby", Vec3{5.0, 70.0, -5.0}}, WorldConfig{"arena", Vec3{}}};
    RelayServer server(opts);
    server.on_init(services);

    PlayerId id = login_player(server, services, 1, "Alice");
    REQUIRE(server.sessions().find(id)->world == "lobby");
    REQUIRE(messages_of<LoginSuccess>(services.sent(1)).at(0).spawn == Vec3{5.0, 70.0, -5.0});
}

// =============================================================================
// Alice and Bob
// =============================================================================

TEST_CASE("Router: two-player session end to end", "[server][router][scenario]") {
    Fixture f;

    PlayerId alice = login_player(f.server, f.services, 1, "Alice");
    REQUIRE(std::get<ExistingPlayers>(f.services.sent(1).at(1)).players.empty());

    PlayerId bob = login_player(f.server, f.services, 2, "Bob");

    // Bob sees Alice at spawn
    auto existing = messages_of<ExistingPlayers>(f.services.sent(2));
    REQUIRE(existing.size() == 1);
    REQUIRE(existing[0].players.size() == 1);
    REQUIRE(existing[0].players[0].id == alice);
    REQUIRE(existing[0].players[0].username == "Alice");
    REQUIRE(existing[0].players[0].y == 64.0);

    // Alice is told Bob joined
    auto joins = messages_of<PlayerJoin>(f.services.sent(1));
    REQUIRE(joins.size() == 1);
    REQUIRE(joins[0].player.id == bob);
    REQUIRE(joins[0].player.username == "Bob");
    REQUIRE(count_of<PlayerJoin>(f.services.sent(2)) == 0);

    f.services.clear_sent();

    // Bob moves
    f.send(2, make_move(1.0, 65.0, 2.0));
    auto moves = messages_of<PlayerMove>(f.services.sent(1));
    REQUIRE(moves.size() == 1);
    REQUIRE(moves[0].playerId == bob);
    REQUIRE(moves[0].x == 1.0);
    REQUIRE(moves[0].y == 65.0);
    REQUIRE(moves[0].z == 2.0);
    REQUIRE(f.services.sent(2).empty());

    // Bob disconnects
    f.services.clear_sent();
    f.services.disconnect(2);

    auto leaves = messages_of<PlayerLeave>(f.services.sent(1));
    REQUIRE(leaves.size() == 1);
    REQUIRE(leaves[0].playerId == bob);
    REQUIRE(leaves[0].username == "Bob");
    REQUIRE(f.server.sessions().find(bob) == nullptr);
    REQUIRE(f.server.worlds().members("overworld").count(bob) == 0);
}

// =============================================================================
// move / block_action / chat
// =============================================================================

TEST_CASE("Router: moves keep order and exact coordinates", "[server][router][move]") {
    Fixture f;
    login_player(f.server, f.services, 1, "Alice");
    PlayerId bob = login_player(f.server, f.services, 2, "Bob");
    f.connect(9);
    f.send(9, AdminConnect{});
    f.services.clear_sent();

    f.send(2, make_move(0.1, 64.0, -3.75));
    f.send(2, make_move(0.2, 64.5, -3.5));
    f.send(2, make_move(0.3, 65.0, -3.25));

    for (ConnectionId watcher : {ConnectionId{1}, ConnectionId{9}}) {
        auto moves = messages_of<PlayerMove>(f.services.sent(watcher));
        REQUIRE(moves.size() == 3);
        REQUIRE(moves[0].x == 0.1);
        REQUIRE(moves[1].y == 64.5);
        REQUIRE(moves[2].z == -3.25);
    }
    REQUIRE(f.services.sent(2).empty());
    REQUIRE(f.server.sessions().find(bob)->position == Vec3{0.3, 65.0, -3.25});
}

TEST_CASE("Router: block actions go to everyone but the sender", "[server][router][block]") {
    Fixture f;
    PlayerId alice = login_player(f.server, f.services, 1, "Alice");
    login_player(f.server, f.services, 2, "Bob");
    f.services.clear_sent();

    BlockAction action;
    action.x = 10;
    action.y = 64;
    action.z = -3;
    action.blockId = 1;
    action.action = "place";
    f.send(1, action);

    auto updates = messages_of<BlockUpdate>(f.services.sent(2));
    REQUIRE(updates.size() == 1);
    REQUIRE(updates[0].x == 10);
    REQUIRE(updates[0].z == -3);
    REQUIRE(updates[0].blockId == 1);
    REQUIRE(updates[0].action == "place");
    REQUIRE(updates[0].playerId == alice);
    REQUIRE(f.services.sent(1).empty());
}

TEST_CASE("Router: block data is relayed without interpretation", "[server][router][block]") {
    Fixture f;
    login_player(f.server, f.services, 1, "Alice");
    PlayerId bob = login_player(f.server, f.services, 2, "Bob");
    f.services.clear_sent();

    f.send_raw(2, R"({"type":"block_action","x":1.5,"y":64,"z":-2,"blockId":1,"action":"place"})");
    f.send_raw(2, R"({"type":"block_action","x":1,"y":64,"z":-2,"blockId":"minecraft:stone","action":"place"})");

    auto updates = messages_of<BlockUpdate>(f.services.sent(1));
    REQUIRE(updates.size() == 2);
    REQUIRE(updates[0].x == 1.5);
    REQUIRE(updates[0].blockId == 1);
    REQUIRE(updates[1].blockId == "minecraft:stone");
    REQUIRE(updates[1].playerId == bob);

    // Sender gets neither an echo nor an error
    REQUIRE(f.services.sent(2).empty());
}

TEST_CASE("Router: chat reaches the sender too, exactly once", "[server][router][chat]") {
    Fixture f;
    login_player(f.server, f.services, 1, "Alice");
    login_player(f.server, f.services, 2, "Bob");
    f.connect(9);
    f.send(9, AdminConnect{});
    f.services.clear_sent();

    f.send(1, ChatSend{"hello"});

    for (ConnectionId id : {ConnectionId{1}, ConnectionId{2}, ConnectionId{9}}) {
        auto chats = messages_of<Chat>(f.services.sent(id));
        REQUIRE(chats.size() == 1);
        REQUIRE(chats[0].username == "Alice");
        REQUIRE(chats[0].message == "hello");
        REQUIRE(chats[0].timestamp > 0);
    }
    REQUIRE(f.services.logged(LogLevel::Info, "[chat] Alice: hello"));
}

TEST_CASE("Router: actions before login are dropped silently", "[server][router][auth]") {
    Fixture f;
    login_player(f.server, f.services, 1, "Alice");
    f.connect(2);
    f.services.clear_sent();

    f.send(2, make_move(1.0, 2.0, 3.0));
    f.send(2, ChatSend{"sneaky"});
    BlockAction action;
    action.action = "break";
    f.send(2, action);

    REQUIRE(f.services.total_sent() == 0);
}

// =============================================================================
// admin_connect / ping / malformed
// =============================================================================

TEST_CASE("Router: admin gets the full roster and all broadcasts", "[server][router][admin]") {
    Fixture f;
    login_player(f.server, f.services, 1, "Alice");
    login_player(f.server, f.services, 2, "Bob");

    f.connect(9);
    f.send(9, AdminConnect{});

    auto updates = messages_of<AdminUpdate>(f.services.sent(9));
    REQUIRE(updates.size() == 1);
    REQUIRE(updates[0].players.size() == 2);
    REQUIRE(f.server.sessions().size() == 2);

    SECTION("admin login is ignored") {
        f.services.clear_sent();
        f.send(9, make_login("Admin"));
        REQUIRE(f.services.sent(9).empty());
        REQUIRE(f.server.sessions().size() == 2);
    }

    SECTION("admin_connect from a player is ignored") {
        f.services.clear_sent();
        f.send(1, AdminConnect{});
        REQUIRE(f.services.sent(1).empty());
        REQUIRE(f.server.connections().admins() == std::vector<ConnectionId>{9});
    }
}

TEST_CASE("Router: ping gets pong", "[server][router]") {
    Fixture f;
    f.connect(1);
    f.send(1, Ping{});

    REQUIRE(f.services.sent(1).size() == 1);
    REQUIRE(std::holds_alternative<Pong>(f.services.sent(1)[0]));
}

TEST_CASE("Router: malformed payloads get one error and keep the connection", "[server][router][error]") {
    Fixture f;
    login_player(f.server, f.services, 1, "Alice");
    f.services.clear_sent();

    SECTION("garbage") {
        f.send_raw(1, "this is not json");
    }
    SECTION("unknown type") {
        f.send_raw(1, R"({"type":"teleport","x":1})");
    }
    SECTION("missing fields") {
        f.send_raw(1, R"({"type":"move","x":1})");
    }

    const auto& sent = f.services.sent(1);
    REQUIRE(sent.size() == 1);
    REQUIRE(std::get<Error>(sent[0]).message == "Invalid message format");
    REQUIRE(f.services.disconnects().empty());
    REQUIRE(f.server.sessions().size() == 1);
}

TEST_CASE("Router: a throwing handler is answered as malformed", "[server][router][error]") {
    Fixture f;
    login_player(f.server, f.services, 1, "Alice");
    login_player(f.server, f.services, 2, "Bob");
    f.services.clear_sent();

    // The chat handler logs at info after its broadcast
    f.services.throw_on_log(LogLevel::Info);
    REQUIRE_NOTHROW(f.send(1, ChatSend{"boom"}));

    auto errors = messages_of<Error>(f.services.sent(1));
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].message == "Invalid message format");
    REQUIRE(count_of<Error>(f.services.sent(2)) == 0);
    REQUIRE(f.services.logged(LogLevel::Error, "chat"));

    // Connection and session survive
    REQUIRE(f.services.disconnects().empty());
    REQUIRE(f.server.sessions().size() == 2);
    REQUIRE(f.services.is_open(1));

    f.services.clear_sent();
    f.send(1, Ping{});
    REQUIRE(count_of<Pong>(f.services.sent(1)) == 1);
}

TEST_CASE("Router: a throwing send never escapes route", "[server][router][error]") {
    Fixture f;
    f.connect(1);
    f.services.throw_on_send(1);

    SECTION("reply from a handler") {
        REQUIRE_NOTHROW(f.send(1, Ping{}));
    }
    SECTION("malformed reply") {
        REQUIRE_NOTHROW(f.send_raw(1, "not json"));
    }

    REQUIRE(f.services.logged(LogLevel::Warning, "failed"));
    REQUIRE(f.server.connections().find(1) != nullptr);
}

TEST_CASE("Router: messages from untracked connections are dropped", "[server][router][error]") {
    Fixture f;
    f.services.open(5);
    f.send(5, Ping{});
    REQUIRE(f.services.sent(5).empty());
}
