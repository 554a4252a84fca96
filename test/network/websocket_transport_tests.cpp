// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// WebSocketTransport over loopback, including an end-to-end hub round trip

#include <catch2/catch_test_macros.hpp>
#include "network/node_hub.hpp"
#include "network/node_test_fixture.hpp"
#include "network/rpc_errors.hpp"
#include "network/websocket_transport.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

using namespace teleophub::test;
using namespace std::chrono_literals;

namespace {

// Thread-safe sink for events delivered on IO threads
struct Events {
    std::mutex m;
    std::condition_variable cv;
    std::vector<std::string> frames;
    int disconnects = 0;
    int connect_results = 0;
    bool connect_ok = false;
    TransportConnectionPtr accepted;

    template <typename Pred>
    bool wait(Pred pred, std::chrono::milliseconds timeout = 3000ms) {
        std::unique_lock<std::mutex> lk(m);
        return cv.wait_for(lk, timeout, pred);
    }
};

// Connect and block until the connect callback has fired
TransportConnectionPtr ConnectClient(WebSocketTransport& client, uint16_t port, Events& ev) {
    auto conn = client.connect("127.0.0.1", port, [&ev](bool ok) {
        std::lock_guard<std::mutex> lk(ev.m);
        ev.connect_ok = ok;
        ev.connect_results++;
        ev.cv.notify_all();
    });
    ev.wait([&] { return ev.connect_results > 0; });
    return conn;
}

} // namespace

TEST_CASE("WebSocketTransport lifecycle is idempotent", "[network][transport][websocket]") {
    WebSocketTransport t(1);

    CHECK_FALSE(t.is_running());
    t.stop();

    t.run();
    CHECK(t.is_running());
    t.run();
    CHECK(t.is_running());

    t.stop();
    t.stop();
    CHECK_FALSE(t.is_running());

    t.run();
    CHECK(t.is_running());
    t.stop();
}

TEST_CASE("WebSocketTransport listening_port returns bound ephemeral port", "[network][transport][websocket]") {
    WebSocketTransport t(1);
    CHECK(t.listening_port() == 0);
    CHECK(t.path() == "/ws/rpc");

    REQUIRE(t.listen(0, [](TransportConnectionPtr) {}));
    CHECK(t.listening_port() != 0);

    // Second listen while bound is refused
    CHECK_FALSE(t.listen(0, [](TransportConnectionPtr) {}));

    t.stop_listening();
    CHECK(t.listening_port() == 0);
}

TEST_CASE("WebSocketTransport text frame echo", "[network][transport][websocket]") {
    WebSocketTransport server(1);
    WebSocketTransport client(1);
    Events server_ev;
    Events client_ev;

    REQUIRE(server.listen(0, [&](TransportConnectionPtr c) {
        c->set_receive_callback([c](const std::string& frame) { c->send(frame); });
        c->set_disconnect_callback([&server_ev]() {
            std::lock_guard<std::mutex> lk(server_ev.m);
            server_ev.disconnects++;
            server_ev.cv.notify_all();
        });
        c->start();
        std::lock_guard<std::mutex> lk(server_ev.m);
        server_ev.accepted = c;
        server_ev.cv.notify_all();
    }));
    uint16_t port = server.listening_port();
    server.run();
    client.run();

    auto conn = ConnectClient(client, port, client_ev);
    REQUIRE(conn);
    REQUIRE(client_ev.connect_ok);
    REQUIRE(conn->is_open());
    REQUIRE_FALSE(conn->is_inbound());

    conn->set_receive_callback([&client_ev](const std::string& frame) {
        std::lock_guard<std::mutex> lk(client_ev.m);
        client_ev.frames.push_back(frame);
        client_ev.cv.notify_all();
    });
    conn->set_disconnect_callback([&client_ev]() {
        std::lock_guard<std::mutex> lk(client_ev.m);
        client_ev.disconnects++;
        client_ev.cv.notify_all();
    });
    conn->start();

    REQUIRE(server_ev.wait([&] { return server_ev.accepted != nullptr; }));
    CHECK(server_ev.accepted->is_inbound());
    CHECK(server_ev.accepted->remote_address().find("127.0.0.1") != std::string::npos);

    const std::string payload = R"({"jsonrpc":"2.0","method":"node.ping","id":1})";
    REQUIRE(conn->send(payload));
    REQUIRE(client_ev.wait([&] { return !client_ev.frames.empty(); }));
    CHECK(client_ev.frames.front() == payload);

    // Local close: one disconnect on each side, sends refused afterwards
    conn->close();
    REQUIRE(client_ev.wait([&] { return client_ev.disconnects == 1; }));
    REQUIRE(server_ev.wait([&] { return server_ev.disconnects == 1; }));
    CHECK_FALSE(conn->send(payload));

    conn->close();
    std::this_thread::sleep_for(100ms);
    {
        std::lock_guard<std::mutex> lk(client_ev.m);
        CHECK(client_ev.disconnects == 1);
    }

    client.stop();
    server.stop();
}

TEST_CASE("WebSocketTransport rejects an unknown path", "[network][transport][websocket]") {
    WebSocketTransport server(1, "/ws/rpc");
    WebSocketTransport client(1, "/not/here");
    Events client_ev;
    std::atomic<int> accepted{0};

    REQUIRE(server.listen(0, [&](TransportConnectionPtr) { accepted++; }));
    uint16_t port = server.listening_port();
    server.run();
    client.run();

    auto conn = ConnectClient(client, port, client_ev);
    REQUIRE(client_ev.connect_results == 1);
    CHECK_FALSE(client_ev.connect_ok);
    CHECK_FALSE(conn->is_open());
    CHECK(accepted == 0);

    client.stop();
    server.stop();
}

TEST_CASE("WebSocketTransport connect to a closed port fails once", "[network][transport][websocket]") {
    uint16_t port = 0;
    {
        // Bind and release to find a port nothing is listening on
        WebSocketTransport scratch(1);
        REQUIRE(scratch.listen(0, [](TransportConnectionPtr) {}));
        port = scratch.listening_port();
    }

    WebSocketTransport client(1);
    client.run();
    Events ev;
    auto conn = ConnectClient(client, port, ev);
    REQUIRE(ev.connect_results == 1);
    CHECK_FALSE(ev.connect_ok);
    std::this_thread::sleep_for(100ms);
    {
        std::lock_guard<std::mutex> lk(ev.m);
        CHECK(ev.connect_results == 1);
    }
    client.stop();
}

TEST_CASE("WebSocketTransport send-queue overflow closes connection (test override)", "[network][transport][websocket][send-queue]") {
    WebSocketTransport server(1);
    WebSocketTransport client(1);
    Events client_ev;

    REQUIRE(server.listen(0, [](TransportConnectionPtr c) { c->start(); }));
    uint16_t port = server.listening_port();
    server.run();
    client.run();

    auto conn = ConnectClient(client, port, client_ev);
    REQUIRE(client_ev.connect_ok);
    conn->set_disconnect_callback([&client_ev]() {
        std::lock_guard<std::mutex> lk(client_ev.m);
        client_ev.disconnects++;
        client_ev.cv.notify_all();
    });
    conn->start();

    WebSocketConnection::SetSendQueueLimitForTest(64);
    CHECK(conn->send(std::string(1024, 'x')));
    REQUIRE(client_ev.wait([&] { return client_ev.disconnects == 1; }));
    CHECK_FALSE(conn->is_open());
    WebSocketConnection::ResetSendQueueLimitForTest();

    client.stop();
    server.stop();
}

TEST_CASE("WebSocketTransport drops a silent client after the handshake timeout", "[network][transport][websocket][timeout]") {
    WebSocketConnection::SetHandshakeTimeoutForTest(200ms);
    WebSocketTransport server(1);
    std::atomic<int> accepted{0};
    REQUIRE(server.listen(0, [&](TransportConnectionPtr) { accepted++; }));
    uint16_t port = server.listening_port();
    server.run();

    // Plain TCP client that never sends the upgrade request
    boost::asio::io_context io;
    boost::asio::ip::tcp::socket raw(io);
    raw.connect({boost::asio::ip::make_address("127.0.0.1"), port});

    auto start = std::chrono::steady_clock::now();
    char byte;
    boost::system::error_code ec;
    raw.read_some(boost::asio::buffer(&byte, 1), ec);

    CHECK(ec);
    CHECK(std::chrono::steady_clock::now() - start < 3000ms);
    CHECK(accepted == 0);

    WebSocketConnection::ResetHandshakeTimeoutForTest();
    server.stop();
}

TEST_CASE("NodeHub end to end over WebSocket", "[network][transport][websocket][hub]") {
    teleophub::store::MemoryNodeStore node_store;
    auto transport = std::make_shared<WebSocketTransport>(1);
    NodeHub::Config config;
    config.listen_port = 0;
    config.default_call_timeout = 3000ms;
    NodeHub hub(config, node_store, transport);
    REQUIRE(hub.start());
    uint16_t port = transport->listening_port();
    REQUIRE(port != 0);

    // Minimal node: registers, then answers node.ping
    WebSocketTransport node_transport(1);
    node_transport.run();
    Events ev;
    auto conn = ConnectClient(node_transport, port, ev);
    REQUIRE(ev.connect_ok);

    std::weak_ptr<TransportConnection> weak = conn;
    conn->set_receive_callback([weak, &ev](const std::string& frame) {
        auto self = weak.lock();
        if (!self) return;
        json msg = json::parse(frame);
        if (msg.contains("method") && msg["method"] == "node.ping") {
            self->send(jsonrpc::Serialize(jsonrpc::MakeResult(msg["id"], json{{"pong", true}})));
            return;
        }
        std::lock_guard<std::mutex> lk(ev.m);
        ev.frames.push_back(frame);
        ev.cv.notify_all();
    });
    conn->start();
    REQUIRE(conn->send(jsonrpc::Serialize(
        jsonrpc::MakeRequest("backend.register", json{{"uuid", "ws-node"}}, 1))));

    REQUIRE(ev.wait([&] { return !ev.frames.empty(); }));
    json reply;
    {
        std::lock_guard<std::mutex> lk(ev.m);
        reply = json::parse(ev.frames.front());
    }
    REQUIRE(reply["id"] == 1);
    NodeKey key = reply["result"]["id"].get<NodeKey>();
    REQUIRE(hub.gateway().IsConnected(key));

    json result = hub.gateway().Call(key, "node.ping");
    CHECK(result["pong"] == true);

    // Node goes away; hub notices
    conn->close();
    REQUIRE(WaitFor([&] { return !hub.gateway().IsConnected(key); }, 3000ms));
    REQUIRE(WaitFor([&] { return hub.session_count() == 0; }, 3000ms));
    REQUIRE_THROWS_AS(hub.gateway().Call(key, "node.ping"), NotConnectedError);

    node_transport.stop();
    hub.stop();
}
