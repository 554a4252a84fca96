#pragma once

// Shared wiring for node-facing unit tests: the same components NodeHub owns,
// connected to in-memory mock connections instead of WebSockets.

#include "network/connection_registry.hpp"
#include "network/jsonrpc.hpp"
#include "network/node_gateway.hpp"
#include "network/node_registration.hpp"
#include "network/node_session.hpp"
#include "network/request_correlator.hpp"
#include "network/request_dispatcher.hpp"
#include "network/infra/mock_transport.hpp"
#include "store/node_store.hpp"
#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

namespace teleophub {
namespace test {

using json = nlohmann::json;
using namespace teleophub::network;
using teleophub::store::MemoryNodeStore;

// Poll until pred() holds or the timeout expires
inline bool WaitFor(const std::function<bool()>& pred,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

struct TestNode {
    MockConnectionPtr conn;
    NodeSessionPtr session;
};

class NodeFixture {
public:
    explicit NodeFixture(NodeSession::Options options = {},
                         std::chrono::milliseconds call_timeout = std::chrono::milliseconds(2000))
        : options_(options),
          registration_(node_store),
          gateway(registry, correlator, call_timeout) {
        registration_.Install(dispatcher);
    }

    // Accept a new connection and start its session
    TestNode Connect() {
        TestNode node;
        node.conn = std::make_shared<MockTransportConnection>();
        node.session = NodeSession::Create(node.conn, registry, correlator, dispatcher, options_);
        node.session->Start();
        return node;
    }

    // Node sends backend.register; returns the reply envelope
    json Register(TestNode& node, const std::string& uuid, int request_id = 1) {
        node.conn->simulate_receive(jsonrpc::Serialize(
            jsonrpc::MakeRequest("backend.register", json{{"uuid", uuid}}, request_id)));
        return json::parse(node.conn->last_sent_message());
    }

    // Connect and register in one step
    TestNode ConnectAndRegister(const std::string& uuid) {
        TestNode node = Connect();
        Register(node, uuid);
        return node;
    }

    // Node answers every call with result_for(method, params)
    static void AutoReply(const MockConnectionPtr& conn,
                          std::function<json(const std::string&, const json&)> result_for) {
        std::weak_ptr<MockTransportConnection> weak = conn;
        conn->set_send_hook([weak, result_for](const std::string& frame) {
            auto self = weak.lock();
            if (!self) return;
            json req = json::parse(frame);
            if (!req.contains("id")) return;  // notification
            self->simulate_receive(jsonrpc::Serialize(jsonrpc::MakeResult(
                req["id"], result_for(req["method"].get<std::string>(), req["params"]))));
        });
    }

    MemoryNodeStore node_store;
    ConnectionRegistry registry;
    RequestCorrelator correlator;
    RequestDispatcher dispatcher;

private:
    NodeSession::Options options_;
    NodeRegistration registration_;

public:
    NodeGateway gateway;
};

} // namespace test
} // namespace teleophub
