// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Typed node command wrappers

#include <catch2/catch_test_macros.hpp>
#include "network/node_commands.hpp"
#include "network/node_test_fixture.hpp"
#include "network/rpc_errors.hpp"
#include <mutex>
#include <vector>

using namespace teleophub::test;
using namespace std::chrono_literals;

namespace {

// Scripted node: answers each method from a table, recording what it was asked
struct ScriptedNode {
    json answers = json::object();
    std::vector<json> requests;
    std::mutex mutex;

    void Attach(const MockConnectionPtr& conn) {
        NodeFixture::AutoReply(conn, [this](const std::string& method, const json& params) {
            std::lock_guard<std::mutex> lock(mutex);
            requests.push_back(json{{"method", method}, {"params", params}});
            return answers.contains(method) ? answers[method] : json(nullptr);
        });
    }

    json LastRequest() {
        std::lock_guard<std::mutex> lock(mutex);
        return requests.empty() ? json() : requests.back();
    }
};

} // namespace

TEST_CASE("NodeCommands - queries", "[network][commands]") {
    NodeFixture fx;
    TestNode node = fx.ConnectAndRegister("uuid-a");
    NodeKey key = *node.session->GetNodeKey();
    NodeCommands commands(fx.gateway);
    ScriptedNode script;
    script.Attach(node.conn);

    SECTION("GetRpcMethods returns the method list") {
        script.answers["node.get_rpc_methods"] = {{"methods", {"node.ping", "node.test_device"}}};
        json methods = commands.GetRpcMethods(key);
        REQUIRE(methods == json::parse(R"(["node.ping","node.test_device"])"));
        REQUIRE(script.LastRequest()["method"] == "node.get_rpc_methods");
    }

    SECTION("GetRpcMethods rejects a result without methods") {
        script.answers["node.get_rpc_methods"] = {{"list", json::array()}};
        REQUIRE_THROWS_AS(commands.GetRpcMethods(key), ProtocolError);

        script.answers["node.get_rpc_methods"] = "methods";
        REQUIRE_THROWS_AS(commands.GetRpcMethods(key), ProtocolError);
    }

    SECTION("Device types and categories") {
        script.answers["node.get_device_types"] =
            json::parse(R"({"joystick":{"gamepad":{}},"camera":{"usb":{},"rtsp":{}}})");

        json types = commands.GetDeviceTypes(key);
        REQUIRE(types["camera"].contains("rtsp"));

        std::vector<std::string> expected = {"camera", "joystick"};
        REQUIRE(commands.GetDeviceCategories(key) == expected);
    }

    SECTION("Device categories require an object") {
        script.answers["node.get_device_types"] = json::array({"camera"});
        REQUIRE_THROWS_AS(commands.GetDeviceCategories(key), ProtocolError);
    }

    SECTION("Teleop group types pass through") {
        script.answers["node.get_teleop_group_types"] = {{"basic", {{"devices", 2}}}};
        REQUIRE(commands.GetTeleopGroupTypes(key)["basic"]["devices"] == 2);
    }
}

TEST_CASE("NodeCommands - actions require success", "[network][commands]") {
    NodeFixture fx;
    TestNode node = fx.ConnectAndRegister("uuid-a");
    NodeKey key = *node.session->GetNodeKey();
    NodeCommands commands(fx.gateway);
    ScriptedNode script;
    script.Attach(node.conn);

    SECTION("TestDevice sends category, type and config") {
        script.answers["node.test_device"] = {{"success", true}, {"latency_ms", 12}};
        json result = commands.TestDevice(key, "camera", "usb", json{{"index", 0}});

        REQUIRE(result["latency_ms"] == 12);
        json sent = script.LastRequest();
        REQUIRE(sent["method"] == "node.test_device");
        REQUIRE(sent["params"] == json::parse(R"({"category":"camera","type":"usb","config":{"index":0}})"));
    }

    SECTION("TestDevice failure") {
        script.answers["node.test_device"] = {{"success", false}, {"error", "no device"}};
        REQUIRE_THROWS_AS(commands.TestDevice(key, "camera", "usb", json::object()),
                          CommandRejectedError);
    }

    SECTION("Missing or non-boolean success is a rejection") {
        script.answers["node.start_teleop_group"] = json::object();
        REQUIRE_THROWS_AS(commands.StartTeleopGroup(key, 5), CommandRejectedError);

        script.answers["node.start_teleop_group"] = {{"success", "yes"}};
        REQUIRE_THROWS_AS(commands.StartTeleopGroup(key, 5), CommandRejectedError);
    }

    SECTION("Start and stop teleop group") {
        script.answers["node.start_teleop_group"] = {{"success", true}};
        script.answers["node.stop_teleop_group"] = {{"success", true}};

        REQUIRE(commands.StartTeleopGroup(key, 5)["success"] == true);
        REQUIRE(script.LastRequest()["params"] == json{{"id", 5}});

        REQUIRE(commands.StopTeleopGroup(key, 5)["success"] == true);
        REQUIRE(script.LastRequest()["method"] == "node.stop_teleop_group");
    }
}

TEST_CASE("NodeCommands - gateway errors propagate", "[network][commands]") {
    NodeFixture fx({}, 100ms);
    NodeCommands commands(fx.gateway);

    REQUIRE_THROWS_AS(commands.GetRpcMethods(3), NotConnectedError);

    TestNode node = fx.ConnectAndRegister("uuid-a");
    NodeKey key = *node.session->GetNodeKey();
    REQUIRE_THROWS_AS(commands.TestDevice(key, "camera", "usb", json::object()), TimeoutError);
}

TEST_CASE("NodeCommands - notifications", "[network][commands]") {
    NodeFixture fx;
    TestNode node = fx.ConnectAndRegister("uuid-a");
    NodeKey key = *node.session->GetNodeKey();
    NodeCommands commands(fx.gateway);
    node.conn->clear_sent_messages();

    REQUIRE(commands.NotifyConfigUpdate(key));
    REQUIRE(commands.NotifyStartTeleopGroup(key, 8));
    REQUIRE(commands.NotifyStopTeleopGroup(key, 8));

    auto frames = node.conn->get_sent_messages();
    REQUIRE(frames.size() == 3);
    REQUIRE(json::parse(frames[0])["method"] == "node.update_config");
    REQUIRE(json::parse(frames[1])["params"] == json{{"id", 8}});
    REQUIRE(json::parse(frames[2])["method"] == "node.stop_teleop_group");
    for (const auto& frame : frames) {
        REQUIRE_FALSE(json::parse(frame).contains("id"));
    }

    REQUIRE_FALSE(commands.NotifyConfigUpdate(key + 1));
}
