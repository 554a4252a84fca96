// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/jsonrpc.hpp"

using namespace teleophub::network;
using json = nlohmann::json;

TEST_CASE("ClassifyFrame - requests", "[network][jsonrpc]") {
    SECTION("Request with id") {
        auto frame = jsonrpc::ClassifyFrame(
            R"({"jsonrpc":"2.0","method":"backend.register","params":{"uuid":"u"},"id":1})");
        REQUIRE(frame.kind == jsonrpc::FrameKind::REQUEST);
        REQUIRE(frame.envelope["method"] == "backend.register");
    }

    SECTION("Notification (no id) is still a request") {
        auto frame = jsonrpc::ClassifyFrame(R"({"jsonrpc":"2.0","method":"node.status"})");
        REQUIRE(frame.kind == jsonrpc::FrameKind::REQUEST);
        REQUIRE(jsonrpc::RequestId(frame.envelope).is_null());
    }

    SECTION("Method wins over result") {
        auto frame = jsonrpc::ClassifyFrame(R"({"method":"x","id":1,"result":1})");
        REQUIRE(frame.kind == jsonrpc::FrameKind::REQUEST);
    }

    SECTION("Non-string method is malformed") {
        auto frame = jsonrpc::ClassifyFrame(R"({"method":5,"id":1})");
        REQUIRE(frame.kind == jsonrpc::FrameKind::MALFORMED);
        REQUIRE_FALSE(frame.error.empty());
    }
}

TEST_CASE("ClassifyFrame - responses", "[network][jsonrpc]") {
    SECTION("Result response") {
        auto frame = jsonrpc::ClassifyFrame(R"({"jsonrpc":"2.0","id":3,"result":{"ok":true}})");
        REQUIRE(frame.kind == jsonrpc::FrameKind::RESPONSE);
        REQUIRE(jsonrpc::ResponseId(frame.envelope) == CallId(3));
    }

    SECTION("Error response") {
        auto frame = jsonrpc::ClassifyFrame(
            R"({"jsonrpc":"2.0","id":4,"error":{"code":-32601,"message":"Method not found"}})");
        REQUIRE(frame.kind == jsonrpc::FrameKind::RESPONSE);
    }

    SECTION("Null result still counts as a response") {
        auto frame = jsonrpc::ClassifyFrame(R"({"id":5,"result":null})");
        REQUIRE(frame.kind == jsonrpc::FrameKind::RESPONSE);
    }

    SECTION("Non-integer ids have no ResponseId") {
        auto frame = jsonrpc::ClassifyFrame(R"({"id":"7","result":1})");
        REQUIRE(frame.kind == jsonrpc::FrameKind::RESPONSE);
        REQUIRE_FALSE(jsonrpc::ResponseId(frame.envelope).has_value());
        REQUIRE_FALSE(jsonrpc::ResponseId(json{{"id", 1.5}, {"result", 1}}).has_value());
    }
}

TEST_CASE("ClassifyFrame - malformed input", "[network][jsonrpc]") {
    const char* inputs[] = {
        "",
        "not json",
        "{\"id\":1",
        "[1,2,3]",
        "42",
        "\"string\"",
        "{}",
        R"({"id":1})",
        R"({"result":1})",
    };
    for (const char* input : inputs) {
        INFO(input);
        auto frame = jsonrpc::ClassifyFrame(input);
        CHECK(frame.kind == jsonrpc::FrameKind::MALFORMED);
        CHECK_FALSE(frame.error.empty());
    }
}

TEST_CASE("Envelope builders", "[network][jsonrpc]") {
    SECTION("Request") {
        json req = jsonrpc::MakeRequest("node.ping", json{{"a", 1}}, 9);
        REQUIRE(req["jsonrpc"] == "2.0");
        REQUIRE(req["method"] == "node.ping");
        REQUIRE(req["params"]["a"] == 1);
        REQUIRE(req["id"] == 9);
    }

    SECTION("Null params become an empty object") {
        json req = jsonrpc::MakeRequest("node.ping", nullptr, 1);
        REQUIRE(req["params"] == json::object());
    }

    SECTION("Notification carries no id") {
        json note = jsonrpc::MakeNotification("node.update_config", json::object());
        REQUIRE_FALSE(note.contains("id"));
        REQUIRE(note["method"] == "node.update_config");
    }

    SECTION("Error echoes the id") {
        json err = jsonrpc::MakeError("abc", jsonrpc::METHOD_NOT_FOUND, "Method not found");
        REQUIRE(err["id"] == "abc");
        REQUIRE(err["error"]["code"] == -32601);
        REQUIRE(err["error"]["message"] == "Method not found");
    }

    SECTION("Result with null id") {
        json res = jsonrpc::MakeResult(nullptr, json{{"id", 1}});
        REQUIRE(res["id"].is_null());
        REQUIRE(res["result"]["id"] == 1);
    }

    SECTION("Serialize is compact and tolerates invalid UTF-8") {
        REQUIRE(jsonrpc::Serialize(json{{"a", 1}}) == R"({"a":1})");
        REQUIRE_NOTHROW(jsonrpc::Serialize(json{{"a", std::string("\xff")}}));
    }
}
