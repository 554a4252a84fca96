// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/request_correlator.hpp"
#include "network/jsonrpc.hpp"
#include "network/rpc_errors.hpp"
#include <chrono>
#include <set>
#include <thread>

using namespace teleophub::network;
using json = nlohmann::json;
using namespace std::chrono_literals;

TEST_CASE("RequestCorrelator - call ids", "[network][correlator]") {
    RequestCorrelator correlator;

    SECTION("Per-node counter starts at 1") {
        auto a = correlator.BeginCall(7, "node.ping");
        auto b = correlator.BeginCall(7, "node.ping");
        auto c = correlator.BeginCall(8, "node.ping");
        REQUIRE(a.call_id == 1);
        REQUIRE(b.call_id == 2);
        REQUIRE(c.call_id == 1);
        REQUIRE(correlator.PendingCount() == 3);
        REQUIRE(correlator.PendingCount(7) == 2);
        REQUIRE(correlator.PendingCount(8) == 1);
    }

    SECTION("Ids are not reused after completion") {
        std::set<CallId> ids;
        for (int i = 0; i < 100; i++) {
            auto ticket = correlator.BeginCall(7);
            ids.insert(ticket.call_id);
            correlator.Abandon(7, ticket.call_id);
        }
        REQUIRE(ids.size() == 100);
        REQUIRE(correlator.PendingCount() == 0);
    }
}

TEST_CASE("RequestCorrelator - resolve", "[network][correlator]") {
    RequestCorrelator correlator;
    auto ticket = correlator.BeginCall(7, "node.get_device_types");

    SECTION("Result is returned") {
        REQUIRE(correlator.Resolve(7, ticket.call_id,
                                   jsonrpc::MakeResult(ticket.call_id, json{{"robot", json::object()}})));
        json result = correlator.AwaitCall(ticket, 1000ms);
        REQUIRE(result == json{{"robot", json::object()}});
        REQUIRE_FALSE(correlator.IsPending(7, ticket.call_id));
    }

    SECTION("Missing result member yields null") {
        correlator.Resolve(7, ticket.call_id, json{{"id", ticket.call_id}, {"result", nullptr}});
        REQUIRE(correlator.AwaitCall(ticket, 1000ms).is_null());
    }

    SECTION("Error envelope throws RemoteError") {
        correlator.Resolve(7, ticket.call_id,
                           jsonrpc::MakeError(ticket.call_id, -32601, "Method not found"));
        try {
            correlator.AwaitCall(ticket, 1000ms);
            FAIL("expected RemoteError");
        } catch (const RemoteError& e) {
            REQUIRE(e.code() == -32601);
            REQUIRE(e.message() == "Method not found");
        }
    }

    SECTION("Error without a code defaults to internal error") {
        correlator.Resolve(7, ticket.call_id,
                           json{{"id", ticket.call_id}, {"error", {{"message", "boom"}}}});
        try {
            correlator.AwaitCall(ticket, 1000ms);
            FAIL("expected RemoteError");
        } catch (const RemoteError& e) {
            REQUIRE(e.code() == jsonrpc::INTERNAL_ERROR);
            REQUIRE(e.message() == "boom");
        }
    }

    SECTION("Duplicate, unknown and foreign replies are dropped") {
        json reply = jsonrpc::MakeResult(ticket.call_id, 1);
        REQUIRE_FALSE(correlator.Resolve(8, ticket.call_id, reply));   // foreign node
        REQUIRE_FALSE(correlator.Resolve(7, 999, reply));              // unknown id
        REQUIRE(correlator.Resolve(7, ticket.call_id, reply));
        REQUIRE_FALSE(correlator.Resolve(7, ticket.call_id, reply));   // duplicate
        REQUIRE(correlator.AwaitCall(ticket, 1000ms) == 1);
    }
}

TEST_CASE("RequestCorrelator - timeout", "[network][correlator]") {
    RequestCorrelator correlator;
    auto ticket = correlator.BeginCall(7, "node.slow");

    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(correlator.AwaitCall(ticket, 100ms), TimeoutError);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(elapsed >= 100ms);
    REQUIRE(correlator.PendingCount() == 0);

    // A late reply finds nothing
    REQUIRE_FALSE(correlator.Resolve(7, ticket.call_id, jsonrpc::MakeResult(ticket.call_id, 1)));
}

TEST_CASE("RequestCorrelator - cancellation", "[network][correlator]") {
    RequestCorrelator correlator;

    SECTION("CancelAll fails only that node's calls") {
        auto a = correlator.BeginCall(7);
        auto b = correlator.BeginCall(7);
        auto other = correlator.BeginCall(8);

        REQUIRE(correlator.CancelAll(7) == 2);
        REQUIRE_THROWS_AS(correlator.AwaitCall(a, 1000ms), DisconnectedError);
        REQUIRE_THROWS_AS(correlator.AwaitCall(b, 1000ms), DisconnectedError);
        REQUIRE(correlator.IsPending(8, other.call_id));
        REQUIRE(correlator.CancelAll(7) == 0);
    }

    SECTION("CancelEverything fails every call") {
        auto a = correlator.BeginCall(7);
        auto b = correlator.BeginCall(8);
        REQUIRE(correlator.CancelEverything() == 2);
        REQUIRE_THROWS_AS(correlator.AwaitCall(a, 1000ms), DisconnectedError);
        REQUIRE_THROWS_AS(correlator.AwaitCall(b, 1000ms), DisconnectedError);
        REQUIRE(correlator.PendingCount() == 0);
    }

    SECTION("Abandon removes without fulfilling") {
        auto a = correlator.BeginCall(7);
        REQUIRE(correlator.Abandon(7, a.call_id));
        REQUIRE_FALSE(correlator.Abandon(7, a.call_id));
        REQUIRE(correlator.PendingCount() == 0);
    }
}

TEST_CASE("RequestCorrelator - replies in reverse order", "[network][correlator][concurrent]") {
    RequestCorrelator correlator;
    auto first = correlator.BeginCall(7, "a");
    auto second = correlator.BeginCall(7, "b");

    json first_result;
    json second_result;
    std::thread t1([&] { first_result = correlator.AwaitCall(first, 2000ms); });
    std::thread t2([&] { second_result = correlator.AwaitCall(second, 2000ms); });

    correlator.Resolve(7, second.call_id, jsonrpc::MakeResult(second.call_id, "second"));
    correlator.Resolve(7, first.call_id, jsonrpc::MakeResult(first.call_id, "first"));

    t1.join();
    t2.join();
    REQUIRE(first_result == "first");
    REQUIRE(second_result == "second");
    REQUIRE(correlator.PendingCount() == 0);
}

TEST_CASE("RequestCorrelator - reply racing the deadline resolves exactly once", "[network][correlator][concurrent]") {
    RequestCorrelator correlator;

    for (int i = 0; i < 50; i++) {
        auto ticket = correlator.BeginCall(7);
        CallId id = ticket.call_id;
        std::thread responder([&correlator, id] {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            correlator.Resolve(7, id, jsonrpc::MakeResult(id, "ok"));
        });

        // Either outcome is fine; what matters is exactly one and no leak
        try {
            REQUIRE(correlator.AwaitCall(ticket, std::chrono::milliseconds(2)) == "ok");
        } catch (const TimeoutError&) {
        }
        responder.join();
        REQUIRE_FALSE(correlator.IsPending(7, id));
    }
    REQUIRE(correlator.PendingCount() == 0);
}
