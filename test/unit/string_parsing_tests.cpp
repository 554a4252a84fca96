// Unit tests for string parsing utilities
#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include <limits>
#include <nlohmann/json.hpp>

using namespace teleophub::util;

TEST_CASE("SafeParseInt - valid inputs", "[util][string_parsing]") {
    SECTION("Parse valid positive integer") {
        auto result = SafeParseInt("42", 0, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("Parse valid negative integer") {
        auto result = SafeParseInt("-50", -100, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == -50);
    }

    SECTION("Parse at bounds") {
        REQUIRE(SafeParseInt("0", 0, 100) == 0);
        REQUIRE(SafeParseInt("100", 0, 100) == 100);
    }
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("x42", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
    REQUIRE_FALSE(SafeParseInt("3.5", 0, 100).has_value());
}

TEST_CASE("SafeParseInt64 - node keys", "[util][string_parsing]") {
    const int64_t max = std::numeric_limits<int64_t>::max();

    SECTION("Large keys parse") {
        auto result = SafeParseInt64("9223372036854775807", 1, max);
        REQUIRE(result.has_value());
        REQUIRE(*result == max);
    }

    SECTION("Overflow is rejected") {
        REQUIRE_FALSE(SafeParseInt64("9223372036854775808", 1, max).has_value());
    }

    SECTION("Zero is below the key range") {
        REQUIRE_FALSE(SafeParseInt64("0", 1, max).has_value());
    }
}

TEST_CASE("SafeParsePort", "[util][string_parsing]") {
    REQUIRE(SafeParsePort("8000") == uint16_t(8000));
    REQUIRE(SafeParsePort("1") == uint16_t(1));
    REQUIRE(SafeParsePort("65535") == uint16_t(65535));
    REQUIRE_FALSE(SafeParsePort("0").has_value());
    REQUIRE_FALSE(SafeParsePort("65536").has_value());
    REQUIRE_FALSE(SafeParsePort("-1").has_value());
    REQUIRE_FALSE(SafeParsePort("80a").has_value());
}

TEST_CASE("SplitList", "[util][string_parsing]") {
    SECTION("Comma separated") {
        auto items = SplitList("network,rpc,store");
        REQUIRE(items == std::vector<std::string>{"network", "rpc", "store"});
    }

    SECTION("Empty items are dropped") {
        auto items = SplitList(",network,,rpc,");
        REQUIRE(items == std::vector<std::string>{"network", "rpc"});
    }

    SECTION("Empty string") {
        REQUIRE(SplitList("").empty());
    }

    SECTION("Custom separator") {
        auto items = SplitList("a:b", ':');
        REQUIRE(items == std::vector<std::string>{"a", "b"});
    }
}

TEST_CASE("JsonError", "[util][string_parsing]") {
    SECTION("Produces a newline terminated error object") {
        std::string reply = JsonError("Invalid node key");
        REQUIRE(reply.back() == '\n');
        auto j = nlohmann::json::parse(reply);
        REQUIRE(j["error"] == "Invalid node key");
    }

    SECTION("Quotes and control characters are escaped") {
        auto j = nlohmann::json::parse(JsonError("bad \"value\"\n"));
        REQUIRE(j["error"] == "bad \"value\"\n");
    }

    SECTION("Invalid UTF-8 does not throw") {
        std::string reply;
        REQUIRE_NOTHROW(reply = JsonError(std::string("bad \xff byte")));
        REQUIRE_FALSE(reply.empty());
    }
}
