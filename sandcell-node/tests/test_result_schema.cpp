// test_result_schema.cpp - Result file contract

#include <catch2/catch_test_macros.hpp>
#include <string>

#include "../src/sandbox/result_schema.h"

using namespace sandcell::node::sandbox;

TEST_CASE("Result schema - Version 1", "[sandbox][result]") {
    SECTION("Flat object of numbers") {
        auto doc = ParseResultDocument(R"({"sharpe_ratio": 1.23, "trades": 42})");
        REQUIRE(doc.valid);
        REQUIRE(doc.schema_version == 1);
        REQUIRE(doc.metrics.size() == 2);
        REQUIRE(doc.metrics.at("sharpe_ratio") == 1.23);
        REQUIRE(doc.metrics.at("trades") == 42.0);
    }

    SECTION("Explicit version key is not a metric") {
        auto doc = ParseResultDocument(R"({"schema_version": 1, "pnl": -3.5})");
        REQUIRE(doc.valid);
        REQUIRE(doc.metrics.size() == 1);
        REQUIRE(doc.metrics.count("schema_version") == 0);
    }

    SECTION("An empty object is a valid empty result") {
        auto doc = ParseResultDocument("{}");
        REQUIRE(doc.valid);
        REQUIRE(doc.metrics.empty());
    }
}

TEST_CASE("Result schema - Version 2", "[sandbox][result]") {
    SECTION("Nested metrics") {
        auto doc = ParseResultDocument(R"({"schema_version": 2, "metrics": {"sortino": 2.5}})");
        REQUIRE(doc.valid);
        REQUIRE(doc.schema_version == kResultSchemaLatest);
        REQUIRE(doc.metrics.at("sortino") == 2.5);
    }

    SECTION("Missing metrics object") {
        REQUIRE_FALSE(ParseResultDocument(R"({"schema_version": 2})").valid);
    }

    SECTION("Unknown top-level keys") {
        REQUIRE_FALSE(ParseResultDocument(R"({"schema_version": 2, "metrics": {}, "notes": 1})").valid);
    }
}

TEST_CASE("Result schema - Rejections", "[sandbox][result]") {
    SECTION("Not JSON") {
        auto doc = ParseResultDocument("sharpe=1.2");
        REQUIRE_FALSE(doc.valid);
        REQUIRE_FALSE(doc.error.empty());
    }

    SECTION("Not an object") {
        REQUIRE_FALSE(ParseResultDocument("[1, 2]").valid);
        REQUIRE_FALSE(ParseResultDocument("3.14").valid);
    }

    SECTION("Non-numeric values") {
        REQUIRE_FALSE(ParseResultDocument(R"({"a": "1.0"})").valid);
        REQUIRE_FALSE(ParseResultDocument(R"({"a": true})").valid);
        REQUIRE_FALSE(ParseResultDocument(R"({"a": null})").valid);
        REQUIRE_FALSE(ParseResultDocument(R"({"a": [1]})").valid);
    }

    SECTION("Empty content") {
        REQUIRE_FALSE(ParseResultDocument("").valid);
    }

    SECTION("Oversized content") {
        std::string big = R"({"a": 1, "pad": ")" + std::string(kMaxResultBytes, 'x') + "\"}";
        auto doc = ParseResultDocument(big);
        REQUIRE_FALSE(doc.valid);
    }

    SECTION("Unknown version") {
        REQUIRE_FALSE(ParseResultDocument(R"({"schema_version": 7, "a": 1})").valid);
        REQUIRE_FALSE(ParseResultDocument(R"({"schema_version": "2", "a": 1})").valid);
    }

    SECTION("Versions wider than int do not wrap onto a known version") {
        auto doc = ParseResultDocument(R"({"schema_version": 4294967297, "sharpe_ratio": 1.23})");
        REQUIRE_FALSE(doc.valid);
        REQUIRE(doc.metrics.empty());
        REQUIRE_FALSE(ParseResultDocument(R"({"schema_version": 4294967298, "metrics": {"a": 1}})").valid);
        REQUIRE_FALSE(ParseResultDocument(R"({"schema_version": -4294967295, "a": 1})").valid);
    }
}
