/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/core/string_parser.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("nmk::StringParser | split") {
    SECTION("Key value pairs") {
        const auto str = "key1=value1;key2=value2";
        nmk::StringParser parser(str);
        REQUIRE(parser.split('=') == "key1");
        REQUIRE(parser.split(';') == "value1");
        REQUIRE(parser.split('=') == "key2");
        REQUIRE(parser.split(';') == "value2");
        REQUIRE_FALSE(parser.split(';').has_value());
        REQUIRE(parser.exhausted());
    }

    SECTION("Consecutive delimiters produce empty sections") {
        nmk::StringParser parser("a//b");
        REQUIRE(parser.split('/') == "a");
        REQUIRE(parser.split('/') == "");
        REQUIRE(parser.split('/') == "b");
        REQUIRE_FALSE(parser.split('/').has_value());
    }

    SECTION("Delimiter not found") {
        nmk::StringParser parser("0.1.2.3");
        REQUIRE(parser.split('4') == "0.1.2.3");
        REQUIRE(parser.exhausted());
    }
}

TEST_CASE("nmk::StringParser | read_int") {
    SECTION("Seconds and nanoseconds") {
        nmk::StringParser parser("1439299836:10");
        REQUIRE(parser.read_int<uint64_t>() == 1439299836);
        REQUIRE(parser.skip(':'));
        REQUIRE(parser.read_int<uint32_t>() == 10);
        REQUIRE(parser.exhausted());
    }

    SECTION("Nothing is consumed on failure") {
        nmk::StringParser parser("abc");
        REQUIRE_FALSE(parser.read_int<int>().has_value());
        REQUIRE(parser.read_until_end() == "abc");
    }

    SECTION("Unsigned doesn't accept a sign") {
        nmk::StringParser parser("-5");
        REQUIRE_FALSE(parser.read_int<uint32_t>().has_value());
    }
}

TEST_CASE("nmk::StringParser | skip") {
    nmk::StringParser parser("v1.3");
    REQUIRE_FALSE(parser.skip("x"));
    REQUIRE(parser.skip("v1"));
    REQUIRE_FALSE(parser.skip('x'));
    REQUIRE(parser.skip('.'));
    REQUIRE(parser.read_until_end() == "3");
    REQUIRE_FALSE(parser.read_until_end().has_value());
}
