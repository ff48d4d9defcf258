/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/core/util/path_matcher.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("nmk::PathMatcher") {
    REQUIRE(nmk::PathMatcher::match("/", "/").value());
    REQUIRE(nmk::PathMatcher::match("/x-nmos", "/x-nmos").value());
    REQUIRE_FALSE(nmk::PathMatcher::match("/x-nmos", "/x-nmo").value());
    REQUIRE(nmk::PathMatcher::match("/x-nmos/", "/x-nmos").value());
    REQUIRE(nmk::PathMatcher::match("/x-nmos", "/x-nmos/").value());
    REQUIRE_FALSE(nmk::PathMatcher::match("/", "/x-nmos").value());
    REQUIRE_FALSE(nmk::PathMatcher::match("/non-existent", "/").value());
    REQUIRE(nmk::PathMatcher::match("/x-nmos/node", "/x-nmos/*").value());
    REQUIRE_FALSE(nmk::PathMatcher::match("/x-nmos/node/v1.3", "/x-nmos/*").value());

    // If path or pattern are empty, return false
    REQUIRE_FALSE(nmk::PathMatcher::match("", "/").value());
    REQUIRE_FALSE(nmk::PathMatcher::match("/", "").value());
    REQUIRE_FALSE(nmk::PathMatcher::match("", "").value());

    SECTION("Parameters") {
        nmk::PathMatcher::Parameters parameters;
        constexpr auto pattern = "/x-nmos/node/{version}/devices/{id}";
        REQUIRE(nmk::PathMatcher::match("/x-nmos/node/v1.3/devices/abc", pattern, &parameters).value());
        REQUIRE(parameters.get("version") != nullptr);
        REQUIRE(*parameters.get("version") == "v1.3");
        REQUIRE(parameters.get("id") != nullptr);
        REQUIRE(*parameters.get("id") == "abc");
        REQUIRE(parameters.get("nonexistent") == nullptr);
    }

    SECTION("Parameter with leading and trailing text") {
        nmk::PathMatcher::Parameters parameters;
        REQUIRE(nmk::PathMatcher::match("/user/abc123def", "/user/abc{id}def", &parameters).value());
        REQUIRE(*parameters.get("id") == "123");
        REQUIRE_FALSE(nmk::PathMatcher::match("/user/ab123def", "/user/abc{id}def", &parameters).value());
    }

    SECTION("Missing parameter section") {
        nmk::PathMatcher::Parameters parameters;
        constexpr auto pattern = "/x-nmos/node/{version}/devices/{id}";
        REQUIRE_FALSE(nmk::PathMatcher::match("/x-nmos/node/v1.3/devices", pattern, &parameters).value());
        REQUIRE_FALSE(nmk::PathMatcher::match("/x-nmos/node/v1.3/devices/", pattern, &parameters).value());
    }

    SECTION("Parameters without storage are an error") {
        REQUIRE(nmk::PathMatcher::match("/user/123", "/user/{id}") == nmk::PathMatcher::Error::invalid_argument);
    }
}
