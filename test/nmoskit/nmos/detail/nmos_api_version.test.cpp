/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/nmos/detail/nmos_api_version.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("nmk::nmos::ApiVersion") {
    nmk::nmos::ApiVersion version;

    SECTION("Default constructor") {
        CHECK_FALSE(version.is_valid());
    }

    SECTION("Valid version") {
        version = {1, 0};
        CHECK(version.is_valid());
    }

    SECTION("To string") {
        version = {1, 3};
        CHECK(version.to_string() == "v1.3");
    }

    SECTION("To string with large version") {
        version = {1000, 2000};
        CHECK(version.to_string() == "v1000.2000");
    }

    SECTION("From v1.2") {
        auto v = nmk::nmos::ApiVersion::from_string("v1.2");
        REQUIRE(v.has_value());
        CHECK(v->major == 1);
        CHECK(v->minor == 2);
        CHECK(*v == nmk::nmos::ApiVersion::v1_2());
    }

    SECTION("From v1.2 with leading or trailing spaces") {
        CHECK_FALSE(nmk::nmos::ApiVersion::from_string(" v1.2").has_value());
        CHECK_FALSE(nmk::nmos::ApiVersion::from_string("v1.2 ").has_value());
    }

    SECTION("From incomplete") {
        CHECK_FALSE(nmk::nmos::ApiVersion::from_string("v1.").has_value());
        CHECK_FALSE(nmk::nmos::ApiVersion::from_string("v12").has_value());
        CHECK_FALSE(nmk::nmos::ApiVersion::from_string("1.2").has_value());
        CHECK_FALSE(nmk::nmos::ApiVersion::from_string("v").has_value());
        CHECK_FALSE(nmk::nmos::ApiVersion::from_string("").has_value());
    }

    SECTION("Ordering") {
        CHECK(nmk::nmos::ApiVersion::v1_2() < nmk::nmos::ApiVersion::v1_3());
        CHECK_FALSE(nmk::nmos::ApiVersion::v1_3() < nmk::nmos::ApiVersion::v1_2());
        CHECK(nmk::nmos::ApiVersion {1, 3} < nmk::nmos::ApiVersion {2, 0});
        CHECK(nmk::nmos::ApiVersion::v1_2() != nmk::nmos::ApiVersion::v1_3());
    }
}
