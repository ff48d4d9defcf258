/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/dnssd/dnssd_service_description.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("nmk::dnssd::ServiceDescription") {
    nmk::dnssd::ServiceDescription desc;
    desc.fullname = "registry._nmos-register._tcp.local.";
    desc.name = "registry";
    desc.reg_type = "_nmos-register._tcp.";
    desc.domain = "local.";
    desc.host_target = "registry.local.";
    desc.port = 8080;
    desc.txt = {{"pri", "10"}, {"api_ver", "v1.3"}};

    SECTION("Equality") {
        auto other = desc;
        REQUIRE(other == desc);
        other.txt["pri"] = "20";
        REQUIRE(other != desc);
    }

    SECTION("to_string contains the relevant fields") {
        const auto str = desc.to_string();
        REQUIRE(str.find("registry._nmos-register._tcp.local.") != std::string::npos);
        REQUIRE(str.find("registry.local.") != std::string::npos);
        REQUIRE(str.find("8080") != std::string::npos);
        REQUIRE(str.find("pri=10") != std::string::npos);
    }
}
