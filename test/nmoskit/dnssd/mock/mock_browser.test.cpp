/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/core/exception.hpp"
#include "nmoskit/dnssd/mock/dnssd_mock_browser.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("nmk::dnssd::MockBrowser") {
    boost::asio::io_context io_context;
    nmk::dnssd::MockBrowser browser(io_context);

    SECTION("Mock discovering and removing service") {
        std::vector<nmk::dnssd::ServiceDescription> discovered_services;
        std::vector<nmk::dnssd::ServiceDescription> removed_services;

        browser.on_service_discovered = [&](const nmk::dnssd::ServiceDescription& desc) {
            discovered_services.push_back(desc);
        };
        browser.on_service_removed = [&](const nmk::dnssd::ServiceDescription& desc) {
            removed_services.push_back(desc);
        };

        browser.browse_for("reg_type");
        browser.mock_discovered_service("fullname", "name", "reg_type", "domain");
        browser.mock_removed_service("fullname");

        io_context.run();

        REQUIRE(discovered_services.size() == 1);
        REQUIRE(discovered_services[0].fullname == "fullname");
        REQUIRE(discovered_services[0].name == "name");
        REQUIRE(discovered_services[0].reg_type == "reg_type.");
        REQUIRE(discovered_services[0].domain == "domain.");

        REQUIRE(removed_services.size() == 1);
        REQUIRE(removed_services[0].fullname == "fullname");
    }

    SECTION("Mock resolving a service") {
        std::vector<nmk::dnssd::ServiceDescription> resolved_services;

        browser.on_service_resolved = [&](const nmk::dnssd::ServiceDescription& desc) {
            resolved_services.push_back(desc);
        };

        browser.browse_for("reg_type");
        browser.mock_discovered_service("fullname", "name", "reg_type", "domain");
        browser.mock_resolved_service("fullname", "host_target", 1234, {{"key", "value"}});

        io_context.run();

        REQUIRE(resolved_services.size() == 1);
        REQUIRE(resolved_services[0].fullname == "fullname");
        REQUIRE(resolved_services[0].host_target == "host_target");
        REQUIRE(resolved_services[0].port == 1234);
        REQUIRE(resolved_services[0].txt.size() == 1);
        REQUIRE(resolved_services[0].txt.at("key") == "value");
    }

    SECTION("Discovering the same service twice is reported once") {
        int discovered_count = 0;
        browser.on_service_discovered = [&](const nmk::dnssd::ServiceDescription&) {
            discovered_count++;
        };

        browser.browse_for("reg_type.");
        browser.mock_discovered_service("fullname", "name", "reg_type.", "domain.");
        browser.mock_discovered_service("fullname", "name", "reg_type.", "domain.");
        io_context.run();

        REQUIRE(discovered_count == 1);
    }

    SECTION("Services of several types are reported with their own type") {
        std::vector<nmk::dnssd::ServiceDescription> discovered_services;
        browser.on_service_discovered = [&](const nmk::dnssd::ServiceDescription& desc) {
            discovered_services.push_back(desc);
        };

        browser.browse_for("reg_type");
        browser.browse_for("reg_type2");
        browser.mock_discovered_service("fullname", "name", "reg_type", "domain");
        browser.mock_discovered_service("fullname2", "name2", "reg_type2", "domain2");
        io_context.run();

        REQUIRE(discovered_services.size() == 2);
        REQUIRE(discovered_services[0].fullname == "fullname");
        REQUIRE(discovered_services[1].fullname == "fullname2");
        REQUIRE(discovered_services[1].reg_type == "reg_type2.");
    }

    SECTION("Removed service can be discovered again") {
        int discovered_count = 0;
        browser.on_service_discovered = [&](const nmk::dnssd::ServiceDescription&) {
            discovered_count++;
        };

        browser.browse_for("reg_type");
        browser.mock_discovered_service("fullname", "name", "reg_type", "domain");
        browser.mock_removed_service("fullname");
        browser.mock_discovered_service("fullname", "name", "reg_type", "domain");
        io_context.run();

        REQUIRE(discovered_count == 2);
    }

    SECTION("Browse error") {
        std::vector<std::string> errors;
        browser.on_browse_error = [&](const std::string& error_message) {
            errors.push_back(error_message);
        };
        browser.mock_browse_error("Daemon not running");
        io_context.run();
        REQUIRE(errors == std::vector<std::string> {"Daemon not running"});
    }

    SECTION("Browsing twice for the same type throws") {
        browser.browse_for("reg_type");
        REQUIRE(browser.is_browsing_for("reg_type."));
        REQUIRE_THROWS_AS(browser.browse_for("reg_type."), nmk::Exception);
    }

    SECTION("Stop allows browsing again") {
        browser.browse_for("reg_type");
        browser.stop();
        REQUIRE_FALSE(browser.is_browsing_for("reg_type"));
        REQUIRE_NOTHROW(browser.browse_for("reg_type"));
    }

    SECTION("Mock discovering a service error cases") {
        browser.mock_discovered_service("fullname", "name", "reg_type", "domain");
        REQUIRE_THROWS(io_context.run());
    }

    SECTION("Mock resolving a service error cases") {
        browser.mock_resolved_service("fullname", "host_target", 1234, {});
        REQUIRE_THROWS(io_context.run());
    }

    SECTION("Mock removing a service error cases") {
        browser.mock_removed_service("fullname");
        REQUIRE_THROWS(io_context.run());
    }
}
