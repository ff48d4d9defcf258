/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/dnssd/mock/dnssd_mock_browser.hpp"
#include "nmoskit/nmos/detail/nmos_registry_browser.hpp"

#include <catch2/catch_all.hpp>

namespace {

const nmk::dnssd::TxtRecord k_valid_txt {
    {"api_proto", "http"},
    {"api_ver", "v1.3"},
    {"api_auth", "false"},
    {"pri", "100"},
};

}  // namespace

TEST_CASE("nmk::nmos::RegistryBrowser") {
    boost::asio::io_context io_context;
    auto mock_browser = std::make_unique<nmk::dnssd::MockBrowser>(io_context);
    auto* mock = mock_browser.get();
    nmk::nmos::RegistryBrowser browser(std::move(mock_browser));

    std::vector<nmk::nmos::RegistryCandidate> resolved;
    std::vector<std::string> rejected;
    std::vector<std::string> removed;
    std::vector<std::string> errors;

    browser.on_candidate_resolved = [&](const nmk::nmos::RegistryCandidate& candidate) {
        resolved.push_back(candidate);
    };
    browser.on_candidate_rejected = [&](const std::string& service_name) {
        rejected.push_back(service_name);
    };
    browser.on_candidate_removed = [&](const std::string& service_name) {
        removed.push_back(service_name);
    };
    browser.on_error = [&](const std::string& error_message) {
        errors.push_back(error_message);
    };

    browser.start({nmk::nmos::ApiVersion::v1_2(), nmk::nmos::ApiVersion::v1_3()});

    SECTION("Browses for both registration service types") {
        REQUIRE(mock->is_browsing_for("_nmos-register._tcp."));
        REQUIRE(mock->is_browsing_for("_nmos-registration._tcp."));
    }

    SECTION("Discover mdns service") {
        mock->mock_discovered_service("registry", "registry_name", "_nmos-register._tcp", "local");
        mock->mock_resolved_service("registry", "registry.local.", 1234, k_valid_txt);

        io_context.run();

        REQUIRE(resolved.size() == 1);
        REQUIRE(resolved[0].service_name == "registry");
        REQUIRE(resolved[0].host == "registry.local.");
        REQUIRE(resolved[0].port == 1234);
        REQUIRE(resolved[0].priority == 100);
        REQUIRE(resolved[0].api_version == nmk::nmos::ApiVersion::v1_3());
        REQUIRE(rejected.empty());
    }

    SECTION("Discover legacy mdns service") {
        mock->mock_discovered_service("legacy", "legacy_name", "_nmos-registration._tcp", "local");
        mock->mock_resolved_service("legacy", "legacy.local.", 80, k_valid_txt);
        io_context.run();
        REQUIRE(resolved.size() == 1);
    }

    SECTION("Re-resolving reports the candidate again") {
        mock->mock_discovered_service("registry", "registry_name", "_nmos-register._tcp", "local");
        mock->mock_resolved_service("registry", "registry.local.", 1234, k_valid_txt);
        mock->mock_resolved_service("registry", "registry.local.", 4321, k_valid_txt);
        io_context.run();
        REQUIRE(resolved.size() == 2);
        REQUIRE(resolved[1].port == 4321);
    }

    SECTION("Don't accept invalid services") {
        auto txt = k_valid_txt;

        SECTION("Invalid proto") {
            txt["api_proto"] = "https";
        }

        SECTION("Unsupported api_ver") {
            txt["api_ver"] = "v1.1";
        }

        SECTION("Authorization required") {
            txt["api_auth"] = "true";
        }

        SECTION("Invalid pri") {
            txt["pri"] = "n/a";
        }

        SECTION("Missing pri") {
            txt.erase("pri");
        }

        mock->mock_discovered_service("invalid", "invalid_name", "_nmos-register._tcp", "local");
        mock->mock_resolved_service("invalid", "invalid.local.", 1234, txt);
        io_context.run();

        REQUIRE(resolved.empty());
        REQUIRE(rejected == std::vector<std::string> {"invalid"});
    }

    SECTION("Removed service") {
        mock->mock_discovered_service("registry", "registry_name", "_nmos-register._tcp", "local");
        mock->mock_resolved_service("registry", "registry.local.", 1234, k_valid_txt);
        mock->mock_removed_service("registry");
        io_context.run();
        REQUIRE(removed == std::vector<std::string> {"registry"});
    }

    SECTION("Browse errors are reported and browsing continues") {
        mock->mock_browse_error("Daemon not running");
        mock->mock_discovered_service("registry", "registry_name", "_nmos-register._tcp", "local");
        mock->mock_resolved_service("registry", "registry.local.", 1234, k_valid_txt);
        io_context.run();
        REQUIRE(errors == std::vector<std::string> {"Daemon not running"});
        REQUIRE(resolved.size() == 1);
    }

    SECTION("Starting twice reports an error") {
        browser.start({nmk::nmos::ApiVersion::v1_3()});
        REQUIRE(errors.size() == 2);
    }

    SECTION("Stop and start again") {
        browser.stop();
        REQUIRE_FALSE(mock->is_browsing_for("_nmos-register._tcp."));
        browser.start({nmk::nmos::ApiVersion::v1_3()});
        REQUIRE(mock->is_browsing_for("_nmos-register._tcp."));
        REQUIRE(errors.empty());
    }
}

TEST_CASE("nmk::nmos::RegistryBrowser | Without DNS-SD implementation") {
    nmk::nmos::RegistryBrowser browser(std::unique_ptr<nmk::dnssd::Browser> {});
    std::vector<std::string> errors;
    browser.on_error = [&](const std::string& error_message) {
        errors.push_back(error_message);
    };
    browser.start({nmk::nmos::ApiVersion::v1_3()});
    REQUIRE(errors.size() == 1);
    browser.stop();
}
