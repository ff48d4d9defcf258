/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/dnssd/dnssd_service_tracker.hpp"

#include <catch2/catch_all.hpp>

#include <tuple>

namespace {

nmk::dnssd::ServiceDescription make_registry_description() {
    nmk::dnssd::ServiceDescription description;
    description.fullname = "registry._nmos-register._tcp.local.";
    description.name = "registry";
    description.reg_type = "_nmos-register._tcp.";
    description.domain = "local.";
    return description;
}

}  // namespace

TEST_CASE("nmk::dnssd::ServiceTracker") {
    using namespace std::chrono_literals;
    using Clock = nmk::dnssd::ServiceTracker::Clock;

    constexpr auto k_timeout = 5s;
    constexpr auto k_retry = 10s;
    const auto fullname = std::string("registry._nmos-register._tcp.local.");
    const auto t0 = Clock::time_point {};

    nmk::dnssd::ServiceTracker tracker(k_timeout, k_retry);
    const auto description = make_registry_description();

    SECTION("Service on several interfaces is removed only after it left all of them") {
        const auto first = tracker.add(description, 2, t0);
        REQUIRE(first.discovered);
        REQUIRE(first.resolve);

        const auto second = tracker.add(description, 3, t0);
        REQUIRE_FALSE(second.discovered);
        REQUIRE(second.resolve);

        REQUIRE_FALSE(tracker.remove(fullname, 2).has_value());
        REQUIRE(tracker.size() == 1);
        REQUIRE(tracker.find(fullname) != nullptr);

        const auto removed = tracker.remove(fullname, 3);
        REQUIRE(removed.has_value());
        REQUIRE(removed->fullname == fullname);
        REQUIRE(tracker.size() == 0);
        REQUIRE(tracker.find(fullname) == nullptr);
    }

    SECTION("Repeated announcement on the same interface does nothing") {
        std::ignore = tracker.add(description, 2, t0);
        const auto again = tracker.add(description, 2, t0 + 1s);
        REQUIRE_FALSE(again.discovered);
        REQUIRE_FALSE(again.resolve);
    }

    SECTION("Removal from an unknown interface keeps the service") {
        std::ignore = tracker.add(description, 2, t0);
        REQUIRE_FALSE(tracker.remove(fullname, 7).has_value());
        REQUIRE_FALSE(tracker.remove("other._nmos-register._tcp.local.", 2).has_value());
        REQUIRE(tracker.size() == 1);
    }

    SECTION("Each interface is resolved on its own") {
        std::ignore = tracker.add(description, 2, t0);
        std::ignore = tracker.add(description, 3, t0);

        const auto resolved = tracker.resolved({fullname, 3}, "registry.local.", 8080, {{"pri", "10"}});
        REQUIRE(resolved.has_value());
        REQUIRE(resolved->host_target == "registry.local.");
        REQUIRE(resolved->port == 8080);
        REQUIRE(resolved->txt.at("pri") == "10");
        REQUIRE(resolved->interface_index == 3);

        REQUIRE(tracker.is_resolved({fullname, 3}));
        REQUIRE_FALSE(tracker.is_resolved({fullname, 2}));

        // Only the unresolved interface times out
        const auto expired = tracker.expired(t0 + k_timeout);
        REQUIRE(expired.size() == 1);
        REQUIRE(expired.front() == nmk::dnssd::ServiceTracker::Key {fullname, 2});
    }

    SECTION("Result for an unknown interface is ignored") {
        std::ignore = tracker.add(description, 2, t0);
        REQUIRE_FALSE(tracker.resolved({fullname, 4}, "registry.local.", 8080, {}).has_value());
    }

    SECTION("Resolve times out and is retried after the retry interval") {
        std::ignore = tracker.add(description, 2, t0);

        REQUIRE(tracker.expired(t0 + k_timeout - 1s).empty());
        REQUIRE(tracker.expired(t0 + k_timeout).size() == 1);
        REQUIRE(tracker.expired(t0 + k_timeout + 1s).empty());

        REQUIRE(tracker.due_for_retry(t0 + k_timeout + k_retry - 1s).empty());
        const auto retry = tracker.due_for_retry(t0 + k_timeout + k_retry);
        REQUIRE(retry.size() == 1);
        REQUIRE(retry.front() == nmk::dnssd::ServiceTracker::Key {fullname, 2});

        // The retried resolve can succeed
        REQUIRE(tracker.resolved({fullname, 2}, "registry.local.", 80, {}).has_value());
        REQUIRE(tracker.is_resolved({fullname, 2}));
        REQUIRE(tracker.expired(t0 + 1h).empty());
        REQUIRE(tracker.due_for_retry(t0 + 1h).empty());
    }

    SECTION("Timed out resolve restarts when the service is announced again") {
        std::ignore = tracker.add(description, 2, t0);
        REQUIRE(tracker.expired(t0 + k_timeout).size() == 1);

        const auto again = tracker.add(description, 2, t0 + k_timeout + 1s);
        REQUIRE_FALSE(again.discovered);
        REQUIRE(again.resolve);

        // The restarted resolve is not due for retry but gets a fresh timeout
        REQUIRE(tracker.due_for_retry(t0 + k_timeout + k_retry).empty());
        REQUIRE(tracker.expired(t0 + k_timeout + 1s + k_timeout).size() == 1);
    }

    SECTION("Failed resolve is retried") {
        std::ignore = tracker.add(description, 2, t0);
        tracker.resolve_failed({fullname, 2}, t0 + 1s);

        REQUIRE(tracker.expired(t0 + 1h).empty());
        REQUIRE(tracker.due_for_retry(t0 + 1s + k_retry).size() == 1);

        tracker.resolve_failed({fullname, 2}, t0 + 20s);
        const auto again = tracker.add(description, 2, t0 + 21s);
        REQUIRE(again.resolve);
    }

    SECTION("Service returns after removal") {
        std::ignore = tracker.add(description, 2, t0);
        REQUIRE(tracker.remove(fullname, 2).has_value());
        const auto result = tracker.add(description, 2, t0 + 1s);
        REQUIRE(result.discovered);
        REQUIRE(result.resolve);
    }

    SECTION("Clear forgets all services") {
        std::ignore = tracker.add(description, 2, t0);
        tracker.clear();
        REQUIRE(tracker.size() == 0);
        REQUIRE(tracker.expired(t0 + 1h).empty());
    }
}
