/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/nmos/detail/nmos_time_source.hpp"

#include <catch2/catch_all.hpp>

#include <atomic>
#include <thread>

TEST_CASE("nmk::nmos::TaiClock") {
    nmk::nmos::TaiClock clock;

    SECTION("Now is ahead of UTC") {
        const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        const auto utc_seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count();
        const auto now = clock.now();
        REQUIRE(now.is_valid());
        REQUIRE(now.seconds >= static_cast<uint64_t>(utc_seconds) + 37);
    }

    SECTION("Now never moves backward") {
        auto previous = clock.now();
        for (int i = 0; i < 1000; ++i) {
            const auto now = clock.now();
            REQUIRE(now >= previous);
            previous = now;
        }
    }

    SECTION("Now never moves backward across threads") {
        std::vector<std::thread> threads;
        std::atomic<bool> went_backward {false};
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&] {
                auto previous = clock.now();
                for (int i = 0; i < 1000; ++i) {
                    const auto now = clock.now();
                    if (now < previous) {
                        went_backward = true;
                    }
                    previous = now;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        REQUIRE_FALSE(went_backward);
    }

    SECTION("Shared instance") {
        REQUIRE(&nmk::nmos::TaiClock::instance() == &nmk::nmos::TaiClock::instance());
    }
}
