/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/core/log.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("nmk::set_log_level") {
    const auto previous_level = spdlog::get_level();

    SECTION("Known levels in any case") {
        nmk::set_log_level("DEBUG");
        REQUIRE(spdlog::get_level() == spdlog::level::debug);
        nmk::set_log_level("warn");
        REQUIRE(spdlog::get_level() == spdlog::level::warn);
        nmk::set_log_level("Critical");
        REQUIRE(spdlog::get_level() == spdlog::level::critical);
        nmk::set_log_level("off");
        REQUIRE(spdlog::get_level() == spdlog::level::off);
    }

    SECTION("Unknown level selects info") {
        nmk::set_log_level("trace");
        nmk::set_log_level("verbose");
        REQUIRE(spdlog::get_level() == spdlog::level::info);
        nmk::set_log_level("");
        REQUIRE(spdlog::get_level() == spdlog::level::info);
    }

    spdlog::set_level(previous_level);
}
