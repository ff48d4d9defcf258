/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/nmos/models/nmos_api_error.hpp"

#include <boost/json/serialize.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("nmk::nmos::ApiError") {
    nmk::nmos::ApiError error;
    error.code = 404;
    error.error = "Not found";
    error.debug = "The requested resource was not found";

    const auto json = boost::json::serialize(boost::json::value_from(error));
    REQUIRE(json == R"({"code":404,"error":"Not found","debug":"The requested resource was not found"})");
}
