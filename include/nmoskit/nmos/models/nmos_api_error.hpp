/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include <boost/json/conversion.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>

#include <string>

namespace nmk::nmos {

/**
 * Error body returned by the Node API for 4xx and 5xx responses.
 * https://specs.amwa.tv/is-04/releases/v1.3.3/APIs/schemas/with-refs/error.html
 */
struct ApiError {
    /// HTTP error code
    unsigned code {};

    /// Human readable message which is suitable for user interface display, and helpful to the user
    std::string error;

    /// Debug information which may assist a programmer working with the API
    std::string debug;
};

inline void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const ApiError& error) {
    jv = {
        {"code", error.code},
        {"error", error.error},
        {"debug", error.debug},
    };
}

}  // namespace nmk::nmos
