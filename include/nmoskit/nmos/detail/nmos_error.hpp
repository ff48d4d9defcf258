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

#include <boost/system/result.hpp>
#include <boost/throw_exception.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <ostream>
#include <stdexcept>

namespace nmk::nmos {

/**
 * Errors returned by the fallible NMOS operations. None of them is fatal.
 */
enum class Error {
    /// A resource operation violates a relationship, uniqueness or removal invariant.
    constraint_violation,
    /// The operation references an identifier which is not present.
    not_found,
    /// A resolved registry advertisement carries malformed or unsupported TXT attributes.
    candidate_rejected,
    /// A single discovery poll or resolve failed.
    discovery_transient,
    invalid_api_version,
    invalid_configuration,
    already_started,
    failed_to_start_http_server,
};

/// Overload the output stream operator for the Error enum class
inline std::ostream& operator<<(std::ostream& os, const Error error) {
    switch (error) {
        case Error::constraint_violation:
            os << "constraint_violation";
            break;
        case Error::not_found:
            os << "not_found";
            break;
        case Error::candidate_rejected:
            os << "candidate_rejected";
            break;
        case Error::discovery_transient:
            os << "discovery_transient";
            break;
        case Error::invalid_api_version:
            os << "invalid_api_version";
            break;
        case Error::invalid_configuration:
            os << "invalid_configuration";
            break;
        case Error::already_started:
            os << "already_started";
            break;
        case Error::failed_to_start_http_server:
            os << "failed_to_start_http_server";
            break;
    }
    return os;
}

// Make Error compatible with boost::system::result
BOOST_NORETURN BOOST_NOINLINE inline void
throw_exception_from_error(Error const& e, boost::source_location const& loc) {
    boost::throw_with_location(std::runtime_error(fmt::format("nmos::Error: {}", fmt::streamed(e))), loc);
}

}  // namespace nmk::nmos

/// Make Error printable with fmt
template<>
struct fmt::formatter<nmk::nmos::Error>: ostream_formatter {};
