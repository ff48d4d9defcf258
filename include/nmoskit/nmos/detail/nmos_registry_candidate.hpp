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

#include "nmos_api_version.hpp"
#include "nmos_error.hpp"
#include "nmoskit/dnssd/dnssd_service_description.hpp"

#include <boost/system/result.hpp>
#include <fmt/ostream.h>

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace nmk::nmos {

/**
 * A registry which was announced on the network and which this node could register with.
 * https://specs.amwa.tv/is-04/releases/v1.3.3/docs/Discovery_-_Registered_Operation.html
 */
struct RegistryCandidate {
    /// The service type of the Registration API.
    static constexpr auto k_reg_type = "_nmos-register._tcp.";

    /// The service type used by registries before v1.3.
    static constexpr auto k_legacy_reg_type = "_nmos-registration._tcp.";

    static constexpr auto k_txt_priority = "pri";
    static constexpr auto k_txt_api_version = "api_ver";
    static constexpr auto k_txt_api_protocol = "api_proto";
    static constexpr auto k_txt_api_authorization = "api_auth";

    /// The full name of the service, which identifies the candidate.
    std::string service_name;

    /// The host of the registry.
    std::string host;

    /// The port of the registry.
    uint16_t port {};

    /// The priority of the registry. Lower values take precedence.
    uint32_t priority {};

    /// The highest API version both the registry and this node support.
    ApiVersion api_version;

    /// When the service was first resolved.
    std::chrono::steady_clock::time_point discovered_at {};

    /**
     * @return The base URL of the Registration API, i.e. "http://registry.local.:8080/x-nmos/registration/v1.3".
     */
    [[nodiscard]] std::string registration_api_url() const;

    /**
     * @return A description of the candidate for logging.
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * Parses a resolved service.
     * @param service The resolved service.
     * @param supported_versions The API versions this node supports.
     * @param discovered_at The time the service was resolved.
     * @return The candidate, or candidate_rejected if the service type is wrong, the priority is missing or not a
     * number, no advertised API version is supported, the protocol is not http or authorization is required.
     */
    static boost::system::result<RegistryCandidate, Error> from_service(
        const dnssd::ServiceDescription& service, const std::vector<ApiVersion>& supported_versions,
        std::chrono::steady_clock::time_point discovered_at
    );
};

bool operator==(const RegistryCandidate& lhs, const RegistryCandidate& rhs);
bool operator!=(const RegistryCandidate& lhs, const RegistryCandidate& rhs);

std::ostream& operator<<(std::ostream& os, const RegistryCandidate& candidate);

}  // namespace nmk::nmos

template<>
struct fmt::formatter<nmk::nmos::RegistryCandidate>: ostream_formatter {};
