/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/nmos/detail/nmos_registry_candidate.hpp"

#include "nmoskit/core/log.hpp"
#include "nmoskit/core/string.hpp"
#include "nmoskit/core/util/stl_helpers.hpp"

#include <algorithm>
#include <optional>
#include <tuple>

namespace {

bool is_registry_reg_type(std::string_view reg_type) {
    reg_type = nmk::string_remove_suffix(reg_type, ".");
    return reg_type == nmk::string_remove_suffix(nmk::nmos::RegistryCandidate::k_reg_type, ".")
        || reg_type == nmk::string_remove_suffix(nmk::nmos::RegistryCandidate::k_legacy_reg_type, ".");
}

const std::string* find_txt_value(const nmk::dnssd::TxtRecord& txt, const char* key) {
    const auto it = txt.find(key);
    if (it == txt.end()) {
        return nullptr;
    }
    return &it->second;
}

}  // namespace

std::string nmk::nmos::RegistryCandidate::registration_api_url() const {
    return fmt::format("http://{}:{}/x-nmos/registration/{}", host, port, api_version.to_string());
}

std::string nmk::nmos::RegistryCandidate::to_string() const {
    return fmt::format(
        "{} (host={}, port={}, priority={}, api_version={})", service_name, host, port, priority,
        api_version.to_string()
    );
}

boost::system::result<nmk::nmos::RegistryCandidate, nmk::nmos::Error> nmk::nmos::RegistryCandidate::from_service(
    const dnssd::ServiceDescription& service, const std::vector<ApiVersion>& supported_versions,
    const std::chrono::steady_clock::time_point discovered_at
) {
    const auto reject = [&service](const std::string& reason) {
        NMK_WARNING("Rejected registry {}: {}", service.fullname, reason);
        return Error::candidate_rejected;
    };

    if (!is_registry_reg_type(service.reg_type)) {
        return reject(fmt::format("unexpected service type '{}'", service.reg_type));
    }

    if (service.host_target.empty() || service.port == 0) {
        return reject("service is not resolved");
    }

    const auto* priority_value = find_txt_value(service.txt, k_txt_priority);
    if (priority_value == nullptr) {
        return reject("missing priority");
    }
    const auto priority = string_to_int<uint32_t>(*priority_value, true);
    if (!priority) {
        return reject(fmt::format("invalid priority '{}'", *priority_value));
    }

    const auto* api_version_value = find_txt_value(service.txt, k_txt_api_version);
    if (api_version_value == nullptr) {
        return reject("missing api_ver");
    }
    std::optional<ApiVersion> api_version;
    for (const auto& item : string_split(*api_version_value, ',')) {
        const auto version = ApiVersion::from_string(string_trim(item));
        if (!version || !stl_contains(supported_versions, *version)) {
            continue;
        }
        if (!api_version || *api_version < *version) {
            api_version = version;
        }
    }
    if (!api_version) {
        return reject(fmt::format("no supported API version in '{}'", *api_version_value));
    }

    if (const auto* protocol = find_txt_value(service.txt, k_txt_api_protocol)) {
        if (*protocol != "http") {
            return reject(fmt::format("unsupported protocol '{}'", *protocol));
        }
    }

    if (const auto* authorization = find_txt_value(service.txt, k_txt_api_authorization)) {
        if (*authorization == "true") {
            return reject("authorization is required");
        }
    }

    RegistryCandidate candidate;
    candidate.service_name = service.fullname;
    candidate.host = service.host_target;
    candidate.port = service.port;
    candidate.priority = *priority;
    candidate.api_version = *api_version;
    candidate.discovered_at = discovered_at;
    return candidate;
}

bool nmk::nmos::operator==(const RegistryCandidate& lhs, const RegistryCandidate& rhs) {
    return std::tie(lhs.service_name, lhs.host, lhs.port, lhs.priority, lhs.api_version, lhs.discovered_at)
        == std::tie(rhs.service_name, rhs.host, rhs.port, rhs.priority, rhs.api_version, rhs.discovered_at);
}

bool nmk::nmos::operator!=(const RegistryCandidate& lhs, const RegistryCandidate& rhs) {
    return !(lhs == rhs);
}

std::ostream& nmk::nmos::operator<<(std::ostream& os, const RegistryCandidate& candidate) {
    os << candidate.to_string();
    return os;
}
