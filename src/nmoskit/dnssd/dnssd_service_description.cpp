/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/dnssd/dnssd_service_description.hpp"

#include <tuple>

std::string nmk::dnssd::ServiceDescription::to_string() const {
    std::string txt_description;
    for (auto& [key, value] : txt) {
        if (!txt_description.empty()) {
            txt_description += ", ";
        }
        txt_description += key;
        txt_description += "=";
        txt_description += value;
    }

    return fmt::format(
        "fullname: {}, name: {}, type: {}, domain: {}, host_target: {}, port: {}, txt: [{}]", fullname, name, reg_type,
        domain, host_target, port, txt_description
    );
}

bool nmk::dnssd::operator==(const ServiceDescription& lhs, const ServiceDescription& rhs) {
    return std::tie(lhs.fullname, lhs.name, lhs.reg_type, lhs.domain, lhs.host_target, lhs.port, lhs.txt)
        == std::tie(rhs.fullname, rhs.name, rhs.reg_type, rhs.domain, rhs.host_target, rhs.port, rhs.txt);
}

bool nmk::dnssd::operator!=(const ServiceDescription& lhs, const ServiceDescription& rhs) {
    return !(lhs == rhs);
}

std::ostream& nmk::dnssd::operator<<(std::ostream& os, const ServiceDescription& description) {
    os << description.to_string();
    return os;
}
