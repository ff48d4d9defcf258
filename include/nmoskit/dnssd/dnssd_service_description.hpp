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

#include <fmt/ostream.h>

#include <cstdint>
#include <map>
#include <ostream>
#include <string>

namespace nmk::dnssd {

/// Simple typedef for representing a TXT record.
using TxtRecord = std::map<std::string, std::string>;

/**
 * A struct containing data which represents a service on the network.
 */
struct ServiceDescription {
    /// The full service domain name (i.e. name._http._tcp.local.).
    std::string fullname;

    /// The name of the service.
    std::string name;

    /// The type of the service (i.e. _http._tcp.).
    std::string reg_type;

    /// The domain of the service (i.e. local.).
    std::string domain;

    /// The host target of the service (i.e. name.local.).
    std::string host_target;

    /// The port of the service (in native endian).
    uint16_t port {};

    /// The TXT record of the service, represented as a map of keys and values.
    TxtRecord txt;

    /// The index of the interface on which the service was found.
    uint32_t interface_index {};

    /**
     * @return A description of this struct, which might be handy for debugging or logging purposes.
     */
    [[nodiscard]] std::string to_string() const;
};

bool operator==(const ServiceDescription& lhs, const ServiceDescription& rhs);
bool operator!=(const ServiceDescription& lhs, const ServiceDescription& rhs);

std::ostream& operator<<(std::ostream& os, const ServiceDescription& description);

}  // namespace nmk::dnssd

template<>
struct fmt::formatter<nmk::dnssd::ServiceDescription>: ostream_formatter {};
