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

#include "nmoskit/core/exception.hpp"
#include "nmoskit/core/log.hpp"
#include "nmoskit/core/platform.hpp"

// The Bonjour implementation is driven by a POSIX poll thread. On Linux dns_sd.h is provided by Avahi's compatibility
// layer (libdns_sd), on Apple platforms by the system.
#if NMK_POSIX
    #define NMK_HAS_BONJOUR 1
#else
    #define NMK_HAS_BONJOUR 0
#endif

#if NMK_HAS_BONJOUR

    #include <arpa/inet.h>
    #include <dns_sd.h>

    #define DNSSD_THROW_IF_ERROR(result, msg)                                                              \
        if ((result) != kDNSServiceErr_NoError) {                                                          \
            throw nmk::Exception(                                                                          \
                std::string(msg) + ": " + nmk::dnssd::dns_service_error_to_string(result), __FILE__, __LINE__, \
                NMK_FUNCTION                                                                               \
            );                                                                                             \
        }

namespace nmk::dnssd {

/**
 * @param error The error to describe.
 * @return A static string describing the given DNS-SD error.
 */
const char* dns_service_error_to_string(DNSServiceErrorType error) noexcept;

}  // namespace nmk::dnssd

#endif
