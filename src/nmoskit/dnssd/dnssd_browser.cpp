/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/dnssd/dnssd_browser.hpp"

#include "nmoskit/dnssd/bonjour/bonjour_browser.hpp"

#include <tuple>

std::unique_ptr<nmk::dnssd::Browser> nmk::dnssd::Browser::create(boost::asio::io_context& io_context) {
#if NMK_HAS_BONJOUR
    return std::make_unique<BonjourBrowser>(io_context);
#else
    std::ignore = io_context;
    return {};
#endif
}
