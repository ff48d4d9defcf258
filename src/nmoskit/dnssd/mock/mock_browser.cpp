/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/dnssd/mock/dnssd_mock_browser.hpp"

#include "nmoskit/core/exception.hpp"

#include <boost/asio/dispatch.hpp>
#include <fmt/format.h>

namespace {

std::string with_trailing_dot(const std::string& str) {
    if (!str.empty() && str.back() == '.') {
        return str;
    }
    return str + ".";
}

}  // namespace

nmk::dnssd::MockBrowser::MockBrowser(boost::asio::io_context& io_context) : io_context_(io_context) {}

void nmk::dnssd::MockBrowser::mock_discovered_service(
    const std::string& fullname, const std::string& name, const std::string& reg_type, const std::string& domain
) {
    boost::asio::dispatch(io_context_, [=] {
        ServiceDescription service;
        service.fullname = fullname;
        service.name = name;
        service.reg_type = with_trailing_dot(reg_type);
        service.domain = with_trailing_dot(domain);
        if (browsers_.find(service.reg_type) == browsers_.end()) {
            NMK_THROW_EXCEPTION(fmt::format("Not browsing for reg_type: {}", reg_type));
        }
        const auto [it, inserted] = services_.emplace(fullname, service);
        if (inserted) {
            on_service_discovered(it->second);
        }
    });
}

void nmk::dnssd::MockBrowser::mock_resolved_service(
    const std::string& fullname, const std::string& host_target, const uint16_t port, const TxtRecord& txt_record
) {
    boost::asio::dispatch(io_context_, [=] {
        const auto it = services_.find(fullname);
        if (it == services_.end()) {
            NMK_THROW_EXCEPTION(fmt::format("Service not discovered: {}", fullname));
        }
        it->second.host_target = host_target;
        it->second.port = port;
        it->second.txt = txt_record;
        on_service_resolved(it->second);
    });
}

void nmk::dnssd::MockBrowser::mock_removed_service(const std::string& fullname) {
    boost::asio::dispatch(io_context_, [=] {
        const auto it = services_.find(fullname);
        if (it == services_.end()) {
            NMK_THROW_EXCEPTION(fmt::format("Service not discovered: {}", fullname));
        }
        const auto description = it->second;
        services_.erase(it);
        on_service_removed(description);
    });
}

void nmk::dnssd::MockBrowser::mock_browse_error(const std::string& error_message) {
    boost::asio::dispatch(io_context_, [=] {
        on_browse_error(error_message);
    });
}

bool nmk::dnssd::MockBrowser::is_browsing_for(const std::string& reg_type) const {
    return browsers_.find(with_trailing_dot(reg_type)) != browsers_.end();
}

void nmk::dnssd::MockBrowser::browse_for(const std::string& reg_type) {
    if (!browsers_.insert(with_trailing_dot(reg_type)).second) {
        NMK_THROW_EXCEPTION(fmt::format("Service type already being browsed for: {}", reg_type));
    }
}

void nmk::dnssd::MockBrowser::stop() {
    browsers_.clear();
}
