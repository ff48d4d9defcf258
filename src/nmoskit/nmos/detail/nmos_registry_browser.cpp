/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/nmos/detail/nmos_registry_browser.hpp"

#include "nmoskit/core/exception.hpp"
#include "nmoskit/core/log.hpp"

#include <chrono>

nmk::nmos::RegistryBrowser::RegistryBrowser(boost::asio::io_context& io_context) :
    RegistryBrowser(dnssd::Browser::create(io_context)) {}

nmk::nmos::RegistryBrowser::RegistryBrowser(std::unique_ptr<dnssd::Browser> browser) : browser_(std::move(browser)) {
    if (browser_ == nullptr) {
        return;
    }

    browser_->on_service_discovered = [](const dnssd::ServiceDescription& service) {
        NMK_DEBUG("Found registry service: {}", service.fullname);
    };
    browser_->on_service_resolved = [this](const dnssd::ServiceDescription& service) {
        handle_service_resolved(service);
    };
    browser_->on_service_removed = [this](const dnssd::ServiceDescription& service) {
        NMK_DEBUG("Lost registry service: {}", service.fullname);
        on_candidate_removed(service.fullname);
    };
    browser_->on_browse_error = [this](const std::string& error_message) {
        NMK_WARNING("Registry discovery error: {}", error_message);
        on_error(error_message);
    };
}

nmk::nmos::RegistryBrowser::~RegistryBrowser() {
    stop();
}

void nmk::nmos::RegistryBrowser::start(const std::vector<ApiVersion>& supported_versions) {
    supported_versions_ = supported_versions;

    if (browser_ == nullptr) {
        NMK_ERROR("No DNS-SD implementation available");
        on_error("No DNS-SD implementation available");
        return;
    }

    for (const auto* reg_type : {RegistryCandidate::k_reg_type, RegistryCandidate::k_legacy_reg_type}) {
        try {
            browser_->browse_for(reg_type);
        } catch (const Exception& e) {
            NMK_ERROR("Failed to browse for {}: {}", reg_type, e.what());
            on_error(e.what());
        }
    }
}

void nmk::nmos::RegistryBrowser::stop() {
    if (browser_ != nullptr) {
        browser_->stop();
    }
}

void nmk::nmos::RegistryBrowser::handle_service_resolved(const dnssd::ServiceDescription& service) {
    auto candidate = RegistryCandidate::from_service(service, supported_versions_, std::chrono::steady_clock::now());
    if (!candidate) {
        on_candidate_rejected(service.fullname);
        return;
    }
    on_candidate_resolved(*candidate);
}
