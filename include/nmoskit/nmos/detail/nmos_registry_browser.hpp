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
#include "nmos_registry_candidate.hpp"
#include "nmoskit/core/util/safe_function.hpp"
#include "nmoskit/dnssd/dnssd_browser.hpp"

#include <boost/asio/io_context.hpp>

#include <memory>
#include <string>
#include <vector>

namespace nmk::nmos {

/**
 * Source of registry candidates. Abstract so the Node can be driven without a network.
 */
class RegistryBrowserBase {
  public:
    /// Called when a registry was resolved and its TXT record is acceptable. Called again when a registry re-resolves.
    SafeFunction<void(const RegistryCandidate& candidate)> on_candidate_resolved;

    /// Called when a registry was resolved but its TXT record is not acceptable.
    SafeFunction<void(const std::string& service_name)> on_candidate_rejected;

    /// Called when a registry is no longer available.
    SafeFunction<void(const std::string& service_name)> on_candidate_removed;

    /// Called when browsing or resolving failed. Browsing continues after an error.
    SafeFunction<void(const std::string& error_message)> on_error;

    virtual ~RegistryBrowserBase() = default;

    /**
     * Starts browsing for registries.
     * @param supported_versions The API versions this node supports.
     */
    virtual void start(const std::vector<ApiVersion>& supported_versions) = 0;

    /**
     * Stops browsing. Calling stop more than once is allowed.
     */
    virtual void stop() = 0;
};

/**
 * Browses for registries using DNS-SD and turns the resolved services into registry candidates.
 */
class RegistryBrowser final: public RegistryBrowserBase {
  public:
    /**
     * Uses the DNS-SD implementation of the platform.
     * @param io_context The context on which events are delivered.
     */
    explicit RegistryBrowser(boost::asio::io_context& io_context);

    /**
     * @param browser The DNS-SD browser to use. May be nullptr, in which case start() reports an error.
     */
    explicit RegistryBrowser(std::unique_ptr<dnssd::Browser> browser);

    ~RegistryBrowser() override;

    RegistryBrowser(const RegistryBrowser&) = delete;
    RegistryBrowser& operator=(const RegistryBrowser&) = delete;

    RegistryBrowser(RegistryBrowser&&) = delete;
    RegistryBrowser& operator=(RegistryBrowser&&) = delete;

    void start(const std::vector<ApiVersion>& supported_versions) override;
    void stop() override;

  private:
    std::unique_ptr<dnssd::Browser> browser_;
    std::vector<ApiVersion> supported_versions_;

    void handle_service_resolved(const dnssd::ServiceDescription& service);
};

}  // namespace nmk::nmos
