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

#include "dnssd_service_description.hpp"
#include "nmoskit/core/util/safe_function.hpp"

#include <boost/asio/io_context.hpp>

#include <memory>
#include <string>

namespace nmk::dnssd {

/**
 * Interface class which represents a DNS-SD browser.
 *
 * Events are delivered on the io_context given at construction, in the order in which they were produced. Events for
 * the same service are never reordered.
 */
class Browser {
  public:
    /// Called when a service was found. The service is not resolved yet.
    SafeFunction<void(const ServiceDescription& description)> on_service_discovered;

    /// Called when a service was resolved (host, port and TXT record are known). Also called when a service that was
    /// resolved before reports new data.
    SafeFunction<void(const ServiceDescription& description)> on_service_resolved;

    /// Called when a service is no longer available.
    SafeFunction<void(const ServiceDescription& description)> on_service_removed;

    /// Called when browsing or resolving failed. Browsing continues after an error.
    SafeFunction<void(const std::string& error_message)> on_browse_error;

    virtual ~Browser() = default;

    /**
     * Starts browsing for a service type. This function is not thread safe.
     * @param reg_type The service type (i.e. _http._tcp.).
     */
    virtual void browse_for(const std::string& reg_type) = 0;

    /**
     * Stops all browsing and releases the underlying network resources. Events that were already queued remain
     * deliverable. Calling stop more than once is allowed.
     */
    virtual void stop() = 0;

    /**
     * Creates the most appropriate Browser implementation for the platform.
     * @return The created Browser instance, or nullptr if no implementation is available.
     */
    static std::unique_ptr<Browser> create(boost::asio::io_context& io_context);
};

}  // namespace nmk::dnssd
