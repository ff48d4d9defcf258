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

#include "nmoskit/dnssd/dnssd_browser.hpp"

#include <map>
#include <set>

namespace nmk::dnssd {

/**
 * Browser implementation which doesn't touch the network. Services are announced by calling the mock_* functions,
 * which deliver their events through the io_context.
 */
class MockBrowser: public Browser {
  public:
    explicit MockBrowser(boost::asio::io_context& io_context);
    ~MockBrowser() override = default;

    /**
     * Mocks discovering a service.
     * @param fullname The fullname of the service. Should not contain spaces.
     * @param name The name of the service.
     * @param reg_type The registration type of the service (i.e. _http._tcp.).
     * @param domain The domain of the service (i.e. local.).
     */
    void mock_discovered_service(
        const std::string& fullname, const std::string& name, const std::string& reg_type, const std::string& domain
    );

    /**
     * Mocks resolving a service. Requires calling mock_discovered_service before.
     * @param fullname The fullname of the service which was discovered before.
     * @param host_target The host target of the service.
     * @param port The port of the service.
     * @param txt_record The txt record of the service.
     */
    void mock_resolved_service(
        const std::string& fullname, const std::string& host_target, uint16_t port, const TxtRecord& txt_record
    );

    /**
     * Mocks removing a service. Requires calling mock_discovered_service before.
     * @param fullname The fullname of the service which was discovered before.
     */
    void mock_removed_service(const std::string& fullname);

    /**
     * Mocks a failing browse operation.
     * @param error_message The message of the error.
     */
    void mock_browse_error(const std::string& error_message);

    /**
     * @return True if the browser is currently browsing for the given service type.
     */
    [[nodiscard]] bool is_browsing_for(const std::string& reg_type) const;

    // Browser overrides
    void browse_for(const std::string& reg_type) override;
    void stop() override;

  private:
    boost::asio::io_context& io_context_;
    std::map<std::string, ServiceDescription> services_;  // fullname -> service description
    std::set<std::string> browsers_;                      // reg_type
};

}  // namespace nmk::dnssd
