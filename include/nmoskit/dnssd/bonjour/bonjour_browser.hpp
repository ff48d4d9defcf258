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

#include "bonjour.hpp"

#if NMK_HAS_BONJOUR

    #include "bonjour_scoped_dns_service_ref.hpp"
    #include "nmoskit/core/platform/posix/pipe.hpp"
    #include "nmoskit/dnssd/dnssd_browser.hpp"
    #include "nmoskit/dnssd/dnssd_service_tracker.hpp"

    #include <boost/asio/strand.hpp>

    #include <atomic>
    #include <chrono>
    #include <map>
    #include <memory>
    #include <mutex>
    #include <thread>
    #include <vector>

namespace nmk::dnssd {

/**
 * Bonjour (dns_sd.h) implementation of Browser.
 *
 * A dedicated thread polls the DNS-SD sockets and processes their results. Events are posted to a strand on the
 * io_context, so they never block the poll thread and stay in order. The browser must be destroyed from a thread which
 * is not running handlers of this browser concurrently (normally the io_context thread itself).
 */
class BonjourBrowser: public Browser {
  public:
    /// The maximum time the poll thread waits for socket activity before checking timeouts and stop requests.
    static constexpr auto k_poll_interval = std::chrono::milliseconds(100);

    /// The time a service may take to resolve on an interface before an error is reported and the resolve is stopped.
    static constexpr auto k_resolve_timeout = std::chrono::seconds(5);

    /// The time after which a failed or timed out resolve is started again.
    static constexpr auto k_resolve_retry_interval = std::chrono::seconds(5);

    explicit BonjourBrowser(boost::asio::io_context& io_context);
    ~BonjourBrowser() override;

    BonjourBrowser(const BonjourBrowser&) = delete;
    BonjourBrowser& operator=(const BonjourBrowser&) = delete;

    BonjourBrowser(BonjourBrowser&&) = delete;
    BonjourBrowser& operator=(BonjourBrowser&&) = delete;

    // Browser overrides
    void browse_for(const std::string& reg_type) override;
    void stop() override;

  private:
    /**
     * A resolve operation for a service on one interface. Serves as context of resolve_callback.
     */
    struct Resolver {
        BonjourBrowser* owner {};
        ServiceTracker::Key key;
        BonjourScopedDnsServiceRef service_ref;
    };

    /**
     * Gives posted events a way to find out whether the browser still exists.
     */
    struct Delivery {
        std::atomic<BonjourBrowser*> owner;
    };

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    std::shared_ptr<Delivery> delivery_;

    mutable std::mutex mutex_;
    std::map<std::string, BonjourScopedDnsServiceRef> browsers_;  // reg_type -> DNSServiceRef
    ServiceTracker tracker_ {k_resolve_timeout, k_resolve_retry_interval};
    std::map<ServiceTracker::Key, std::unique_ptr<Resolver>> resolvers_;
    std::vector<std::unique_ptr<Resolver>> retired_resolvers_;  // Deallocated after the current processing round

    posix::Pipe wake_pipe_;
    std::thread poll_thread_;
    std::atomic<bool> keep_going_ {false};

    void start_poll_thread();
    void poll_loop();
    void poll_once();
    void check_resolve_timeouts(std::chrono::steady_clock::time_point now);
    void start_resolve(const ServiceTracker::Key& key);
    void retire_resolver(const ServiceTracker::Key& key);
    void wake_poll_thread() const;

    /**
     * Posts an event to the strand. The handler is skipped when the browser was destroyed in the meantime.
     */
    template<class Fn>
    void post_event(Fn&& fn);

    void post_discovered(const ServiceDescription& description);
    void post_resolved(const ServiceDescription& description);
    void post_removed(const ServiceDescription& description);
    void post_error(std::string error_message);

    static void browse_reply(
        DNSServiceRef browse_service_ref, DNSServiceFlags flags, uint32_t interface_index,
        DNSServiceErrorType error_code, const char* name, const char* type, const char* domain, void* context
    );

    static void resolve_callback(
        DNSServiceRef service_ref, DNSServiceFlags flags, uint32_t interface_index, DNSServiceErrorType error_code,
        const char* fullname, const char* host_target, uint16_t port, uint16_t txt_len, const unsigned char* txt_record,
        void* context
    );
};

}  // namespace nmk::dnssd

#endif
