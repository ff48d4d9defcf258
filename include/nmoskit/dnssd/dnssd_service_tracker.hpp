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

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nmk::dnssd {

/**
 * Bookkeeping for services reported by a DNS-SD browse operation. A service can be announced on several network
 * interfaces at once; it is discovered on its first interface and removed only after it disappeared from all of them.
 * Every interface is resolved on its own. A resolve which fails or times out is started again when the service is
 * announced again on that interface, or after the retry interval has passed.
 *
 * This class does not talk to DNS-SD itself, it only tells the caller which resolves to start and which events to
 * report. It is not thread safe.
 */
class ServiceTracker {
  public:
    using Clock = std::chrono::steady_clock;

    /// Identifies a service on a single interface: the full name of the service and the interface index.
    using Key = std::pair<std::string, uint32_t>;

    /**
     * What the caller has to do after a service was added.
     */
    struct AddResult {
        /// True if the service was not known on any interface before, and should be reported as discovered.
        bool discovered = false;

        /// True if a resolve should be started for the service on this interface.
        bool resolve = false;
    };

    /**
     * @param resolve_timeout The time a resolve may take before it counts as failed.
     * @param retry_interval The time after which a failed resolve is started again.
     */
    ServiceTracker(Clock::duration resolve_timeout, Clock::duration retry_interval);

    /**
     * Adds a service seen on given interface.
     * @param description The description of the service. Only the name fields are used.
     * @param interface_index The interface the service was seen on.
     * @param now The current time.
     * @return What the caller should do.
     */
    AddResult add(const ServiceDescription& description, uint32_t interface_index, Clock::time_point now);

    /**
     * Removes a service from given interface.
     * @param fullname The full name of the service.
     * @param interface_index The interface the service disappeared from.
     * @return The description of the service if it is now gone from all interfaces, otherwise nullopt.
     */
    std::optional<ServiceDescription> remove(const std::string& fullname, uint32_t interface_index);

    /**
     * Stores the result of a successful resolve.
     * @return The updated description, or nullopt if the service is not known on the interface of the key.
     */
    std::optional<ServiceDescription>
    resolved(const Key& key, const std::string& host_target, uint16_t port, const TxtRecord& txt);

    /**
     * Marks the resolve for given key as failed. It will be retried after the retry interval.
     */
    void resolve_failed(const Key& key, Clock::time_point now);

    /**
     * Marks all resolves that have been running for longer than the resolve timeout as failed.
     * @return The keys of the resolves that timed out. Their resolve operations should be stopped.
     */
    std::vector<Key> expired(Clock::time_point now);

    /**
     * Marks all failed resolves whose retry time has come as resolving again.
     * @return The keys for which a resolve should be started.
     */
    std::vector<Key> due_for_retry(Clock::time_point now);

    /**
     * @return The description of the service with given full name, or nullptr if not known.
     */
    [[nodiscard]] const ServiceDescription* find(const std::string& fullname) const;

    /**
     * @return True if the service is known on given interface and resolved there.
     */
    [[nodiscard]] bool is_resolved(const Key& key) const;

    /**
     * @return The number of known services.
     */
    [[nodiscard]] size_t size() const;

    /**
     * Forgets all services.
     */
    void clear();

  private:
    enum class ResolveState { resolving, resolved, failed };

    struct Interface {
        ResolveState state = ResolveState::resolving;
        Clock::time_point deadline;  // Timeout while resolving, retry time after a failure
    };

    struct Service {
        ServiceDescription description;
        std::map<uint32_t, Interface> interfaces;
    };

    Clock::duration resolve_timeout_;
    Clock::duration retry_interval_;
    std::map<std::string, Service> services_;  // fullname -> service

    Interface* find_interface(const Key& key);
};

}  // namespace nmk::dnssd
