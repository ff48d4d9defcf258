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

#include "nmos_error.hpp"
#include "nmos_registry_candidate.hpp"
#include "nmoskit/core/util/safe_function.hpp"

#include <boost/system/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nmk::nmos {

/**
 * Keeps track of the registries on the network and selects the one to register with. Candidates are ranked by priority
 * (lower first), then by the time they were discovered (earlier first), then by arrival. The best ranked candidate is
 * the active one.
 *
 * Not thread safe. The selector is meant to be driven from the context which delivers the discovery events.
 */
class RegistrySelector {
  public:
    /// Called every time the active candidate changes, including changes to the host, port or API version of the
    /// active candidate. An empty optional means no registry is available.
    SafeFunction<void(const std::optional<RegistryCandidate>& active)> on_active_changed;

    /**
     * Adds a candidate, or replaces the attributes of the candidate with the same service name. A replaced candidate
     * keeps its original discovery time and arrival.
     * @param candidate The candidate.
     */
    void handle_resolved(RegistryCandidate candidate);

    /**
     * Removes a candidate. When it was the active candidate the next best candidate becomes active.
     * @param service_name The service name of the candidate.
     * @return not_found if no candidate with the given name exists.
     */
    boost::system::result<void, Error> handle_removed(const std::string& service_name);

    /**
     * Removes all candidates.
     */
    void clear();

    /**
     * @return The active candidate, or an empty optional if there is no candidate.
     */
    [[nodiscard]] const std::optional<RegistryCandidate>& get_active() const;

    /**
     * @return All candidates, best ranked first.
     */
    [[nodiscard]] std::vector<RegistryCandidate> get_candidates() const;

  private:
    struct Entry {
        RegistryCandidate candidate;
        uint64_t sequence {};
    };

    std::vector<Entry> entries_;  // Sorted by rank
    std::optional<RegistryCandidate> active_;
    uint64_t next_sequence_ {};

    void sort_and_select();
};

}  // namespace nmk::nmos
