/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/nmos/detail/nmos_registry_selector.hpp"

#include "nmoskit/core/log.hpp"
#include "nmoskit/core/util/stl_helpers.hpp"

#include <algorithm>
#include <tuple>

void nmk::nmos::RegistrySelector::handle_resolved(RegistryCandidate candidate) {
    for (auto& entry : entries_) {
        if (entry.candidate.service_name == candidate.service_name) {
            candidate.discovered_at = entry.candidate.discovered_at;
            if (entry.candidate == candidate) {
                return;
            }
            NMK_DEBUG("Registry updated: {}", candidate);
            entry.candidate = std::move(candidate);
            sort_and_select();
            return;
        }
    }

    NMK_DEBUG("Registry added: {}", candidate);
    entries_.push_back({std::move(candidate), next_sequence_++});
    sort_and_select();
}

boost::system::result<void, nmk::nmos::Error>
nmk::nmos::RegistrySelector::handle_removed(const std::string& service_name) {
    const auto removed = stl_remove_if(entries_, [&service_name](const Entry& entry) {
        return entry.candidate.service_name == service_name;
    });
    if (removed == 0) {
        return Error::not_found;
    }
    NMK_DEBUG("Registry removed: {}", service_name);
    sort_and_select();
    return {};
}

void nmk::nmos::RegistrySelector::clear() {
    entries_.clear();
    sort_and_select();
}

const std::optional<nmk::nmos::RegistryCandidate>& nmk::nmos::RegistrySelector::get_active() const {
    return active_;
}

std::vector<nmk::nmos::RegistryCandidate> nmk::nmos::RegistrySelector::get_candidates() const {
    std::vector<RegistryCandidate> candidates;
    candidates.reserve(entries_.size());
    for (const auto& entry : entries_) {
        candidates.push_back(entry.candidate);
    }
    return candidates;
}

void nmk::nmos::RegistrySelector::sort_and_select() {
    std::sort(entries_.begin(), entries_.end(), [](const Entry& lhs, const Entry& rhs) {
        return std::tie(lhs.candidate.priority, lhs.candidate.discovered_at, lhs.sequence)
            < std::tie(rhs.candidate.priority, rhs.candidate.discovered_at, rhs.sequence);
    });

    std::optional<RegistryCandidate> best;
    if (!entries_.empty()) {
        best = entries_.front().candidate;
    }

    if (best == active_) {
        return;
    }

    active_ = std::move(best);
    if (active_) {
        NMK_INFO("Active registry: {}", *active_);
    } else {
        NMK_INFO("No registry available");
    }
    on_active_changed(active_);
}
