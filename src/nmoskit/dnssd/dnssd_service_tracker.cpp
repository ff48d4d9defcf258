/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/dnssd/dnssd_service_tracker.hpp"

nmk::dnssd::ServiceTracker::ServiceTracker(
    const Clock::duration resolve_timeout, const Clock::duration retry_interval
) :
    resolve_timeout_(resolve_timeout), retry_interval_(retry_interval) {}

nmk::dnssd::ServiceTracker::AddResult nmk::dnssd::ServiceTracker::add(
    const ServiceDescription& description, const uint32_t interface_index, const Clock::time_point now
) {
    AddResult result;

    auto it = services_.find(description.fullname);
    if (it == services_.end()) {
        it = services_.emplace(description.fullname, Service {description, {}}).first;
        it->second.description.interface_index = interface_index;
        result.discovered = true;
    }

    auto& interfaces = it->second.interfaces;
    const auto existing = interfaces.find(interface_index);
    if (existing == interfaces.end()) {
        interfaces.emplace(interface_index, Interface {ResolveState::resolving, now + resolve_timeout_});
        result.resolve = true;
    } else if (existing->second.state == ResolveState::failed) {
        existing->second = Interface {ResolveState::resolving, now + resolve_timeout_};
        result.resolve = true;
    }

    return result;
}

std::optional<nmk::dnssd::ServiceDescription>
nmk::dnssd::ServiceTracker::remove(const std::string& fullname, const uint32_t interface_index) {
    const auto it = services_.find(fullname);
    if (it == services_.end()) {
        return std::nullopt;
    }

    if (it->second.interfaces.erase(interface_index) == 0 || !it->second.interfaces.empty()) {
        return std::nullopt;
    }

    auto description = std::move(it->second.description);
    services_.erase(it);
    return description;
}

std::optional<nmk::dnssd::ServiceDescription> nmk::dnssd::ServiceTracker::resolved(
    const Key& key, const std::string& host_target, const uint16_t port, const TxtRecord& txt
) {
    auto* entry = find_interface(key);
    if (entry == nullptr) {
        return std::nullopt;
    }
    entry->state = ResolveState::resolved;

    auto& description = services_.at(key.first).description;
    description.host_target = host_target;
    description.port = port;
    description.txt = txt;
    description.interface_index = key.second;
    return description;
}

void nmk::dnssd::ServiceTracker::resolve_failed(const Key& key, const Clock::time_point now) {
    if (auto* entry = find_interface(key)) {
        *entry = Interface {ResolveState::failed, now + retry_interval_};
    }
}

std::vector<nmk::dnssd::ServiceTracker::Key> nmk::dnssd::ServiceTracker::expired(const Clock::time_point now) {
    std::vector<Key> keys;
    for (auto& [fullname, service] : services_) {
        for (auto& [index, entry] : service.interfaces) {
            if (entry.state == ResolveState::resolving && now >= entry.deadline) {
                entry = Interface {ResolveState::failed, now + retry_interval_};
                keys.emplace_back(fullname, index);
            }
        }
    }
    return keys;
}

std::vector<nmk::dnssd::ServiceTracker::Key> nmk::dnssd::ServiceTracker::due_for_retry(const Clock::time_point now) {
    std::vector<Key> keys;
    for (auto& [fullname, service] : services_) {
        for (auto& [index, entry] : service.interfaces) {
            if (entry.state == ResolveState::failed && now >= entry.deadline) {
                entry = Interface {ResolveState::resolving, now + resolve_timeout_};
                keys.emplace_back(fullname, index);
            }
        }
    }
    return keys;
}

const nmk::dnssd::ServiceDescription* nmk::dnssd::ServiceTracker::find(const std::string& fullname) const {
    const auto it = services_.find(fullname);
    return it == services_.end() ? nullptr : &it->second.description;
}

bool nmk::dnssd::ServiceTracker::is_resolved(const Key& key) const {
    const auto it = services_.find(key.first);
    if (it == services_.end()) {
        return false;
    }
    const auto entry = it->second.interfaces.find(key.second);
    return entry != it->second.interfaces.end() && entry->second.state == ResolveState::resolved;
}

size_t nmk::dnssd::ServiceTracker::size() const {
    return services_.size();
}

void nmk::dnssd::ServiceTracker::clear() {
    services_.clear();
}

nmk::dnssd::ServiceTracker::Interface* nmk::dnssd::ServiceTracker::find_interface(const Key& key) {
    const auto it = services_.find(key.first);
    if (it == services_.end()) {
        return nullptr;
    }
    const auto entry = it->second.interfaces.find(key.second);
    return entry == it->second.interfaces.end() ? nullptr : &entry->second;
}
