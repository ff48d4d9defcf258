/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/dnssd/bonjour/bonjour_scoped_dns_service_ref.hpp"

#if NMK_HAS_BONJOUR

nmk::dnssd::BonjourScopedDnsServiceRef::~BonjourScopedDnsServiceRef() {
    reset();
}

nmk::dnssd::BonjourScopedDnsServiceRef::BonjourScopedDnsServiceRef(const DNSServiceRef& service_ref) noexcept :
    service_ref_(service_ref) {}

nmk::dnssd::BonjourScopedDnsServiceRef::BonjourScopedDnsServiceRef(BonjourScopedDnsServiceRef&& other) noexcept {
    *this = std::move(other);
}

nmk::dnssd::BonjourScopedDnsServiceRef&
nmk::dnssd::BonjourScopedDnsServiceRef::operator=(BonjourScopedDnsServiceRef&& other) noexcept {
    if (this != &other) {
        reset();
        service_ref_ = other.service_ref_;
        other.service_ref_ = nullptr;
    }
    return *this;
}

DNSServiceRef nmk::dnssd::BonjourScopedDnsServiceRef::service_ref() const noexcept {
    return service_ref_;
}

int nmk::dnssd::BonjourScopedDnsServiceRef::socket_fd() const noexcept {
    if (service_ref_ == nullptr) {
        return -1;
    }
    return DNSServiceRefSockFD(service_ref_);
}

void nmk::dnssd::BonjourScopedDnsServiceRef::reset() noexcept {
    if (service_ref_ != nullptr) {
        DNSServiceRefDeallocate(service_ref_);
        service_ref_ = nullptr;
    }
}

#endif
