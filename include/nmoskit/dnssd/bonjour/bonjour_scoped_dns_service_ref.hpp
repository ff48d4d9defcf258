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

namespace nmk::dnssd {

/**
 * RAII wrapper around DNSServiceRef.
 */
class BonjourScopedDnsServiceRef {
  public:
    BonjourScopedDnsServiceRef() = default;
    ~BonjourScopedDnsServiceRef();

    explicit BonjourScopedDnsServiceRef(const DNSServiceRef& service_ref) noexcept;

    BonjourScopedDnsServiceRef(const BonjourScopedDnsServiceRef&) = delete;
    BonjourScopedDnsServiceRef& operator=(const BonjourScopedDnsServiceRef& other) = delete;

    BonjourScopedDnsServiceRef(BonjourScopedDnsServiceRef&& other) noexcept;
    BonjourScopedDnsServiceRef& operator=(BonjourScopedDnsServiceRef&& other) noexcept;

    /**
     * @return Returns the contained DNSServiceRef.
     */
    [[nodiscard]] DNSServiceRef service_ref() const noexcept;

    /**
     * @return The file descriptor of the underlying socket, or -1 if there is no DNSServiceRef.
     */
    [[nodiscard]] int socket_fd() const noexcept;

    /**
     * Deallocates the contained DNSServiceRef, if any.
     */
    void reset() noexcept;

  private:
    DNSServiceRef service_ref_ = nullptr;
};

}  // namespace nmk::dnssd

#endif
