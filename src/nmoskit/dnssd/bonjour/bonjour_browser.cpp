/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/dnssd/bonjour/bonjour_browser.hpp"

#if NMK_HAS_BONJOUR

    #include "nmoskit/dnssd/bonjour/bonjour_txt_record.hpp"

    #include <boost/asio/post.hpp>
    #include <fmt/format.h>

    #include <algorithm>
    #include <cerrno>
    #include <cstring>
    #include <sys/select.h>

nmk::dnssd::BonjourBrowser::BonjourBrowser(boost::asio::io_context& io_context) :
    strand_(boost::asio::make_strand(io_context)), delivery_(std::make_shared<Delivery>()) {
    delivery_->owner = this;
}

nmk::dnssd::BonjourBrowser::~BonjourBrowser() {
    stop();
    delivery_->owner = nullptr;
}

void nmk::dnssd::BonjourBrowser::browse_for(const std::string& reg_type) {
    {
        std::lock_guard lock(mutex_);

        if (browsers_.find(reg_type) != browsers_.end()) {
            NMK_THROW_EXCEPTION(fmt::format("Already browsing for service type: {}", reg_type));
        }

        DNSServiceRef service_ref = nullptr;
        DNSSD_THROW_IF_ERROR(
            DNSServiceBrowse(
                &service_ref, 0, kDNSServiceInterfaceIndexAny, reg_type.c_str(), nullptr, browse_reply, this
            ),
            "Failed to browse for " + reg_type
        );
        browsers_.emplace(reg_type, BonjourScopedDnsServiceRef(service_ref));
    }

    NMK_DEBUG("Browsing for {}", reg_type);

    if (!keep_going_) {
        start_poll_thread();
    } else {
        wake_poll_thread();
    }
}

void nmk::dnssd::BonjourBrowser::stop() {
    if (keep_going_.exchange(false)) {
        wake_poll_thread();
    }

    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }

    std::lock_guard lock(mutex_);
    tracker_.clear();
    resolvers_.clear();
    retired_resolvers_.clear();
    browsers_.clear();
}

void nmk::dnssd::BonjourBrowser::start_poll_thread() {
    keep_going_ = true;
    poll_thread_ = std::thread(&BonjourBrowser::poll_loop, this);
}

void nmk::dnssd::BonjourBrowser::poll_loop() {
    NMK_TRACE("DNS-SD poll thread started");
    while (keep_going_) {
        try {
            poll_once();
        } catch (const Exception& e) {
            NMK_DEBUG("DNS-SD poll exception thrown at {}", e.location());
            post_error(fmt::format("DNS-SD poll failed: {}", e.what()));
            std::this_thread::sleep_for(k_poll_interval);
        } catch (const std::exception& e) {
            post_error(fmt::format("DNS-SD poll failed: {}", e.what()));
            std::this_thread::sleep_for(k_poll_interval);
        }
    }
    NMK_TRACE("DNS-SD poll thread stopped");
}

void nmk::dnssd::BonjourBrowser::poll_once() {
    fd_set read_fds;
    FD_ZERO(&read_fds);

    int max_fd = wake_pipe_.read_fd();
    FD_SET(wake_pipe_.read_fd(), &read_fds);

    std::vector<std::pair<DNSServiceRef, int>> refs;
    {
        std::lock_guard lock(mutex_);
        for (auto& [reg_type, browser] : browsers_) {
            refs.emplace_back(browser.service_ref(), browser.socket_fd());
        }
        for (auto& [key, resolver] : resolvers_) {
            refs.emplace_back(resolver->service_ref.service_ref(), resolver->service_ref.socket_fd());
        }
    }

    for (const auto& [ref, fd] : refs) {
        if (fd < 0) {
            continue;
        }
        FD_SET(fd, &read_fds);
        max_fd = std::max(max_fd, fd);
    }

    timeval timeout {};
    timeout.tv_sec = 0;
    timeout.tv_usec = static_cast<decltype(timeout.tv_usec)>(
        std::chrono::duration_cast<std::chrono::microseconds>(k_poll_interval).count()
    );

    const auto result = ::select(max_fd + 1, &read_fds, nullptr, nullptr, &timeout);
    if (result < 0) {
        if (errno == EINTR) {
            return;
        }
        post_error(fmt::format("select() failed: {}", std::strerror(errno)));
        std::this_thread::sleep_for(k_poll_interval);
        return;
    }

    if (FD_ISSET(wake_pipe_.read_fd(), &read_fds)) {
        wake_pipe_.drain();
    }

    if (!keep_going_) {
        return;
    }

    std::lock_guard lock(mutex_);

    const auto is_live = [this](DNSServiceRef ref, const int fd) {
        for (auto& [reg_type, browser] : browsers_) {
            if (browser.service_ref() == ref) {
                return browser.socket_fd() == fd;
            }
        }
        for (auto& [key, resolver] : resolvers_) {
            if (resolver->service_ref.service_ref() == ref) {
                return resolver->service_ref.socket_fd() == fd;
            }
        }
        return false;
    };

    if (result > 0) {
        for (const auto& [ref, fd] : refs) {
            if (fd < 0 || !FD_ISSET(fd, &read_fds) || !is_live(ref, fd)) {
                continue;
            }
            const auto error = DNSServiceProcessResult(ref);
            if (error != kDNSServiceErr_NoError) {
                post_error(fmt::format("Failed to process DNS-SD result: {}", dns_service_error_to_string(error)));
            }
        }
    }

    check_resolve_timeouts(std::chrono::steady_clock::now());

    // Resolvers which were retired from within their own callbacks are safe to deallocate now.
    retired_resolvers_.clear();
}

void nmk::dnssd::BonjourBrowser::check_resolve_timeouts(const std::chrono::steady_clock::time_point now) {
    for (const auto& key : tracker_.expired(now)) {
        post_error(fmt::format("Timeout resolving service {} on interface {}", key.first, key.second));
        retire_resolver(key);
    }

    for (const auto& key : tracker_.due_for_retry(now)) {
        NMK_DEBUG("Retrying resolve of {} on interface {}", key.first, key.second);
        start_resolve(key);
    }
}

void nmk::dnssd::BonjourBrowser::start_resolve(const ServiceTracker::Key& key) {
    const auto* description = tracker_.find(key.first);
    if (description == nullptr) {
        return;
    }

    retire_resolver(key);

    auto resolver = std::make_unique<Resolver>();
    resolver->owner = this;
    resolver->key = key;

    DNSServiceRef resolve_ref = nullptr;
    const auto result = DNSServiceResolve(
        &resolve_ref, 0, key.second, description->name.c_str(), description->reg_type.c_str(),
        description->domain.c_str(), resolve_callback, resolver.get()
    );
    if (result != kDNSServiceErr_NoError) {
        post_error(fmt::format("Failed to resolve service {}: {}", key.first, dns_service_error_to_string(result)));
        tracker_.resolve_failed(key, std::chrono::steady_clock::now());
        return;
    }

    resolver->service_ref = BonjourScopedDnsServiceRef(resolve_ref);
    resolvers_.emplace(key, std::move(resolver));
}

void nmk::dnssd::BonjourBrowser::retire_resolver(const ServiceTracker::Key& key) {
    const auto it = resolvers_.find(key);
    if (it == resolvers_.end()) {
        return;
    }
    retired_resolvers_.push_back(std::move(it->second));
    resolvers_.erase(it);
}

void nmk::dnssd::BonjourBrowser::wake_poll_thread() const {
    constexpr char signal = 1;
    if (wake_pipe_.write(&signal, sizeof(signal)) < 0 && errno != EAGAIN) {
        NMK_WARNING("Failed to wake DNS-SD poll thread: {}", std::strerror(errno));
    }
}

template<class Fn>
void nmk::dnssd::BonjourBrowser::post_event(Fn&& fn) {
    boost::asio::post(strand_, [delivery = delivery_, fn = std::forward<Fn>(fn)]() mutable {
        if (auto* owner = delivery->owner.load()) {
            fn(*owner);
        }
    });
}

void nmk::dnssd::BonjourBrowser::post_discovered(const ServiceDescription& description) {
    post_event([description](BonjourBrowser& browser) {
        browser.on_service_discovered(description);
    });
}

void nmk::dnssd::BonjourBrowser::post_resolved(const ServiceDescription& description) {
    post_event([description](BonjourBrowser& browser) {
        browser.on_service_resolved(description);
    });
}

void nmk::dnssd::BonjourBrowser::post_removed(const ServiceDescription& description) {
    post_event([description](BonjourBrowser& browser) {
        browser.on_service_removed(description);
    });
}

void nmk::dnssd::BonjourBrowser::post_error(std::string error_message) {
    NMK_WARNING("DNS-SD: {}", error_message);
    post_event([msg = std::move(error_message)](BonjourBrowser& browser) {
        browser.on_browse_error(msg);
    });
}

void nmk::dnssd::BonjourBrowser::browse_reply(
    [[maybe_unused]] DNSServiceRef browse_service_ref, const DNSServiceFlags flags, const uint32_t interface_index,
    const DNSServiceErrorType error_code, const char* name, const char* type, const char* domain, void* context
) {
    auto* browser = static_cast<BonjourBrowser*>(context);

    if (error_code != kDNSServiceErr_NoError) {
        browser->post_error(fmt::format("Browse error: {}", dns_service_error_to_string(error_code)));
        return;
    }

    char fullname[kDNSServiceMaxDomainName] = {};
    if (DNSServiceConstructFullName(fullname, name, type, domain) != 0) {
        browser->post_error(fmt::format("Failed to construct full name for service: {}", name));
        return;
    }

    const ServiceTracker::Key key {fullname, interface_index};

    if (flags & kDNSServiceFlagsAdd) {
        ServiceDescription description;
        description.fullname = fullname;
        description.name = name;
        description.reg_type = type;
        description.domain = domain;
        description.interface_index = interface_index;

        const auto result = browser->tracker_.add(description, interface_index, std::chrono::steady_clock::now());
        if (result.discovered) {
            NMK_DEBUG("Service discovered: {}", fullname);
            browser->post_discovered(description);
        }
        if (result.resolve) {
            browser->start_resolve(key);
        }
        return;
    }

    browser->retire_resolver(key);
    if (const auto removed = browser->tracker_.remove(fullname, interface_index)) {
        NMK_DEBUG("Service removed: {}", fullname);
        browser->post_removed(*removed);
    }
}

void nmk::dnssd::BonjourBrowser::resolve_callback(
    [[maybe_unused]] DNSServiceRef service_ref, [[maybe_unused]] DNSServiceFlags flags, const uint32_t interface_index,
    const DNSServiceErrorType error_code, [[maybe_unused]] const char* fullname, const char* host_target,
    const uint16_t port, const uint16_t txt_len, const unsigned char* txt_record, void* context
) {
    auto* resolver = static_cast<Resolver*>(context);
    auto* browser = resolver->owner;
    const auto key = resolver->key;

    if (error_code != kDNSServiceErr_NoError) {
        browser->post_error(fmt::format(
            "Resolve error for {} on interface {}: {}", key.first, key.second, dns_service_error_to_string(error_code)
        ));
        browser->tracker_.resolve_failed(key, std::chrono::steady_clock::now());
        browser->retire_resolver(key);
        return;
    }

    const auto description = browser->tracker_.resolved(
        key, host_target, ntohs(port), get_txt_record_from_raw_bytes(txt_record, txt_len)
    );
    if (!description) {
        return;
    }

    NMK_DEBUG("Service resolved on interface {}: {}", interface_index, *description);
    browser->post_resolved(*description);
}

#endif
