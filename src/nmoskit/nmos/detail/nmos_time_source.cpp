/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/nmos/detail/nmos_time_source.hpp"

#include <algorithm>

nmk::nmos::Version nmk::nmos::TaiClock::now() {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch() + k_tai_utc_offset;
    const auto ns = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count());

    auto last = last_ns_.load();
    while (ns > last && !last_ns_.compare_exchange_weak(last, ns)) {}
    const auto result = std::max(ns, last);

    return {
        result / Version::k_nanoseconds_per_second,
        static_cast<uint32_t>(result % Version::k_nanoseconds_per_second),
    };
}

nmk::nmos::TaiClock& nmk::nmos::TaiClock::instance() {
    static TaiClock clock;
    return clock;
}
