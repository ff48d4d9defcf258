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

#include "nmos_version.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace nmk::nmos {

/**
 * Produces the timestamps used to stamp resource versions.
 */
class TimeSource {
  public:
    virtual ~TimeSource() = default;

    /**
     * @return The current time. Implementations must never return a value lower than a previously returned one.
     */
    [[nodiscard]] virtual Version now() = 0;
};

/**
 * TimeSource which reads the system clock and converts it to TAI (seconds since 1970-01-01T00:00:00 TAI). When the
 * system clock steps backward, the last returned value is held until the clock catches up. Thread safe.
 */
class TaiClock final: public TimeSource {
  public:
    /// The current difference between TAI and UTC.
    static constexpr std::chrono::seconds k_tai_utc_offset {37};

    [[nodiscard]] Version now() override;

    /**
     * @return A process wide instance.
     */
    static TaiClock& instance();

  private:
    std::atomic<uint64_t> last_ns_ {0};
};

}  // namespace nmk::nmos
