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

#include "log.hpp"

#include <functional>
#include <vector>

namespace nmk {

/**
 * Collects undo actions and runs them in reverse order on destruction, unless committed.
 */
class ScopedRollback {
  public:
    ScopedRollback() = default;

    /**
     * Constructs a rollback object with an initial rollback function.
     * @param rollback_function The function to execute upon destruction if not committed.
     */
    explicit ScopedRollback(std::function<void()>&& rollback_function) {
        rollback_functions_.push_back(std::move(rollback_function));
    }

    /**
     * Runs all registered rollback functions, last added first, if not committed.
     */
    ~ScopedRollback() {
        for (auto it = rollback_functions_.rbegin(); it != rollback_functions_.rend(); ++it) {
            try {
                (*it)();
            } catch (const std::exception& e) {
                NMK_ERROR("Exception caught during rollback: {}", e.what());
            }
        }
    }

    ScopedRollback(const ScopedRollback&) = delete;
    ScopedRollback& operator=(const ScopedRollback&) = delete;

    ScopedRollback(ScopedRollback&&) = delete;
    ScopedRollback& operator=(ScopedRollback&&) = delete;

    /**
     * Adds a rollback function.
     * @param rollback_function The function to execute upon destruction if not committed.
     */
    void add(std::function<void()>&& rollback_function) {
        rollback_functions_.push_back(std::move(rollback_function));
    }

    /**
     * Commits, which clears the stored functions. Call this when the rollback is no longer needed.
     */
    void commit() {
        rollback_functions_.clear();
    }

  private:
    std::vector<std::function<void()>> rollback_functions_;
};

}  // namespace nmk
