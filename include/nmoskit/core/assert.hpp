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

#include "exception.hpp"
#include "log.hpp"

#include <cstdlib>
#include <iostream>

/**
 * When NMK_LOG_ON_ASSERT is defined as true (1), a log message will be emitted when an assertion is hit. Default is on.
 */
#ifndef NMK_LOG_ON_ASSERT
    #define NMK_LOG_ON_ASSERT 1
#endif

/**
 * When NMK_THROW_EXCEPTION_ON_ASSERT is defined as true (1), an exception will be thrown when an assertion is hit.
 * Default is off.
 */
#ifndef NMK_THROW_EXCEPTION_ON_ASSERT
    #define NMK_THROW_EXCEPTION_ON_ASSERT 0
#endif

/**
 * When NMK_ABORT_ON_ASSERT is defined as true (1), program execution will abort when an assertion is hit. Default is
 * off.
 */
#ifndef NMK_ABORT_ON_ASSERT
    #define NMK_ABORT_ON_ASSERT 0
#endif

#define NMK_LOG_IF_ENABLED(msg) \
    if (NMK_LOG_ON_ASSERT) {    \
        NMK_CRITICAL(msg);      \
    }

#define NMK_THROW_EXCEPTION_IF_ENABLED(msg) \
    if (NMK_THROW_EXCEPTION_ON_ASSERT) {    \
        NMK_THROW_EXCEPTION(msg);           \
    }

#define NMK_ABORT_IF_ENABLED(msg)                                  \
    if (NMK_ABORT_ON_ASSERT) {                                     \
        std::cerr << "Abort on assertion: " << (msg) << std::endl; \
        std::abort();                                              \
    }

/**
 * Assert condition to be true, otherwise:
 *  - Logs if enabled
 *  - Throws if enabled
 *  - Aborts if enabled
 * @param condition The condition to test.
 * @param message The message for logging, throwing and/or aborting.
 */
#define NMK_ASSERT(condition, message)                                    \
    do {                                                                  \
        if (!(condition)) {                                               \
            NMK_LOG_IF_ENABLED("Assertion failure: " message)             \
            NMK_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            NMK_ABORT_IF_ENABLED(message)                                 \
        }                                                                 \
    } while (false)

/**
 * Asserts given condition, but never throws. Useful for places where an exception cannot be thrown like destructors.
 * @param condition The condition to test.
 * @param message The message to log or abort with.
 */
#define NMK_ASSERT_NO_THROW(condition, message)               \
    do {                                                      \
        if (!(condition)) {                                   \
            NMK_LOG_IF_ENABLED("Assertion failure: " message) \
            NMK_ABORT_IF_ENABLED(message)                     \
        }                                                     \
    } while (false)
