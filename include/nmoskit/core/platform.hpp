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

// Windows
#if defined(_WIN32)
    #define NMK_WINDOWS 1
    #if !defined(NOMINMAX)
        #error "Please define NOMINMAX as compile constant in your build system."
    #endif
#else
    #define NMK_WINDOWS 0
#endif

// Platforms with POSIX sockets, pipes and select(), which the DNS-SD poll thread is built on.
#if defined(__APPLE__) || defined(__linux__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    #define NMK_POSIX 1
#else
    #define NMK_POSIX 0
#endif

// Name of the enclosing function, recorded by exceptions and log statements.
#if defined(_MSC_VER)
    #define NMK_FUNCTION __FUNCSIG__
#elif defined(__GNUC__) || defined(__clang__)
    #define NMK_FUNCTION __PRETTY_FUNCTION__
#else
    #define NMK_FUNCTION __func__
#endif
