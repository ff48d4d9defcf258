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

/**
 * Upper bound for loops which would otherwise be unbounded, e.g. parsing loops driven by input data.
 */
#define NMK_LOOP_UPPER_BOUND 100000
