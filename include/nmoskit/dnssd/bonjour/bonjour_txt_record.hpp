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
#include "nmoskit/dnssd/dnssd_service_description.hpp"

#if NMK_HAS_BONJOUR

namespace nmk::dnssd {

/**
 * Decodes a TXT record in its raw wire format (length prefixed key=value strings).
 * @param txt_record_raw_bytes Pointer to the raw bytes.
 * @param txt_record_length Number of bytes.
 * @return The decoded TXT record. Keys without a value map to an empty string.
 */
TxtRecord get_txt_record_from_raw_bytes(const unsigned char* txt_record_raw_bytes, uint16_t txt_record_length);

}  // namespace nmk::dnssd

#endif
