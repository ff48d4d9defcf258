/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "nmoskit/dnssd/bonjour/bonjour_txt_record.hpp"

#if NMK_HAS_BONJOUR

nmk::dnssd::TxtRecord
nmk::dnssd::get_txt_record_from_raw_bytes(const unsigned char* txt_record_raw_bytes, const uint16_t txt_record_length) {
    TxtRecord txt_record;

    if (txt_record_raw_bytes == nullptr || txt_record_length == 0) {
        return txt_record;
    }

    constexpr uint16_t key_buffer_length = 256;
    char key[key_buffer_length];

    const auto count = TXTRecordGetCount(txt_record_length, txt_record_raw_bytes);
    for (uint16_t i = 0; i < count; i++) {
        uint8_t value_length = 0;
        const void* value = nullptr;
        const auto result = TXTRecordGetItemAtIndex(
            txt_record_length, txt_record_raw_bytes, i, key_buffer_length, key, &value_length, &value
        );
        if (result != kDNSServiceErr_NoError) {
            NMK_WARNING("Failed to read TXT record item {}: {}", i, dns_service_error_to_string(result));
            continue;
        }
        if (value == nullptr) {
            txt_record.emplace(key, std::string());
            continue;
        }
        txt_record.emplace(key, std::string(static_cast<const char*>(value), value_length));
    }

    return txt_record;
}

#endif
