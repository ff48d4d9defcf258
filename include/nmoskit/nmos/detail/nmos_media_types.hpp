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

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <optional>
#include <ostream>
#include <string_view>

namespace nmk::nmos {

/**
 * The format of the essence a Receiver accepts.
 * https://specs.amwa.tv/nmos-parameter-registers/branches/main/formats/
 */
enum class Format {
    video,
    audio,
    data,
    mux,
};

/**
 * @return The URN of the format, i.e. "urn:x-nmos:format:video".
 */
inline const char* to_urn(const Format format) {
    switch (format) {
        case Format::video:
            return "urn:x-nmos:format:video";
        case Format::audio:
            return "urn:x-nmos:format:audio";
        case Format::data:
            return "urn:x-nmos:format:data";
        case Format::mux:
            return "urn:x-nmos:format:mux";
    }
    return "";
}

/**
 * @param urn The URN to parse.
 * @return The format, or nullopt if the URN is not a known format.
 */
inline std::optional<Format> format_from_urn(const std::string_view urn) {
    for (const auto format : {Format::video, Format::audio, Format::data, Format::mux}) {
        if (urn == to_urn(format)) {
            return format;
        }
    }
    return std::nullopt;
}

/**
 * The transport a Sender or Receiver uses.
 * https://specs.amwa.tv/nmos-parameter-registers/branches/main/transports/
 */
enum class Transport {
    rtp,
    rtp_unicast,
    rtp_multicast,
    dash,
};

/**
 * @return The URN of the transport, i.e. "urn:x-nmos:transport:rtp.mcast".
 */
inline const char* to_urn(const Transport transport) {
    switch (transport) {
        case Transport::rtp:
            return "urn:x-nmos:transport:rtp";
        case Transport::rtp_unicast:
            return "urn:x-nmos:transport:rtp.ucast";
        case Transport::rtp_multicast:
            return "urn:x-nmos:transport:rtp.mcast";
        case Transport::dash:
            return "urn:x-nmos:transport:dash";
    }
    return "";
}

/**
 * @param urn The URN to parse.
 * @return The transport, or nullopt if the URN is not a known transport.
 */
inline std::optional<Transport> transport_from_urn(const std::string_view urn) {
    for (const auto transport : {Transport::rtp, Transport::rtp_unicast, Transport::rtp_multicast, Transport::dash}) {
        if (urn == to_urn(transport)) {
            return transport;
        }
    }
    return std::nullopt;
}

inline std::ostream& operator<<(std::ostream& os, const Format format) {
    os << to_urn(format);
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const Transport transport) {
    os << to_urn(transport);
    return os;
}

}  // namespace nmk::nmos

template<>
struct fmt::formatter<nmk::nmos::Format>: ostream_formatter {};

template<>
struct fmt::formatter<nmk::nmos::Transport>: ostream_formatter {};
