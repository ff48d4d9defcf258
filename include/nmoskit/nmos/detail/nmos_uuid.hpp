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

#include <boost/json/value.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <optional>
#include <string>

namespace nmk::nmos {

/**
 * Generates a random (version 4) UUID. Thread safe: each thread has its own generator.
 * @return The generated UUID.
 */
inline boost::uuids::uuid generate_uuid() {
    thread_local boost::uuids::random_generator generator;
    return generator();
}

/**
 * @param uuid The UUID to convert.
 * @return The UUID as lowercase hyphenated JSON string.
 */
inline boost::json::value json_value_from_uuid(const boost::uuids::uuid& uuid) {
    return {boost::uuids::to_string(uuid)};
}

/**
 * @param uuid The UUID to convert.
 * @return The UUID as JSON string, or null if the optional is empty.
 */
inline boost::json::value json_value_from_uuid(const std::optional<boost::uuids::uuid>& uuid) {
    if (uuid.has_value()) {
        return json_value_from_uuid(*uuid);
    }
    return nullptr;
}

/**
 * @param json A JSON string containing a UUID, or null.
 * @return The parsed UUID, or nullopt for null or an empty string.
 * @throws std::runtime_error if the string is not a valid UUID.
 */
inline std::optional<boost::uuids::uuid> uuid_from_json(const boost::json::value& json) {
    if (!json.is_string()) {
        return std::nullopt;
    }
    const auto& str = json.get_string();
    if (str.empty()) {
        return std::nullopt;
    }
    return boost::uuids::string_generator()(str.begin(), str.end());
}

/**
 * @param str A string containing a UUID.
 * @return The parsed UUID, or nullopt if the string is not a valid UUID.
 */
inline std::optional<boost::uuids::uuid> uuid_from_string(const std::string& str) {
    try {
        return boost::uuids::string_generator()(str);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

}  // namespace nmk::nmos
