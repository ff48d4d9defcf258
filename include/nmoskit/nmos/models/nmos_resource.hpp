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

#include "nmoskit/nmos/detail/nmos_uuid.hpp"
#include "nmoskit/nmos/detail/nmos_version.hpp"

#include <boost/json/conversion.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>
#include <boost/json/value_to.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace nmk::nmos {

/**
 * The attributes every NMOS resource has in common.
 * https://specs.amwa.tv/is-04/releases/v1.3.3/APIs/schemas/with-refs/resource_core.html
 */
struct Resource {
    /// Globally unique identifier for the resource
    boost::uuids::uuid id {};

    /// String formatted TAI timestamp (<seconds>:<nanoseconds>) indicating precisely when an attribute of the resource
    /// last changed
    Version version;

    /// Freeform string label for the resource
    std::string label;

    /// Detailed description of the resource
    std::string description;

    /// Key value set of freeform string tags to aid in filtering resources. Values should be represented as an array of
    /// strings. Can be empty.
    std::map<std::string, std::vector<std::string>> tags;
};

inline void tag_invoke(const boost::json::value_from_tag&, boost::json::value& jv, const Resource& resource) {
    jv = {
        {"id", boost::uuids::to_string(resource.id)},
        {"version", resource.version.to_string()},
        {"label", resource.label},
        {"description", resource.description},
        {"tags", boost::json::value_from(resource.tags)},
    };
}

/**
 * Reads a UUID which must be present.
 * @throws std::invalid_argument if the value is not a UUID string.
 */
inline boost::uuids::uuid required_uuid_from_json(const boost::json::value& jv, const char* field_name) {
    const auto uuid = uuid_from_json(jv);
    if (!uuid) {
        throw std::invalid_argument(std::string(field_name) + " must be a UUID");
    }
    return *uuid;
}

/**
 * Fills the common resource attributes from a JSON object. Used by the value_to conversions of the resources.
 * @throws std::exception if an attribute is missing or has the wrong type.
 */
inline void resource_from_json(const boost::json::object& object, Resource& resource) {
    resource.id = required_uuid_from_json(object.at("id"), "id");

    const auto version = Version::from_string(object.at("version").as_string());
    if (!version) {
        throw std::invalid_argument("version must be formatted as <seconds>:<nanoseconds>");
    }
    resource.version = *version;

    resource.label = object.at("label").as_string();
    resource.description = object.at("description").as_string();
    resource.tags = boost::json::value_to<std::map<std::string, std::vector<std::string>>>(object.at("tags"));
}

/**
 * @return The UUIDs as JSON array of strings.
 */
inline boost::json::array json_array_from_uuids(const std::vector<boost::uuids::uuid>& uuids) {
    boost::json::array array;
    array.reserve(uuids.size());
    for (const auto& uuid : uuids) {
        array.emplace_back(boost::uuids::to_string(uuid));
    }
    return array;
}

/**
 * @return The UUIDs from a JSON array of strings.
 * @throws std::exception if the value is not an array of UUID strings.
 */
inline std::vector<boost::uuids::uuid> uuids_from_json_array(const boost::json::value& jv, const char* field_name) {
    std::vector<boost::uuids::uuid> uuids;
    for (const auto& item : jv.as_array()) {
        uuids.push_back(required_uuid_from_json(item, field_name));
    }
    return uuids;
}

}  // namespace nmk::nmos
