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

#include "nmoskit/core/constants.hpp"
#include "nmoskit/core/string.hpp"
#include "nmoskit/core/string_parser.hpp"

#include <boost/system/result.hpp>
#include <boost/throw_exception.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <map>
#include <ostream>
#include <stdexcept>
#include <string_view>

namespace nmk {

/**
 * Matches request paths against route patterns like "/x-nmos/node/{version}/devices/{device_id}".
 *
 * Path parameters are enclosed in curly braces and fed into an instance of Parameters. The single wildcard "*" matches
 * any single path segment. A trailing slash on the path is ignored.
 */
class PathMatcher {
  public:
    enum class Error {
        invalid_argument,
    };

    /**
     * Contains parameters extracted from a path.
     */
    class Parameters {
      public:
        /**
         * Set a parameter with the given name and value.
         * @param name The parameter name (e.g. "id" in "{id}").
         * @param value The parameter value.
         */
        void set(const std::string_view name, const std::string_view value) {
            parameters_[std::string(name)] = std::string(value);
        }

        /**
         * Get a parameter value by name.
         * @param name The parameter name (e.g. "id" in "{id}").
         * @return The parameter value, or nullptr if the parameter was not found.
         */
        [[nodiscard]] const std::string* get(const std::string_view name) const {
            const auto it = parameters_.find(std::string(name));
            if (it != parameters_.end()) {
                return &it->second;
            }
            return nullptr;
        }

        [[nodiscard]] bool empty() const {
            return parameters_.empty();
        }

        void clear() {
            parameters_.clear();
        }

      private:
        std::map<std::string, std::string> parameters_;  // name => value
    };

    /**
     * Match a path against a pattern.
     * Note: if the pattern contains a parameter, the parameters argument must not be null, otherwise an error is
     * returned.
     * @param path The path to match (e.g. "/user/123").
     * @param pattern The pattern to match against (e.g. "/user/{id}").
     * @param parameters The parameters to fill with the extracted values from the path.
     * @return True if the path matches the pattern, false otherwise, or an error if the arguments are invalid.
     */
    [[nodiscard]] static boost::system::result<bool, Error>
    match(const std::string_view path, const std::string_view pattern, Parameters* parameters = nullptr) {
        if (path.empty() || pattern.empty()) {
            return false;
        }

        StringParser path_parser(path);
        StringParser pattern_parser(pattern);

        path_parser.skip('/');
        pattern_parser.skip('/');

        auto path_section = path_parser.split('/');
        auto pattern_section = pattern_parser.split('/');

        for (size_t i = 0; i < NMK_LOOP_UPPER_BOUND; ++i) {
            if (!path_section && !pattern_section) {
                return true;
            }

            if (!path_section || !pattern_section) {
                return false;
            }

            if (path_section == pattern_section || pattern_section == "*") {
                path_section = path_parser.split('/');
                pattern_section = pattern_parser.split('/');
                continue;
            }

            StringParser parameter_parser(*pattern_section);
            const auto leading = parameter_parser.read_until('{');
            const auto parameter_name = parameter_parser.read_until('}');
            const auto trailing = parameter_parser.read_until_end();

            if (!leading || !parameter_name || parameter_name->empty()) {
                return false;
            }

            auto parameter_value = *path_section;

            bool found = false;
            parameter_value = string_remove_prefix(parameter_value, *leading, &found);
            if (!found) {
                return false;
            }

            if (trailing) {
                parameter_value = string_remove_suffix(parameter_value, *trailing, &found);
                if (!found) {
                    return false;
                }
            }

            if (parameters == nullptr) {
                return Error::invalid_argument;
            }

            parameters->set(*parameter_name, parameter_value);

            path_section = path_parser.split('/');
            pattern_section = pattern_parser.split('/');
        }

        return false;
    }
};

inline std::ostream& operator<<(std::ostream& os, const PathMatcher::Error err) {
    switch (err) {
        case PathMatcher::Error::invalid_argument:
            os << "invalid_argument";
            break;
    }
    return os;
}

// Make PathMatcher::Error compatible with boost::system::result
BOOST_NORETURN BOOST_NOINLINE inline void
throw_exception_from_error(PathMatcher::Error const& e, boost::source_location const& loc) {
    boost::throw_with_location(std::runtime_error(fmt::format("PathMatcher::Error: {}", fmt::streamed(e))), loc);
}

}  // namespace nmk

template<>
struct fmt::formatter<nmk::PathMatcher::Error>: ostream_formatter {};
