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

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace nmk {

/**
 * Returns a copy of string with given prefix removed, if prefix is found at the start of string.
 * @param string String to remove prefix from.
 * @param prefix_to_remove Prefix to find and remove.
 * @param found If not null, will be set to true if the prefix was found and removed, false otherwise.
 * @return The string with the prefix removed, or the original string if the prefix was not found.
 */
inline std::string_view
string_remove_prefix(const std::string_view& string, const std::string_view prefix_to_remove, bool* found = nullptr) {
    if (string.substr(0, prefix_to_remove.size()) != prefix_to_remove) {
        if (found) {
            *found = false;
        }
        return string;
    }

    if (found) {
        *found = true;
    }

    return string.substr(prefix_to_remove.size());
}

/**
 * Returns a copy of string with given suffix removed, if suffix is found at the end of string.
 * @param string String to remove suffix from.
 * @param suffix_to_remove Suffix to find and remove.
 * @param found If not null, will be set to true if the suffix was found and removed, false otherwise.
 * @return The string with the suffix removed, or the original string if the suffix was not found.
 */
inline std::string_view
string_remove_suffix(const std::string_view& string, const std::string_view suffix_to_remove, bool* found = nullptr) {
    if (suffix_to_remove.size() > string.size()
        || string.substr(string.size() - suffix_to_remove.size()) != suffix_to_remove) {
        if (found) {
            *found = false;
        }
        return string;
    }

    if (found) {
        *found = true;
    }

    return string.substr(0, string.size() - suffix_to_remove.size());
}

/**
 * String to number - a small convenience function around std::from_chars.
 * @tparam Type Type of the value to convert from a string.
 * @param string String to convert to a value.
 * @param strict If true, the whole string must be a number, otherwise only the beginning of the string must be a
 * number.
 * @param base Base of the number to convert. When 16, the "0x" and "0X" prefixes are not recognized.
 * @return The converted value as optional, which will contain a value on success or will be empty on failure.
 */
template<typename Type>
std::enable_if_t<std::is_integral_v<Type>, std::optional<Type>>
string_to_int(std::string_view string, const bool strict = false, const int base = 10) {
    Type result {};
    auto [p, ec] = std::from_chars(string.data(), string.data() + string.size(), result, base);
    if (ec == std::errc() && (!strict || p >= string.data() + string.size()))
        return result;
    return {};
}

/**
 * Splits a string into a vector of strings based on a delimiter. Empty parts are skipped.
 * @param string The string to split.
 * @param delimiter The delimiter to split the string by.
 * @return A vector of strings.
 */
inline std::vector<std::string> string_split(const std::string_view string, const char delimiter) {
    std::vector<std::string> results;

    size_t prev = 0;
    size_t next = 0;

    while ((next = string.find(delimiter, prev)) != std::string_view::npos) {
        if (next - prev != 0) {
            results.emplace_back(string.substr(prev, next - prev));
        }
        prev = next + 1;
    }

    if (prev < string.size()) {
        results.emplace_back(string.substr(prev));
    }

    return results;
}

/**
 * Removes leading and trailing spaces and tabs.
 * @param string The string to trim.
 * @return A view into the trimmed part of the string.
 */
inline std::string_view string_trim(std::string_view string) {
    while (!string.empty() && (string.front() == ' ' || string.front() == '\t')) {
        string.remove_prefix(1);
    }
    while (!string.empty() && (string.back() == ' ' || string.back() == '\t')) {
        string.remove_suffix(1);
    }
    return string;
}

/**
 * Compares 2 strings case-insensitively.
 * @param lhs Left hand side
 * @param rhs Right hand side
 * @return True if strings are equal, false otherwise.
 */
inline bool string_compare_case_insensitive(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }

    return true;
}

}  // namespace nmk
