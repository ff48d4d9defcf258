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

#include <charconv>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>

namespace nmk {

/**
 * A handy utility class for parsing strings. It works like a stream, where it maintains a position in the string and
 * subsequent calls will read from that position.
 */
class StringParser {
  public:
    /**
     * Constructs a parser from given string view. Doesn't take ownership of the string, so make sure for the original
     * string to outlive this parser instance.
     * @param str The string to parse.
     */
    explicit StringParser(const std::string_view str) : str_(str) {}

    /**
     * Reads a string until the given delimiter. If delimiter is not found, the rest of the string is returned.
     * @param delimiter The character to read until. It is consumed but not returned.
     * @return The read string, or an empty optional if the string is exhausted.
     */
    std::optional<std::string_view> read_until(const char delimiter) {
        if (str_.empty()) {
            return std::nullopt;
        }

        const auto pos = str_.find(delimiter);
        if (pos == std::string_view::npos) {
            auto str = str_;
            str_ = {};
            return str;
        }

        const auto substr = str_.substr(0, pos);
        str_.remove_prefix(pos + 1);
        return substr;
    }

    /**
     * Reads the rest of the string.
     * @return The read string, or an empty optional if the string is exhausted.
     */
    std::optional<std::string_view> read_until_end() {
        if (str_.empty()) {
            return std::nullopt;
        }
        auto str = str_;
        str_ = {};
        return str;
    }

    /**
     * Returns the next section up to the given delimiter. Consecutive delimiters produce empty sections.
     * @param delimiter The delimiter separating the sections.
     * @return The next section, or an empty optional if the string is exhausted.
     */
    std::optional<std::string_view> split(const char delimiter) {
        return read_until(delimiter);
    }

    /**
     * Tries to read an integer from the string. If successful, the integer is returned and consumed, otherwise an
     * empty optional is returned and nothing is consumed.
     * @tparam T The type of the integer to read.
     * @return The read integer or an empty optional.
     */
    template<class T>
    std::optional<T> read_int() {
        T value {};
        const auto result = std::from_chars(str_.data(), str_.data() + str_.size(), value);
        if (result.ec == std::errc()) {
            str_.remove_prefix(static_cast<size_t>(result.ptr - str_.data()));
            return value;
        }
        return std::nullopt;
    }

    /**
     * Skips the given sequence of characters from the beginning of the string.
     * @param chars The characters to skip.
     * @return True if the sequence was skipped, or false otherwise.
     */
    bool skip(const char* chars) {
        const auto length = std::strlen(chars);
        if (str_.substr(0, length) == std::string_view(chars, length)) {
            str_.remove_prefix(length);
            return true;
        }
        return false;
    }

    /**
     * Skips the given character from the beginning of the string.
     * @param chr The character to skip.
     * @return True if the character was skipped, or false otherwise.
     */
    bool skip(const char chr) {
        if (!str_.empty() && str_.front() == chr) {
            str_.remove_prefix(1);
            return true;
        }
        return false;
    }

    /**
     * @return True if the string is exhausted, or false otherwise.
     */
    [[nodiscard]] bool exhausted() const {
        return str_.empty();
    }

  private:
    std::string_view str_;
};

}  // namespace nmk
