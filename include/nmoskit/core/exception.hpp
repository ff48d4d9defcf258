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

#include "platform.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <string>

#define NMK_THROW_EXCEPTION(msg) throw nmk::Exception(msg, __FILE__, __LINE__, NMK_FUNCTION)

namespace nmk {

/**
 * Exception type thrown by NMK_THROW_EXCEPTION. Remembers where it was thrown.
 */
class Exception: public std::runtime_error {
  public:
    Exception(const std::string& msg, const char* file, const int line, const char* function_name) :
        std::runtime_error(msg), location_(fmt::format("{}:{} ({})", file, line, function_name)) {}

    /**
     * @return Where the exception was thrown, formatted as "file:line (function)".
     */
    [[nodiscard]] const std::string& location() const noexcept {
        return location_;
    }

  private:
    std::string location_;
};

}  // namespace nmk
