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

#include "format.hpp"
#include "platform.hpp"

#include <stdexcept>
#include <string>

/**
 * Throws an rly::Exception carrying the location of the throw.
 */
#define RLY_THROW_EXCEPTION(msg) throw rly::Exception(msg, __FILE__, __LINE__, RLY_FUNCTION)

namespace rly {

/**
 * Raised for errors the caller cannot recover from locally, like an invalid configuration or a port that cannot be
 * bound. Recoverable errors are returned as tl::expected instead.
 */
class Exception: public std::runtime_error {
  public:
    explicit Exception(
        const std::string& msg, const char* file = nullptr, const int line = -1, const char* function_name = nullptr
    ) :
        std::runtime_error(msg), file_(file), line_(line), function_name_(function_name) {}

    /**
     * @return The file where the exception was thrown, or nullptr if unknown.
     */
    [[nodiscard]] const char* file() const {
        return file_;
    }

    [[nodiscard]] int line() const {
        return line_;
    }

    [[nodiscard]] const char* function_name() const {
        return function_name_;
    }

    /**
     * @return The message followed by the location of the throw, when known.
     */
    [[nodiscard]] std::string to_string() const {
        if (file_ == nullptr) {
            return what();
        }
        return fmt::format("{} ({}:{} in {})", what(), file_, line_, function_name_ ? function_name_ : "?");
    }

  private:
    const char* file_ {};
    int line_ {};
    const char* function_name_ {};
};

}  // namespace rly
