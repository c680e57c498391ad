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

#include "log.hpp"
#include "assert.hpp"

// Include point for tl::expected. Every fallible relaykit operation returns tl::expected<T, Error> or
// tl::expected<T, std::string>, and dereferencing one that holds an error is reported through RLY_ASSERT instead of
// tl's own assert. Include this header rather than <tl/expected.hpp> so the override is in place.

#ifdef TL_ASSERT
    #error "TL_ASSERT is already defined. Please include this header before including <tl/expected.hpp>."
#else
    #define TL_ASSERT(condition) RLY_ASSERT(condition, "tl::expected assertion failed: " #condition)
#endif

#include <tl/expected.hpp>
