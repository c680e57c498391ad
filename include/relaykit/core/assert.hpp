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

#include "exception.hpp"
#include "log.hpp"

#include <cstdlib>
#include <iostream>

#ifndef RLY_LOG_ON_ASSERT
    #define RLY_LOG_ON_ASSERT 1  // Enabled by default
#endif

#ifndef RLY_THROW_EXCEPTION_ON_ASSERT
    #define RLY_THROW_EXCEPTION_ON_ASSERT 0
#endif

#ifndef RLY_ABORT_ON_ASSERT
    #define RLY_ABORT_ON_ASSERT 0
#endif

#define RLY_LOG_IF_ENABLED(msg) \
    if (RLY_LOG_ON_ASSERT) {    \
        RLY_CRITICAL(msg);      \
    }

#define RLY_THROW_EXCEPTION_IF_ENABLED(msg) \
    if (RLY_THROW_EXCEPTION_ON_ASSERT) {    \
        RLY_THROW_EXCEPTION(msg);           \
    }

#define RLY_ABORT_IF_ENABLED(msg)                                  \
    if (RLY_ABORT_ON_ASSERT) {                                     \
        std::cerr << "Abort on assertion: " << (msg) << std::endl; \
        std::abort();                                              \
    }

#define RLY_ASSERT(condition, message)                                    \
    do {                                                                  \
        if (!(condition)) {                                               \
            RLY_LOG_IF_ENABLED("Assertion failure: " message)             \
            RLY_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            RLY_ABORT_IF_ENABLED(message)                                 \
        }                                                                 \
    } while (false)

#define RLY_ASSERT_RETURN(condition, message)                             \
    do {                                                                  \
        if (!(condition)) {                                               \
            RLY_LOG_IF_ENABLED("Assertion failure: " message)             \
            RLY_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            RLY_ABORT_IF_ENABLED(message)                                 \
            return;                                                       \
        }                                                                 \
    } while (false)

#define RLY_ASSERT_RETURN_WITH(condition, message, return_value)          \
    do {                                                                  \
        if (!(condition)) {                                               \
            RLY_LOG_IF_ENABLED("Assertion failure: " message)             \
            RLY_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            RLY_ABORT_IF_ENABLED(message)                                 \
            return return_value;                                          \
        }                                                                 \
    } while (false)

#define RLY_ASSERT_NO_THROW(condition, message)               \
    do {                                                      \
        if (!(condition)) {                                   \
            RLY_LOG_IF_ENABLED("Assertion failure: " message) \
            RLY_ABORT_IF_ENABLED(message)                     \
        }                                                     \
    } while (false)

#define RLY_ASSERT_FALSE(message) RLY_ASSERT(false, message)
