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

#if defined(__GNUC__) || defined(__clang__)
    #define RLY_FUNCTION __PRETTY_FUNCTION__
#elif defined(_MSC_VER)
    #define RLY_FUNCTION __FUNCSIG__
#else
    #define RLY_FUNCTION __func__
#endif

#if defined(_WIN32) && !defined(NOMINMAX)
    #error "Please define NOMINMAX as compile constant in your build system."
#endif
