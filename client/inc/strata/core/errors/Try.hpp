/*
 * Copyright (c) 2021, Andreas Kling <kling@serenityos.org>
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <nonstd/expected.hpp>
#include <strata/core/errors/Asserts.hpp>
#include <strata/core/errors/Diagnostics.hpp>
#include <utility>

namespace sta::error_detail {

// Returns the error alone, so it converts into an expected of any value type
// whose error type is constructible from it.
template<typename T, typename E>
static inline __attribute__((always_inline)) nonstd::unexpected_type<E>
extract_error(nonstd::expected<T, E>&& err) {
    return nonstd::unexpected_type<E>(std::move(err.error()));
}

} // namespace sta::error_detail

// NOTE: This macro works with any result type that has the expected APIs.
//
//       It depends on a non-standard C++ extension, specifically
//       on statement expressions [1]. This is known to be implemented
//       by at least clang and gcc.
//       [1] https://gcc.gnu.org/onlinedocs/gcc/Statement-Exprs.html
//
//       The value is moved out of the temporary result, so TRY cannot
//       yield a reference.
#define TRY(expression) \
    ({ \
        /* Ignore -Wshadow to allow nesting the macro. */ \
        STA_IGNORE_DIAGNOSTIC("-Wshadow", auto&& _temporary_result = (expression)); \
        if (!_temporary_result.has_value()) [[unlikely]] \
            return sta::error_detail::extract_error(std::move(_temporary_result)); \
        std::move(*_temporary_result); \
    })

#define MUST(expression) \
    ({ \
        /* Ignore -Wshadow to allow nesting the macro. */ \
        STA_IGNORE_DIAGNOSTIC("-Wshadow", auto&& _temporary_result = (expression)); \
        STA_ASSERT(_temporary_result.has_value(), "Expected contains an error"); \
        std::move(*_temporary_result); \
    })
