#pragma once

#include <fmt/format.h>

#include <cstdio>
#include <exception>
#include <string>
#include <utility>

template <typename... Args>
[[noreturn]] static void strata_assert(const char* file, int line, const char* assertion,
                                       fmt::format_string<Args...> fmt, Args&&... args)
{
    std::string msg = fmt::format(fmt, std::forward<Args>(args)...);

    fmt::print(stderr, "{}:{} - Assertion '{}' failed: {}\n", file, line, assertion, msg);
    std::terminate();
}

#define STA_ASSERT(expression, text, args...)                                          \
    if (!(expression))                                                                 \
    {                                                                                  \
        strata_assert(__FILE__, __LINE__, #expression, FMT_STRING(text), ##args);      \
    }
