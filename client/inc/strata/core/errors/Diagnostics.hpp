/*
 * Copyright (c) 2022, Linus Groh <linusg@serenityos.org>
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

// Turns 'GCC diagnostic ignored' and the warning name into a single pragma
// string, "foo"#bar concatenation is not accepted inside _Pragma().
#define _STA_PRAGMA(x) _Pragma(#x)
#define STA_PRAGMA(x) _STA_PRAGMA(x)

// Runs a statement with one diagnostic disabled. Usable from other macros.
// NOTE: 'GCC' is also recognized by clang.
#define STA_IGNORE_DIAGNOSTIC(name, statement) \
    STA_PRAGMA(GCC diagnostic push);           \
    STA_PRAGMA(GCC diagnostic ignored name);   \
    statement;                                 \
    STA_PRAGMA(GCC diagnostic pop);

#define STA_BEGIN_NO_DEFAULT_CASE()  \
    STA_PRAGMA(GCC diagnostic push); \
    STA_PRAGMA(GCC diagnostic ignored "-Wswitch-default");

#define STA_END_NO_DEFAULT_CASE() STA_PRAGMA(GCC diagnostic pop);
