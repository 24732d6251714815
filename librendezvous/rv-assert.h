// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include "librendezvous/rv-macros.h"

// Internal consistency checks. Built in when NDEBUG is not defined,
// or when RV_FORCE_ASSERTIONS is.

#if !defined(NDEBUG) || defined(RV_FORCE_ASSERTIONS)

// logs the failed check as critical, then aborts
[[noreturn]] bool rv_assert_failed(char const* file, long line, char const* expression);

#define RV_ASSERT(x) ((void)(RV_LIKELY(x) || rv_assert_failed(__FILE__, __LINE__, #x)))

#else

#define RV_ASSERT(x) ((void)0)

#endif
