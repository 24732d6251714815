// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include "librendezvous/rv-assert.h"

#if !defined(NDEBUG) || defined(RV_FORCE_ASSERTIONS)

#include <cstdlib>

#include <fmt/core.h>

#include "librendezvous/log.h"

[[noreturn]] bool rv_assert_failed(char const* file, long line, char const* expression)
{
    rv_logAddMessage(file, line, RV_LOG_CRITICAL, fmt::format("Check failed: {:s}", expression), "assert");
    std::abort();
}

#endif
