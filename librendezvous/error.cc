// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "librendezvous/error.h"
#include "librendezvous/utils.h" // rv_strerror()

void rv_error::set(int code, std::string_view message)
{
    code_ = code;
    message_.assign(message);
}

void rv_error::add_context(std::string_view context)
{
    message_ = fmt::format("{:s}: {:s}", context, message_);
}

// ---

void rv_error_set(rv_error* error, int code, std::string_view message)
{
    if (error != nullptr)
    {
        error->set(code, message);
    }
}

void rv_error_set_from_errno(rv_error* error, int errnum)
{
    rv_error_set(error, errnum, rv_strerror(errnum));
}

void rv_error_propagate(rv_error* tgt, rv_error&& src)
{
    if (tgt != nullptr)
    {
        *tgt = std::move(src);
    }
}
