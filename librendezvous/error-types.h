// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <cerrno>

// Tracker already registered with this session
#define RV_ERROR_EEXIST EEXIST

// Unknown tracker or peer
#define RV_ERROR_ENOENT ENOENT

// Malformed input, e.g. a bad tracker URL or settings value
#define RV_ERROR_EINVAL EINVAL

// The transport refused or dropped a send
#define RV_ERROR_EIO EIO

constexpr inline bool rv_error_is_eexist(int code) noexcept
{
    return code == RV_ERROR_EEXIST;
}

constexpr inline bool rv_error_is_enoent(int code) noexcept
{
    return code == RV_ERROR_ENOENT;
}
