// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

// --- Basic Types

#include <cstddef> // size_t
#include <cstdint> // uint64_t
#include <optional>

#include "librendezvous/rv-macros.h"

class rv_peer_channel;
class rv_session;
class rv_tracker_client;
struct rv_error;
struct rv_session_settings;

#define RV_DEFAULT_NUMWANT 50

/** @brief Counts of registered trackers and how many of them are connected */
struct rv_tracker_stats
{
    size_t connected = 0;
    size_t total = 0;

    [[nodiscard]] constexpr bool operator==(rv_tracker_stats const& that) const noexcept
    {
        return connected == that.connected && total == that.total;
    }

    [[nodiscard]] constexpr bool operator!=(rv_tracker_stats const& that) const noexcept
    {
        return !(*this == that);
    }
};

/**
 * @brief Options for one announce request.
 *
 * Unset fields are filled in by `with_defaults()` before the request
 * reaches a tracker client.
 */
struct rv_announce_opts
{
    std::optional<int> numwant;
    std::optional<uint64_t> uploaded;
    std::optional<uint64_t> downloaded;

    [[nodiscard]] rv_announce_opts with_defaults(int default_numwant = RV_DEFAULT_NUMWANT) const noexcept
    {
        auto ret = *this;

        if (!ret.numwant)
        {
            ret.numwant = default_numwant;
        }

        if (!ret.uploaded)
        {
            ret.uploaded = 0U;
        }

        if (!ret.downloaded)
        {
            ret.downloaded = 0U;
        }

        return ret;
    }
};
