// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "librendezvous/log.h" // for rv_log_level
#include "librendezvous/rendezvous.h" // for RV_DEFAULT_NUMWANT

struct rv_error;

struct rv_session_settings
{
    // tracker announce URLs, e.g. "wss://tracker.example.org/announce"
    std::vector<std::string> announce_urls;

    // the application identifier; its sha1 is the lookup key announced to trackers
    std::string identifier;

    // default number of peers to ask each tracker for
    int numwant = RV_DEFAULT_NUMWANT;

    // how often to re-announce to every tracker. 0 to only announce on demand
    std::chrono::seconds reannounce_interval = {};

    rv_log_level log_level = RV_LOG_INFO;

    // Load settings from a JSON object. Keys that aren't present keep their
    // current value; on error, nothing is changed.
    bool load(std::string_view json, rv_error* error = nullptr);

    bool load_file(std::string_view filename, rv_error* error = nullptr);
};
