// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <cstdint> // uint16_t
#include <optional>
#include <string>
#include <string_view>

// --- tracker URLs

// The parts of an announce URL that the session cares about.
// Views point into the string that was parsed.
struct rv_tracker_url
{
    // wss://[2001:db8::1]:8443/announce?key=abc

    std::string_view scheme; // "wss"
    std::string_view host; // "2001:db8::1"
    std::string_view path; // "/announce", without query or fragment
    uint16_t port = 0; // 8443, or the scheme's default
};

// Accepts http, https, udp, ws and wss URLs that name a host.
// Surrounding whitespace is ignored.
[[nodiscard]] std::optional<rv_tracker_url> rv_urlParseTracker(std::string_view url);

[[nodiscard]] bool rv_urlIsValidTracker(std::string_view url);

// "scheme://host:port", which leaves out any credentials or passkeys
// carried in the path or query. Invalid URLs are returned unchanged.
[[nodiscard]] std::string rv_urlTrackerLogName(std::string_view url);
