// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "librendezvous/utils.h"
#include "librendezvous/web-utils.h"

using namespace std::literals;

namespace
{
// scheme -> default port
auto constexpr TrackerSchemes = std::array<std::pair<std::string_view, uint16_t>, 5>{ {
    { "http"sv, 80U },
    { "https"sv, 443U },
    { "udp"sv, 80U },
    { "ws"sv, 80U },
    { "wss"sv, 443U },
} };

[[nodiscard]] std::optional<uint16_t> default_port(std::string_view scheme)
{
    for (auto const& [name, port] : TrackerSchemes)
    {
        if (name == scheme)
        {
            return port;
        }
    }

    return {};
}

[[nodiscard]] std::optional<uint16_t> parse_port(std::string_view str)
{
    auto port = uint16_t{};
    auto const* const end = std::data(str) + std::size(str);
    if (auto const [ptr, ec] = std::from_chars(std::data(str), end, port); std::empty(str) || ec != std::errc{} || ptr != end)
    {
        return {};
    }

    return port;
}

// printable ascii, no spaces
[[nodiscard]] bool is_url_char(char ch)
{
    return ch > ' ' && ch < '\x7f';
}
} // namespace

std::optional<rv_tracker_url> rv_urlParseTracker(std::string_view url)
{
    url = rv_strv_strip(url);
    if (std::empty(url) || !std::all_of(std::begin(url), std::end(url), is_url_char))
    {
        return {};
    }

    auto ret = rv_tracker_url{};

    auto const scheme_end = url.find("://"sv);
    if (scheme_end == std::string_view::npos)
    {
        return {};
    }

    ret.scheme = url.substr(0, scheme_end);
    auto const port_for_scheme = default_port(ret.scheme);
    if (!port_for_scheme)
    {
        return {};
    }

    url.remove_prefix(scheme_end + std::size("://"sv));
    auto const authority_end = url.find_first_of("/?#"sv);
    auto authority = url.substr(0, authority_end);
    url = authority_end == std::string_view::npos ? ""sv : url.substr(authority_end);

    // ipv6 literals are bracketed, e.g. "[::1]:6969"
    if (rv_strv_starts_with(authority, '['))
    {
        auto const close = authority.find(']');
        if (close == std::string_view::npos)
        {
            return {};
        }

        ret.host = authority.substr(1, close - 1);
        authority.remove_prefix(close + 1);
    }
    else
    {
        auto const colon = authority.find(':');
        ret.host = authority.substr(0, colon);
        authority.remove_prefix(colon == std::string_view::npos ? std::size(authority) : colon);
    }

    if (std::empty(ret.host))
    {
        return {};
    }

    if (std::empty(authority))
    {
        ret.port = *port_for_scheme;
    }
    else if (auto const port = rv_strv_starts_with(authority, ':') ? parse_port(authority.substr(1)) : std::nullopt; port)
    {
        ret.port = *port;
    }
    else
    {
        return {};
    }

    ret.path = url.substr(0, url.find_first_of("?#"sv));
    return ret;
}

bool rv_urlIsValidTracker(std::string_view url)
{
    return rv_urlParseTracker(url).has_value();
}

std::string rv_urlTrackerLogName(std::string_view url)
{
    auto const parsed = rv_urlParseTracker(url);
    if (!parsed)
    {
        return std::string{ url };
    }

    return rv_strv_contains(parsed->host, ':') ?
        fmt::format("{:s}://[{:s}]:{:d}", parsed->scheme, parsed->host, parsed->port) :
        fmt::format("{:s}://{:s}:{:d}", parsed->scheme, parsed->host, parsed->port);
}
