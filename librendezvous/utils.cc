// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring> // strerror()
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "librendezvous/error.h"
#include "librendezvous/log.h"
#include "librendezvous/utils.h"

char const* rv_strerror(int errnum)
{
    if (char const* const ret = strerror(errnum); ret != nullptr)
    {
        return ret;
    }

    return "Unknown Error";
}

// ---

std::string_view rv_strv_strip(std::string_view str)
{
    auto constexpr Test = [](auto ch)
    {
        return isspace(static_cast<unsigned char>(ch));
    };

    auto const it = std::find_if_not(std::begin(str), std::end(str), Test);
    str.remove_prefix(std::distance(std::begin(str), it));

    auto const rit = std::find_if_not(std::rbegin(str), std::rend(str), Test);
    str.remove_suffix(std::distance(std::rbegin(str), rit));

    return str;
}

// ---

std::optional<std::string> rv_file_read(std::string_view filename, rv_error* error)
{
    auto const szfilename = std::string{ filename };

    errno = 0;
    auto in = std::ifstream{ szfilename, std::ios::in | std::ios::binary };
    if (!in)
    {
        auto const err = errno != 0 ? errno : ENOENT;
        rv_logAddError(fmt::format(
            "Couldn't read '{path}': {error} ({error_code})",
            fmt::arg("path", filename),
            fmt::arg("error", rv_strerror(err)),
            fmt::arg("error_code", err)));
        rv_error_set_from_errno(error, err);
        return {};
    }

    auto buf = std::ostringstream{};
    buf << in.rdbuf();
    if (in.bad())
    {
        rv_error_set_from_errno(error, EIO);
        return {};
    }

    return buf.str();
}
