// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <array>
#include <cerrno>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "librendezvous/log.h"
#include "librendezvous/rv-assert.h"
#include "librendezvous/utils.h"

using namespace std::literals;

namespace
{
auto constexpr LevelKeys = std::array<std::string_view, 7>{ "off"sv,  "critical"sv, "error"sv, "warn"sv,
                                                            "info"sv, "debug"sv,    "trace"sv };

static_assert(std::size(LevelKeys) == RV_LOG_TRACE + 1);

void print_to_stderr(rv_log_message const& msg)
{
    fmt::print(stderr, "[{:s}] {:s}: {:s}\n", rv_logLevelKey(msg.level), msg.name, msg.message);
}

struct log_state
{
    std::mutex mutex;
    rv_log_level level = RV_LOG_ERROR;
    rv_log_sink sink = print_to_stderr;
};

log_state& state()
{
    static auto* const instance = new log_state{};
    return *instance;
}

// "/src/librendezvous/session.cc" -> "session.cc"
[[nodiscard]] std::string_view strip_source_dirs(std::string_view path)
{
    if (auto const pos = path.find_last_of("/\\"); pos != std::string_view::npos)
    {
        path.remove_prefix(pos + 1);
    }

    return std::empty(path) ? "?"sv : path;
}
} // namespace

// ---

std::optional<rv_log_level> rv_logGetLevelFromKey(std::string_view key_in)
{
    auto const key = rv_strlower(rv_strv_strip(key_in));

    for (size_t i = 0; i < std::size(LevelKeys); ++i)
    {
        if (key == LevelKeys[i])
        {
            return static_cast<rv_log_level>(i);
        }
    }

    return {};
}

std::string_view rv_logLevelKey(rv_log_level level)
{
    auto const idx = static_cast<size_t>(level);
    return idx < std::size(LevelKeys) ? LevelKeys[idx] : "?"sv;
}

rv_log_level rv_logGetLevel()
{
    auto const lock = std::lock_guard{ state().mutex };
    return state().level;
}

bool rv_logLevelIsActive(rv_log_level level)
{
    return rv_logGetLevel() >= level;
}

void rv_logSetLevel(rv_log_level level)
{
    auto const lock = std::lock_guard{ state().mutex };
    state().level = level;
}

rv_log_sink rv_logSetSink(rv_log_sink sink)
{
    if (!sink)
    {
        sink = print_to_stderr;
    }

    auto const lock = std::lock_guard{ state().mutex };
    std::swap(sink, state().sink);
    return sink;
}

void rv_logAddMessage(char const* file, long line, rv_log_level level, std::string&& msg, std::string_view name)
{
    RV_ASSERT(!std::empty(msg));

    if (std::empty(msg) || !rv_logLevelIsActive(level))
    {
        return;
    }

    // logging must not clobber the errno of whatever is being reported
    int const err = errno;

    auto const filename = strip_source_dirs(file != nullptr ? file : "");

    auto name_fallback = std::string{};
    if (std::empty(name))
    {
        name_fallback = fmt::format("{:s}:{:d}", filename, line);
        name = name_fallback;
    }

    // copy the sink so that it can log or replace itself
    auto sink = rv_log_sink{};
    {
        auto const lock = std::lock_guard{ state().mutex };
        sink = state().sink;
    }

    sink(rv_log_message{ level, filename, line, name, msg });

    errno = err;
}
