// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

// ---

enum rv_log_level
{
    // No logging at all
    RV_LOG_OFF,

    // Errors that prevent the session from running
    RV_LOG_CRITICAL,

    // Errors that break a single operation, e.g. an unreadable settings file
    RV_LOG_ERROR,

    // Smaller errors that don't stop the overall system,
    // e.g. a tracker warning or one failed channel of a redundant peer
    RV_LOG_WARN,

    // User-visible info, e.g. "peer connected"
    RV_LOG_INFO,

    // Debug messages
    RV_LOG_DEBUG,

    // High-volume debug messages, e.g. every announce and fragment
    RV_LOG_TRACE
};

std::optional<rv_log_level> rv_logGetLevelFromKey(std::string_view key);

[[nodiscard]] std::string_view rv_logLevelKey(rv_log_level level);

// ---

struct rv_log_message
{
    rv_log_level level;

    // source file name, without its directories
    std::string_view file;
    long line;

    // the tracker or peer the message is about, or "file:line"
    std::string_view name;

    std::string_view message;
};

// Receives every message at an active level. The default sink prints to stderr.
using rv_log_sink = std::function<void(rv_log_message const&)>;

// Replace the sink; an empty one restores the default. Returns the previous sink.
rv_log_sink rv_logSetSink(rv_log_sink sink);

// ---

void rv_logSetLevel(rv_log_level);

[[nodiscard]] rv_log_level rv_logGetLevel();

[[nodiscard]] bool rv_logLevelIsActive(rv_log_level level);

// ---

void rv_logAddMessage(
    char const* source_file,
    long source_line,
    rv_log_level level,
    std::string&& msg,
    std::string_view module_name = {});

#define rv_logAddLevel(level, ...) \
    do \
    { \
        if (rv_logLevelIsActive(level)) \
        { \
            rv_logAddMessage(__FILE__, __LINE__, level, __VA_ARGS__); \
        } \
    } while (0)

#define rv_logAddCritical(...) rv_logAddLevel(RV_LOG_CRITICAL, __VA_ARGS__)
#define rv_logAddError(...) rv_logAddLevel(RV_LOG_ERROR, __VA_ARGS__)
#define rv_logAddWarn(...) rv_logAddLevel(RV_LOG_WARN, __VA_ARGS__)
#define rv_logAddInfo(...) rv_logAddLevel(RV_LOG_INFO, __VA_ARGS__)
#define rv_logAddDebug(...) rv_logAddLevel(RV_LOG_DEBUG, __VA_ARGS__)
#define rv_logAddTrace(...) rv_logAddLevel(RV_LOG_TRACE, __VA_ARGS__)
