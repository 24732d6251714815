// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <algorithm> // std::min
#include <cstddef> // size_t
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "librendezvous/chunk-reassembler.h"
#include "librendezvous/error-types.h"
#include "librendezvous/error.h"
#include "librendezvous/log.h"

std::vector<rv_chunk_reassembler::Fragment> rv_chunk_reassembler::split(std::string_view message, size_t max_length)
{
    auto fragments = std::vector<Fragment>{};

    if (max_length == 0U)
    {
        max_length = std::max(std::size(message), size_t{ 1U });
    }

    do
    {
        auto const n = std::min(std::size(message), max_length);
        auto& fragment = fragments.emplace_back();
        fragment.index = std::size(fragments) - 1U;
        fragment.payload.assign(message.substr(0, n));
        message.remove_prefix(n);
    } while (!std::empty(message));

    fragments.back().is_last = true;
    return fragments;
}

std::optional<std::string> rv_chunk_reassembler::ingest(
    std::string_view message_id,
    size_t fragment_index,
    std::string_view payload,
    bool is_last,
    rv_error* error)
{
    auto iter = buffers_.find(message_id);
    if (iter == std::end(buffers_))
    {
        iter = buffers_.emplace(std::string{ message_id }, Buffer{}).first;
    }

    auto& buffer = iter->second;

    if (buffer.last_index)
    {
        if (fragment_index > *buffer.last_index)
        {
            rv_error_set(
                error,
                RV_ERROR_EINVAL,
                fmt::format(
                    "Fragment {index} of message '{message_id}' is past its last fragment {last_index}",
                    fmt::arg("index", fragment_index),
                    fmt::arg("message_id", message_id),
                    fmt::arg("last_index", *buffer.last_index)));
            return {};
        }

        if (is_last && fragment_index != *buffer.last_index)
        {
            rv_error_set(
                error,
                RV_ERROR_EINVAL,
                fmt::format(
                    "Message '{message_id}' already ended at fragment {last_index}",
                    fmt::arg("message_id", message_id),
                    fmt::arg("last_index", *buffer.last_index)));
            return {};
        }
    }
    else if (is_last && !std::empty(buffer.fragments) && buffer.fragments.rbegin()->first > fragment_index)
    {
        rv_error_set(
            error,
            RV_ERROR_EINVAL,
            fmt::format(
                "Message '{message_id}' has fragments past its last fragment {index}",
                fmt::arg("message_id", message_id),
                fmt::arg("index", fragment_index)));
        return {};
    }

    buffer.fragments.insert_or_assign(fragment_index, std::string{ payload });

    if (is_last)
    {
        buffer.last_index = fragment_index;
    }

    if (!buffer.is_complete())
    {
        return {};
    }

    auto message = std::string{};
    for (auto const& [index, fragment] : buffer.fragments)
    {
        message += fragment;
    }

    rv_logAddTrace(fmt::format(
        "Reassembled message '{message_id}' from {count} fragments ({size} bytes)",
        fmt::arg("message_id", message_id),
        fmt::arg("count", std::size(buffer.fragments)),
        fmt::arg("size", std::size(message))));

    buffers_.erase(iter);
    return message;
}

bool rv_chunk_reassembler::discard(std::string_view message_id)
{
    auto const iter = buffers_.find(message_id);
    if (iter == std::end(buffers_))
    {
        return false;
    }

    rv_logAddTrace(fmt::format(
        "Discarding {count} fragments of message '{message_id}'",
        fmt::arg("count", std::size(iter->second.fragments)),
        fmt::arg("message_id", message_id)));

    buffers_.erase(iter);
    return true;
}
