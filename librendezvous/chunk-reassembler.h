// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <cstddef> // size_t
#include <functional> // std::less
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct rv_error;

/**
 * Rebuilds messages that were split into indexed fragments for transport.
 *
 * Fragments may arrive in any order. A message is complete once the
 * fragment marked `is_last` has been seen and every index before it has
 * arrived. Buffers of messages that never complete are kept until
 * `discard()` is called, e.g. when the channel they arrived on closes.
 */
class rv_chunk_reassembler
{
public:
    struct Fragment
    {
        size_t index = 0;
        std::string payload;
        bool is_last = false;
    };

    // Split `message` into fragments of at most `max_length` bytes.
    // A `max_length` of 0 means no limit.
    [[nodiscard]] static std::vector<Fragment> split(std::string_view message, size_t max_length);

    // @return the whole message if this fragment completed it
    [[nodiscard]] std::optional<std::string> ingest(
        std::string_view message_id,
        size_t fragment_index,
        std::string_view payload,
        bool is_last,
        rv_error* error = nullptr);

    // @return true if a pending buffer was removed
    bool discard(std::string_view message_id);

    void clear() noexcept
    {
        buffers_.clear();
    }

    [[nodiscard]] bool contains(std::string_view message_id) const
    {
        return buffers_.find(message_id) != std::end(buffers_);
    }

    [[nodiscard]] size_t pending() const noexcept
    {
        return std::size(buffers_);
    }

private:
    struct Buffer
    {
        std::map<size_t, std::string> fragments;
        std::optional<size_t> last_index;

        [[nodiscard]] bool is_complete() const noexcept
        {
            return last_index && std::size(fragments) == *last_index + 1U;
        }
    };

    std::map<std::string, Buffer, std::less<>> buffers_;
};
