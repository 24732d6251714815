// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <string_view>

struct rv_error;

/**
 * One negotiated data link to a remote peer.
 *
 * Implemented by the peer transport. A remote peer may be reachable through
 * several channels at once (e.g. one per tracker that reported it); they all
 * share a `peer_id()` and are told apart by `channel_name()`.
 *
 * The transport keeps a channel alive for the duration of any notification
 * it delivers to its observer.
 */
class rv_peer_channel
{
public:
    class Observer
    {
    public:
        virtual ~Observer() = default;

        // the data link is open and usable
        virtual void on_channel_connect(rv_peer_channel& channel) = 0;

        // the data link failed; no further notifications follow
        virtual void on_channel_error(rv_peer_channel& channel, rv_error const& error) = 0;

        // the data link was closed by either side
        virtual void on_channel_close(rv_peer_channel& channel) = 0;
    };

    virtual ~rv_peer_channel() = default;

    [[nodiscard]] virtual std::string_view peer_id() const noexcept = 0;
    [[nodiscard]] virtual std::string_view channel_name() const noexcept = 0;

    virtual bool send(std::string_view payload, rv_error* error = nullptr) = 0;

    // close the link. May notify `on_channel_close()` synchronously.
    virtual void destroy() = 0;

    // nullptr to stop receiving notifications
    virtual void set_observer(Observer* observer) = 0;
};
