// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include "librendezvous/rendezvous.h"

class rv_peer_channel;
struct rv_error;

/** @brief A tracker's reply to an announce */
struct rv_tracker_response
{
    std::string_view announce_url;

    // swarm counts, if the tracker sent them
    std::optional<int> complete;
    std::optional<int> incomplete;
};

/**
 * Connection to one tracker used as a signaling server.
 *
 * Implemented by the tracker protocol layer, which owns the wire format,
 * the socket and any reconnect policy. Results are reported to the
 * `Mediator` the client was created with.
 */
class rv_tracker_client
{
public:
    enum class Teardown
    {
        // drop signaling state but leave established peer channels open
        KeepPeerChannels,

        // also destroy any peer channels the tracker is still negotiating
        ClosePeerChannels
    };

    class Mediator
    {
    public:
        virtual ~Mediator() = default;

        // the lookup key to announce, as lowercase hex
        [[nodiscard]] virtual std::string_view info_hash() const = 0;

        // our own peer id, as lowercase hex
        [[nodiscard]] virtual std::string_view peer_id() const = 0;

        // the tracker handed us a peer offer
        virtual void on_peer(std::shared_ptr<rv_peer_channel> channel) = 0;

        // the tracker answered an announce
        virtual void on_update(rv_tracker_response const& response) = 0;

        // the tracker connection reported a problem
        virtual void on_warning(std::string_view announce_url, rv_error const& error) = 0;
    };

    virtual ~rv_tracker_client() = default;

    [[nodiscard]] virtual std::string_view announce_url() const noexcept = 0;
    [[nodiscard]] virtual bool is_connected() const noexcept = 0;

    virtual void announce(rv_announce_opts const& opts) = 0;
    virtual void destroy(Teardown mode) = 0;
};
