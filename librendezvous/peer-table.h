// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <cstddef> // size_t
#include <functional> // std::less
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <small/map.hpp>

#include "librendezvous/observable.h"
#include "librendezvous/peer-channel.h"
#include "librendezvous/rv-macros.h"

struct rv_error;

/**
 * Maps each remote peer to the set of channels currently open to it.
 *
 * The same peer is often reported by several trackers, each of which
 * negotiates its own channel. All of them are kept as backups: a peer
 * stays connected for as long as at least one of its channels is open.
 * `peer_connected_` fires when a peer's first channel opens and
 * `peer_closed_` when its last channel goes away.
 */
class rv_peer_table final : public rv_peer_channel::Observer
{
public:
    using PeerObservable = librendezvous::SimpleObservable<rv_peer_channel&>;

    // peer id -> names of its open channels
    using Snapshot = std::map<std::string, std::vector<std::string>, std::less<>>;

    rv_peer_table() = default;
    ~rv_peer_table() override;

    RV_DISABLE_COPY_MOVE(rv_peer_table)

    // A tracker produced a peer offer that is still being negotiated.
    void add_candidate(std::shared_ptr<rv_peer_channel> channel);

    // Destroy every pending and open channel.
    // Emits `peer_closed_` once per peer that was connected.
    void close_all();

    // Send `payload` to `peer_id` on the first of its channels that accepts it.
    bool send(std::string_view peer_id, std::string_view payload, rv_error* error = nullptr);

    [[nodiscard]] bool contains(std::string_view peer_id) const
    {
        return peers_.find(peer_id) != std::end(peers_);
    }

    [[nodiscard]] size_t size() const noexcept
    {
        return std::size(peers_);
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return std::empty(peers_);
    }

    [[nodiscard]] size_t pending_count() const noexcept
    {
        return std::size(pending_);
    }

    [[nodiscard]] Snapshot snapshot() const;

    [[nodiscard]] std::vector<std::shared_ptr<rv_peer_channel>> channels(std::string_view peer_id) const;

    // rv_peer_channel::Observer
    void on_channel_connect(rv_peer_channel& channel) override;
    void on_channel_error(rv_peer_channel& channel, rv_error const& error) override;
    void on_channel_close(rv_peer_channel& channel) override;

    PeerObservable peer_connected_;
    PeerObservable peer_closed_;

private:
    // channel name -> channel
    using Channels = small::map<std::string, std::shared_ptr<rv_peer_channel>, 4U>;

    void remove_channel(rv_peer_channel& channel);

    std::map<std::string, Channels, std::less<>> peers_;
    small::map<rv_peer_channel*, std::shared_ptr<rv_peer_channel>> pending_;
};
