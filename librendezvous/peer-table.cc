// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "librendezvous/error-types.h"
#include "librendezvous/error.h"
#include "librendezvous/log.h"
#include "librendezvous/peer-channel.h"
#include "librendezvous/peer-table.h"
#include "librendezvous/rv-assert.h"

#define rv_logAddDebugChannel(channel, msg) rv_logAddDebug(msg, log_name(channel))
#define rv_logAddWarnChannel(channel, msg) rv_logAddWarn(msg, log_name(channel))

namespace
{
[[nodiscard]] std::string log_name(rv_peer_channel const& channel)
{
    // peer ids are long; the first few hex chars are enough to tell peers apart in a log
    return fmt::format("{:.8s}/{:s}", channel.peer_id(), channel.channel_name());
}
} // namespace

rv_peer_table::~rv_peer_table()
{
    for (auto const& [key, channel] : pending_)
    {
        channel->set_observer(nullptr);
    }

    for (auto const& [peer_id, channels] : peers_)
    {
        for (auto const& [name, channel] : channels)
        {
            channel->set_observer(nullptr);
        }
    }
}

void rv_peer_table::add_candidate(std::shared_ptr<rv_peer_channel> channel)
{
    RV_ASSERT(channel);

    rv_logAddDebugChannel(*channel, "Got peer offer");

    auto* const key = channel.get();
    channel->set_observer(this);
    pending_[key] = std::move(channel);
}

void rv_peer_table::on_channel_connect(rv_peer_channel& channel)
{
    auto const pending_iter = pending_.find(&channel);
    if (pending_iter == std::end(pending_))
    {
        // already connected, or a channel we let go of
        rv_logAddDebugChannel(channel, "Ignoring connect from untracked channel");
        return;
    }

    auto owned = std::move(pending_iter->second);
    pending_.erase(&channel);

    auto peer_iter = peers_.find(channel.peer_id());
    auto const is_new_peer = peer_iter == std::end(peers_);
    if (is_new_peer)
    {
        peer_iter = peers_.emplace(std::string{ channel.peer_id() }, Channels{}).first;
    }

    // Several trackers may hand us the same peer. Keep every channel as a
    // backup; a second channel with the same name replaces the first.
    auto& channels = peer_iter->second;
    auto& slot = channels[std::string{ channel.channel_name() }];
    if (slot && slot.get() != &channel)
    {
        rv_logAddDebugChannel(channel, "Replacing channel with the same name");
        slot->set_observer(nullptr);
    }
    slot = std::move(owned);

    rv_logAddDebugChannel(
        channel,
        fmt::format("Channel connected ({count} open to this peer)", fmt::arg("count", std::size(channels))));

    if (is_new_peer)
    {
        rv_logAddInfo(fmt::format("Peer {peer_id} connected", fmt::arg("peer_id", channel.peer_id())));
        peer_connected_.emit(channel);
    }
}

void rv_peer_table::on_channel_error(rv_peer_channel& channel, rv_error const& error)
{
    rv_logAddWarnChannel(
        channel,
        fmt::format(
            "Error in connection: {error} ({error_code})",
            fmt::arg("error", error.message()),
            fmt::arg("error_code", error.code())));

    remove_channel(channel);
}

void rv_peer_table::on_channel_close(rv_peer_channel& channel)
{
    rv_logAddDebugChannel(channel, "Connection closed");

    remove_channel(channel);
}

void rv_peer_table::remove_channel(rv_peer_channel& channel)
{
    if (auto const pending_iter = pending_.find(&channel); pending_iter != std::end(pending_))
    {
        // keep it alive until we're done handling its notification
        auto const doomed = std::move(pending_iter->second);
        pending_.erase(&channel);
        doomed->set_observer(nullptr);
        return;
    }

    auto const peer_iter = peers_.find(channel.peer_id());
    if (peer_iter == std::end(peers_))
    {
        return;
    }

    auto& channels = peer_iter->second;
    auto const name = std::string{ channel.channel_name() };
    auto const channel_iter = channels.find(name);
    if (channel_iter == std::end(channels) || channel_iter->second.get() != &channel)
    {
        return;
    }

    auto const doomed = std::move(channel_iter->second);
    channels.erase(name);
    doomed->set_observer(nullptr);

    // all data channels are gone: peer lost
    if (std::empty(channels))
    {
        peers_.erase(peer_iter);
        rv_logAddInfo(fmt::format("Peer {peer_id} disconnected", fmt::arg("peer_id", doomed->peer_id())));
        peer_closed_.emit(*doomed);
    }
}

void rv_peer_table::close_all()
{
    auto pending = decltype(pending_){};
    std::swap(pending, pending_);

    auto peers = decltype(peers_){};
    std::swap(peers, peers_);

    for (auto const& [key, channel] : pending)
    {
        channel->set_observer(nullptr);
        channel->destroy();
    }

    for (auto const& [peer_id, channels] : peers)
    {
        RV_ASSERT(!std::empty(channels));

        for (auto const& [name, channel] : channels)
        {
            channel->set_observer(nullptr);
            channel->destroy();
        }

        peer_closed_.emit(*std::begin(channels)->second);
    }
}

bool rv_peer_table::send(std::string_view peer_id, std::string_view payload, rv_error* error)
{
    auto const peer_iter = peers_.find(peer_id);
    if (peer_iter == std::end(peers_))
    {
        rv_error_set(error, RV_ERROR_ENOENT, fmt::format("Unknown peer '{peer_id}'", fmt::arg("peer_id", peer_id)));
        return false;
    }

    // copy the list: a failing send may close its channel and modify the table
    auto const candidates = channels(peer_id);

    auto local_error = rv_error{};
    for (auto const& channel : candidates)
    {
        local_error = {};
        if (channel->send(payload, &local_error))
        {
            return true;
        }

        rv_logAddWarnChannel(
            *channel,
            fmt::format(
                "Couldn't send {size} bytes: {error} ({error_code})",
                fmt::arg("size", std::size(payload)),
                fmt::arg("error", local_error.message()),
                fmt::arg("error_code", local_error.code())));
    }

    if (!local_error)
    {
        local_error.set(RV_ERROR_EIO, "Send failed");
    }

    rv_error_propagate(error, std::move(local_error));
    return false;
}

rv_peer_table::Snapshot rv_peer_table::snapshot() const
{
    auto ret = Snapshot{};

    for (auto const& [peer_id, channels] : peers_)
    {
        auto& names = ret[peer_id];
        names.reserve(std::size(channels));
        for (auto const& [name, channel] : channels)
        {
            names.emplace_back(name);
        }
    }

    return ret;
}

std::vector<std::shared_ptr<rv_peer_channel>> rv_peer_table::channels(std::string_view peer_id) const
{
    auto ret = std::vector<std::shared_ptr<rv_peer_channel>>{};

    if (auto const peer_iter = peers_.find(peer_id); peer_iter != std::end(peers_))
    {
        ret.reserve(std::size(peer_iter->second));
        for (auto const& [name, channel] : peer_iter->second)
        {
            ret.emplace_back(channel);
        }
    }

    return ret;
}
