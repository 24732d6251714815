// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "librendezvous/crypto-utils.h"
#include "librendezvous/error-types.h"
#include "librendezvous/error.h"
#include "librendezvous/log.h"
#include "librendezvous/peer-channel.h"
#include "librendezvous/session.h"
#include "librendezvous/web-utils.h"

namespace
{
[[nodiscard]] std::string make_peer_id()
{
    return rv_sha1_to_string(rv_rand_obj<rv_peer_id_t>());
}
} // namespace

rv_session::rv_session(rv_session_settings const& settings, Mediator& mediator)
    : mediator_{ mediator }
    , peer_id_{ make_peer_id() }
    , trackers_{ registry_mediator_, settings.numwant, settings.reannounce_interval }
{
    rv_logSetLevel(settings.log_level);
    rv_logAddDebug(fmt::format("My peer id: {peer_id}", fmt::arg("peer_id", peer_id_)));

    if (!std::empty(settings.identifier))
    {
        set_identifier(settings.identifier);
    }

    for (auto const& url : settings.announce_urls)
    {
        if (auto error = rv_error{}; !trackers_.add(url, &error) && !rv_error_is_eexist(error.code()))
        {
            rv_logAddWarn(fmt::format(
                "Skipping tracker '{url}': {error}",
                fmt::arg("url", rv_urlTrackerLogName(url)),
                fmt::arg("error", error.message())));
        }
    }
}

rv_session::~rv_session()
{
    destroy();
}

void rv_session::set_identifier(std::string_view identifier)
{
    identifier_ = identifier;
    info_hash_digest_ = rv_sha1_digest(identifier_);
    info_hash_ = rv_sha1_to_string(info_hash_digest_);

    rv_logAddDebug(fmt::format(
        "Identifier '{identifier}' has lookup key {info_hash}",
        fmt::arg("identifier", identifier_),
        fmt::arg("info_hash", info_hash_)));
}

bool rv_session::start(rv_error* error)
{
    if (std::empty(info_hash_))
    {
        rv_error_set(error, RV_ERROR_EINVAL, "No identifier set");
        return false;
    }

    rv_logAddInfo(fmt::format(
        "Started. My peer id: {peer_id}; {count} trackers",
        fmt::arg("peer_id", peer_id_),
        fmt::arg("count", trackers_.size())));

    trackers_.start();
    return true;
}

bool rv_session::add_tracker(std::string_view announce_url, rv_error* error)
{
    return trackers_.add(announce_url, error);
}

bool rv_session::remove_tracker(std::string_view announce_url, rv_error* error)
{
    return trackers_.remove(announce_url, error);
}

rv_peer_table::Snapshot rv_session::request_more_peers(rv_announce_opts const& opts)
{
    trackers_.announce_all(opts);
    return peers_.snapshot();
}

bool rv_session::send(std::string_view peer_id, std::string_view payload, rv_error* error)
{
    return peers_.send(peer_id, payload, error);
}

void rv_session::destroy()
{
    peers_.close_all();
    trackers_.destroy_all();
}

// ---

void rv_session::TrackerMediator::on_peer(std::shared_ptr<rv_peer_channel> channel)
{
    if (!channel)
    {
        return;
    }

    // includes offers made by trackers while destroy() is tearing them down
    if (!session_.is_started())
    {
        rv_logAddDebug(fmt::format("Dropping offer from peer {peer_id}: not started", fmt::arg("peer_id", channel->peer_id())));
        channel->destroy();
        return;
    }

    // trackers sometimes hand our own offer back to us
    if (channel->peer_id() == session_.peer_id())
    {
        channel->destroy();
        return;
    }

    session_.peers_.add_candidate(std::move(channel));
}

void rv_session::TrackerMediator::on_update(rv_tracker_response const& response)
{
    session_.trackers_.handle_update(response);
}

void rv_session::TrackerMediator::on_warning(std::string_view announce_url, rv_error const& error)
{
    session_.trackers_.handle_warning(announce_url, error);
}
