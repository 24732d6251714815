// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <algorithm>
#include <chrono>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "librendezvous/error-types.h"
#include "librendezvous/error.h"
#include "librendezvous/log.h"
#include "librendezvous/rv-assert.h"
#include "librendezvous/timer.h"
#include "librendezvous/tracker-registry.h"
#include "librendezvous/web-utils.h"

#define rv_logAddDebugTracker(url, msg) rv_logAddDebug(msg, rv_urlTrackerLogName(url))
#define rv_logAddTraceTracker(url, msg) rv_logAddTrace(msg, rv_urlTrackerLogName(url))
#define rv_logAddWarnTracker(url, msg) rv_logAddWarn(msg, rv_urlTrackerLogName(url))

rv_tracker_registry::rv_tracker_registry(
    Mediator& mediator,
    int default_numwant,
    std::chrono::seconds reannounce_interval)
    : mediator_{ mediator }
    , reannounce_interval_{ reannounce_interval }
    , default_numwant_{ default_numwant }
{
}

rv_tracker_registry::~rv_tracker_registry()
{
    reannounce_timer_.reset();
    release_timer_.reset();

    auto trackers = trackers_t{};
    std::swap(trackers, trackers_);

    for (auto& tracker : trackers)
    {
        if (tracker.client)
        {
            tracker.client->destroy(rv_tracker_client::Teardown::ClosePeerChannels);
        }
    }
}

// ---

rv_tracker_registry::trackers_t::iterator rv_tracker_registry::find(std::string_view announce_url)
{
    auto const test = [&announce_url](auto const& tracker)
    {
        return announce_url == tracker.announce_url;
    };
    return std::find_if(std::begin(trackers_), std::end(trackers_), test);
}

rv_tracker_registry::trackers_t::const_iterator rv_tracker_registry::find(std::string_view announce_url) const
{
    auto const test = [&announce_url](auto const& tracker)
    {
        return announce_url == tracker.announce_url;
    };
    return std::find_if(std::begin(trackers_), std::end(trackers_), test);
}

bool rv_tracker_registry::contains(std::string_view announce_url) const
{
    return find(announce_url) != std::end(trackers_);
}

std::vector<std::string> rv_tracker_registry::urls() const
{
    auto ret = std::vector<std::string>{};
    ret.reserve(std::size(trackers_));
    for (auto const& tracker : trackers_)
    {
        ret.emplace_back(tracker.announce_url);
    }
    return ret;
}

rv_tracker_stats rv_tracker_registry::stats() const
{
    auto ret = rv_tracker_stats{};
    ret.total = std::size(trackers_);
    ret.connected = static_cast<size_t>(std::count_if(
        std::begin(trackers_),
        std::end(trackers_),
        [](auto const& tracker) { return tracker.is_connected(); }));
    RV_ASSERT(ret.connected <= ret.total);
    return ret;
}

// ---

bool rv_tracker_registry::add(std::string_view announce_url, rv_error* error)
{
    if (!rv_urlIsValidTracker(announce_url))
    {
        rv_error_set(
            error,
            RV_ERROR_EINVAL,
            fmt::format("Invalid tracker URL '{url}'", fmt::arg("url", announce_url)));
        return false;
    }

    if (contains(announce_url))
    {
        rv_error_set(error, RV_ERROR_EEXIST, "Tracker already added");
        return false;
    }

    auto& tracker = trackers_.emplace_back();
    tracker.announce_url = announce_url;
    rv_logAddDebugTracker(tracker.announce_url, "Added tracker");

    if (is_started_)
    {
        connect(tracker);
        announce(tracker, {});
    }

    return true;
}

bool rv_tracker_registry::remove(std::string_view announce_url, rv_error* error)
{
    auto const iter = find(announce_url);
    if (iter == std::end(trackers_))
    {
        rv_error_set(error, RV_ERROR_ENOENT, "Tracker does not exist");
        return false;
    }

    // take it out of the list before tearing it down, in case the
    // client reports anything while being destroyed
    auto tracker = std::move(*iter);
    trackers_.erase(iter);

    rv_logAddDebugTracker(tracker.announce_url, "Removed tracker");

    // detaching a signaling path must not close the data links it set up
    if (tracker.client)
    {
        tracker.client->destroy(rv_tracker_client::Teardown::KeepPeerChannels);
        retire(std::move(tracker.client));
    }

    return true;
}

void rv_tracker_registry::retire(std::unique_ptr<rv_tracker_client> client)
{
    retired_.emplace_back(std::move(client));

    if (!release_timer_)
    {
        release_timer_ = mediator_.timer_maker().create([this]() { release_retired(); });
    }

    if (!release_timer_->is_armed())
    {
        release_timer_->arm(std::chrono::milliseconds{ 0 }, librendezvous::Timer::Mode::SingleShot);
    }
}

void rv_tracker_registry::release_retired()
{
    // freeing a client may call back into the registry
    auto retired = decltype(retired_){};
    std::swap(retired, retired_);
}

// ---

void rv_tracker_registry::connect(tracker_entry& tracker)
{
    RV_ASSERT(!tracker.client);

    tracker.client = mediator_.create_client(tracker.announce_url);
    if (!tracker.client)
    {
        rv_logAddWarnTracker(tracker.announce_url, "Couldn't create tracker connection");
    }
}

void rv_tracker_registry::announce(tracker_entry& tracker, rv_announce_opts const& opts)
{
    if (!tracker.client)
    {
        return;
    }

    auto const resolved = opts.with_defaults(default_numwant_);
    rv_logAddTraceTracker(
        tracker.announce_url,
        fmt::format(
            "Announcing numwant={numwant} uploaded={uploaded} downloaded={downloaded}",
            fmt::arg("numwant", *resolved.numwant),
            fmt::arg("uploaded", *resolved.uploaded),
            fmt::arg("downloaded", *resolved.downloaded)));
    tracker.client->announce(resolved);
}

void rv_tracker_registry::start()
{
    if (is_started_)
    {
        return;
    }

    is_started_ = true;

    for (auto& tracker : trackers_)
    {
        if (!tracker.client)
        {
            connect(tracker);
        }
    }

    announce_all();

    if (reannounce_interval_.count() > 0)
    {
        reannounce_timer_ = mediator_.timer_maker().create([this]() { announce_all(); });
        reannounce_timer_->arm(reannounce_interval_, librendezvous::Timer::Mode::Repeating);
    }
}

void rv_tracker_registry::announce_all(rv_announce_opts const& opts)
{
    // announcing may synchronously deliver results that add or remove
    // trackers, so walk a snapshot of the URLs
    for (auto const& url : urls())
    {
        if (auto const iter = find(url); iter != std::end(trackers_))
        {
            announce(*iter, opts);
        }
    }
}

void rv_tracker_registry::destroy_all()
{
    reannounce_timer_.reset();
    is_started_ = false;

    auto trackers = trackers_t{};
    std::swap(trackers, trackers_);

    for (auto& tracker : trackers)
    {
        if (tracker.client)
        {
            tracker.client->destroy(rv_tracker_client::Teardown::ClosePeerChannels);
            retire(std::move(tracker.client));
        }
    }
}

// ---

void rv_tracker_registry::handle_update(rv_tracker_response const& response)
{
    if (!contains(response.announce_url))
    {
        rv_logAddDebugTracker(response.announce_url, "Ignoring reply from unregistered tracker");
        return;
    }

    rv_logAddTraceTracker(
        response.announce_url,
        fmt::format(
            "Got announce reply: complete={complete} incomplete={incomplete}",
            fmt::arg("complete", response.complete.value_or(-1)),
            fmt::arg("incomplete", response.incomplete.value_or(-1))));

    // observers may change the registry; don't hand out a view into it
    auto const announce_url = std::string{ response.announce_url };
    tracker_connected_.emit(announce_url, stats());
}

void rv_tracker_registry::handle_warning(std::string_view announce_url, rv_error const& error)
{
    rv_logAddWarnTracker(
        announce_url,
        fmt::format(
            "Tracker warning: {error} ({error_code})",
            fmt::arg("error", error.message()),
            fmt::arg("error_code", error.code())));

    tracker_warning_.emit(error, stats());
}
