// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <chrono>
#include <cstddef> // size_t
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "librendezvous/observable.h"
#include "librendezvous/rendezvous.h"
#include "librendezvous/rv-macros.h"
#include "librendezvous/tracker-client.h"

namespace librendezvous
{
class Timer;
class TimerMaker;
} // namespace librendezvous

struct rv_error;

/**
 * The set of trackers a session announces to.
 *
 * Announce URLs are unique. Trackers can be added and removed at any
 * time; removing one stops its announces but leaves the peer channels
 * it helped negotiate open.
 */
class rv_tracker_registry
{
public:
    class Mediator
    {
    public:
        virtual ~Mediator() = default;

        [[nodiscard]] virtual std::unique_ptr<rv_tracker_client> create_client(std::string_view announce_url) = 0;
        [[nodiscard]] virtual librendezvous::TimerMaker& timer_maker() = 0;
    };

    using ConnectObservable = librendezvous::SimpleObservable<std::string_view /*announce_url*/, rv_tracker_stats>;
    using WarningObservable = librendezvous::SimpleObservable<rv_error const&, rv_tracker_stats>;

    // A zero `reannounce_interval` disables periodic announces.
    rv_tracker_registry(
        Mediator& mediator,
        int default_numwant = RV_DEFAULT_NUMWANT,
        std::chrono::seconds reannounce_interval = {});
    ~rv_tracker_registry();

    RV_DISABLE_COPY_MOVE(rv_tracker_registry)

    bool add(std::string_view announce_url, rv_error* error = nullptr);
    bool remove(std::string_view announce_url, rv_error* error = nullptr);

    // connect to every registered tracker and announce
    void start();

    // announce on every registered tracker; does not wait for replies
    void announce_all(rv_announce_opts const& opts = {});

    // stop announcing and tear down every tracker
    void destroy_all();

    // number of torn-down clients that haven't been freed yet
    [[nodiscard]] size_t retired_count() const noexcept
    {
        return std::size(retired_);
    }

    void handle_update(rv_tracker_response const& response);
    void handle_warning(std::string_view announce_url, rv_error const& error);

    [[nodiscard]] rv_tracker_stats stats() const;

    [[nodiscard]] bool contains(std::string_view announce_url) const;

    [[nodiscard]] std::vector<std::string> urls() const;

    [[nodiscard]] size_t size() const noexcept
    {
        return std::size(trackers_);
    }

    [[nodiscard]] constexpr bool is_started() const noexcept
    {
        return is_started_;
    }

    [[nodiscard]] constexpr int default_numwant() const noexcept
    {
        return default_numwant_;
    }

    ConnectObservable tracker_connected_;
    WarningObservable tracker_warning_;

private:
    struct tracker_entry
    {
        std::string announce_url;
        std::unique_ptr<rv_tracker_client> client;

        [[nodiscard]] bool is_connected() const noexcept
        {
            return client && client->is_connected();
        }
    };

    using trackers_t = std::vector<tracker_entry>;

    [[nodiscard]] trackers_t::iterator find(std::string_view announce_url);
    [[nodiscard]] trackers_t::const_iterator find(std::string_view announce_url) const;

    void connect(tracker_entry& tracker);
    void announce(tracker_entry& tracker, rv_announce_opts const& opts);

    // Hand a destroyed client to `retired_`. It is freed from the event
    // loop, since it may be the one whose callback we're running in.
    void retire(std::unique_ptr<rv_tracker_client> client);
    void release_retired();

    Mediator& mediator_;
    trackers_t trackers_;
    std::vector<std::unique_ptr<rv_tracker_client>> retired_;
    std::unique_ptr<librendezvous::Timer> release_timer_;
    std::unique_ptr<librendezvous::Timer> reannounce_timer_;
    std::chrono::seconds const reannounce_interval_;
    int const default_numwant_;
    bool is_started_ = false;
};
