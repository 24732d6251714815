// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <cstddef> // size_t
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "librendezvous/observable.h"
#include "librendezvous/peer-table.h"
#include "librendezvous/rendezvous.h"
#include "librendezvous/rv-macros.h"
#include "librendezvous/session-settings.h"
#include "librendezvous/tracker-client.h"
#include "librendezvous/tracker-registry.h"

namespace librendezvous
{
class TimerMaker;
} // namespace librendezvous

struct rv_error;

/**
 * Finds peers of one application by announcing its lookup key to a set
 * of trackers and keeps track of the channels that get opened to them.
 *
 * Everything runs on the caller's thread: tracker clients and peer
 * channels report back through the session's mediators, and the session
 * reacts to each report before returning.
 */
class rv_session
{
public:
    class Mediator
    {
    public:
        virtual ~Mediator() = default;

        // Open a connection to the tracker at `announce_url`.
        // The client reports back to `tracker_mediator`.
        [[nodiscard]] virtual std::unique_ptr<rv_tracker_client> create_tracker_client(
            std::string_view announce_url,
            rv_tracker_client::Mediator& tracker_mediator) = 0;

        [[nodiscard]] virtual librendezvous::TimerMaker& timer_maker() = 0;
    };

    rv_session(rv_session_settings const& settings, Mediator& mediator);
    ~rv_session();

    RV_DISABLE_COPY_MOVE(rv_session)

    // Set the identifier used to discover peers in the network
    void set_identifier(std::string_view identifier);

    // Connect to the trackers and start discovering peers
    bool start(rv_error* error = nullptr);

    bool add_tracker(std::string_view announce_url, rv_error* error = nullptr);

    // Stop using a tracker. Peers found through it stay connected.
    bool remove_tracker(std::string_view announce_url, rv_error* error = nullptr);

    // Announce again on every tracker. Returns the peers known right now;
    // any new ones will show up through `observe_peer_connect()`.
    rv_peer_table::Snapshot request_more_peers(rv_announce_opts const& opts = {});

    bool send(std::string_view peer_id, std::string_view payload, rv_error* error = nullptr);

    // Close every peer channel, then every tracker connection
    void destroy();

    [[nodiscard]] std::string_view peer_id() const noexcept
    {
        return peer_id_;
    }

    [[nodiscard]] std::string_view identifier() const noexcept
    {
        return identifier_;
    }

    [[nodiscard]] std::string_view info_hash() const noexcept
    {
        return info_hash_;
    }

    [[nodiscard]] constexpr auto const& info_hash_digest() const noexcept
    {
        return info_hash_digest_;
    }

    [[nodiscard]] bool is_started() const noexcept
    {
        return trackers_.is_started();
    }

    [[nodiscard]] rv_tracker_stats tracker_stats() const
    {
        return trackers_.stats();
    }

    [[nodiscard]] auto tracker_urls() const
    {
        return trackers_.urls();
    }

    [[nodiscard]] rv_peer_table::Snapshot peers() const
    {
        return peers_.snapshot();
    }

    [[nodiscard]] bool has_peer(std::string_view peer_id) const
    {
        return peers_.contains(peer_id);
    }

    [[nodiscard]] size_t peer_count() const noexcept
    {
        return peers_.size();
    }

    // --- events

    [[nodiscard]] librendezvous::ObserverTag observe_peer_connect(rv_peer_table::PeerObservable::Observer observer)
    {
        return peers_.peer_connected_.observe(std::move(observer));
    }

    [[nodiscard]] librendezvous::ObserverTag observe_peer_close(rv_peer_table::PeerObservable::Observer observer)
    {
        return peers_.peer_closed_.observe(std::move(observer));
    }

    [[nodiscard]] librendezvous::ObserverTag observe_tracker_connect(
        rv_tracker_registry::ConnectObservable::Observer observer)
    {
        return trackers_.tracker_connected_.observe(std::move(observer));
    }

    [[nodiscard]] librendezvous::ObserverTag observe_tracker_warning(
        rv_tracker_registry::WarningObservable::Observer observer)
    {
        return trackers_.tracker_warning_.observe(std::move(observer));
    }

private:
    // what the tracker clients see of the session
    class TrackerMediator final : public rv_tracker_client::Mediator
    {
    public:
        explicit TrackerMediator(rv_session& session)
            : session_{ session }
        {
        }

        [[nodiscard]] std::string_view info_hash() const override
        {
            return session_.info_hash();
        }

        [[nodiscard]] std::string_view peer_id() const override
        {
            return session_.peer_id();
        }

        void on_peer(std::shared_ptr<rv_peer_channel> channel) override;
        void on_update(rv_tracker_response const& response) override;
        void on_warning(std::string_view announce_url, rv_error const& error) override;

    private:
        rv_session& session_;
    };

    // what the tracker registry sees of the session
    class RegistryMediator final : public rv_tracker_registry::Mediator
    {
    public:
        explicit RegistryMediator(rv_session& session)
            : session_{ session }
        {
        }

        [[nodiscard]] std::unique_ptr<rv_tracker_client> create_client(std::string_view announce_url) override
        {
            return session_.mediator_.create_tracker_client(announce_url, session_.tracker_mediator_);
        }

        [[nodiscard]] librendezvous::TimerMaker& timer_maker() override
        {
            return session_.mediator_.timer_maker();
        }

    private:
        rv_session& session_;
    };

    Mediator& mediator_;

    std::string identifier_;
    std::string info_hash_;
    rv_sha1_digest_t info_hash_digest_ = {};
    std::string const peer_id_;

    TrackerMediator tracker_mediator_{ *this };
    RegistryMediator registry_mediator_{ *this };

    // must outlive trackers_: tracker clients may report peers while being destroyed
    rv_peer_table peers_;
    rv_tracker_registry trackers_;
};
