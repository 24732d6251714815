// This file Copyright © 2023 Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <librendezvous/crypto-utils.h>
#include <librendezvous/error-types.h>
#include <librendezvous/error.h>
#include <librendezvous/log.h>
#include <librendezvous/peer-channel.h>
#include <librendezvous/rendezvous.h>
#include <librendezvous/session-settings.h>
#include <librendezvous/session.h>
#include <librendezvous/timer.h>
#include <librendezvous/tracker-client.h>

#include "test-fixtures.h"

#include "gtest/gtest.h"

using namespace std::literals;

namespace librendezvous::test
{

class SessionTest : public ::testing::Test
{
protected:
    static auto constexpr Identifier = "rendezvous-test-app"sv;
    static auto constexpr Url1 = "wss://tracker.example.org/announce"sv;
    static auto constexpr Url2 = "wss://tracker.example.net/announce"sv;
    static auto constexpr Url3 = "https://tracker.example.com/announce"sv;

    static auto constexpr PeerX = "58585858585858585858585858585858585858ff"sv;
    static auto constexpr PeerY = "59595959595959595959595959595959595959ff"sv;

    class MockMediator final : public rv_session::Mediator
    {
    public:
        explicit MockMediator(MockTrackerClients& clients)
            : clients_{ clients }
        {
        }

        [[nodiscard]] std::unique_ptr<rv_tracker_client> create_tracker_client(
            std::string_view announce_url,
            rv_tracker_client::Mediator& tracker_mediator) override
        {
            return clients_.create(announce_url, tracker_mediator);
        }

        [[nodiscard]] TimerMaker& timer_maker() override
        {
            return timer_maker_;
        }

        MockTrackerClients& clients_;
        MockTimerMaker timer_maker_;
    };

    // everything a session emitted, in order
    class EventLog
    {
    public:
        explicit EventLog(rv_session& session)
        {
            tags_.emplace_back(session.observe_peer_connect([this](rv_peer_channel& channel)
                                                            { peer_connects.emplace_back(channel.peer_id()); }));
            tags_.emplace_back(session.observe_peer_close([this](rv_peer_channel& channel)
                                                          { peer_closes.emplace_back(channel.peer_id()); }));
            tags_.emplace_back(session.observe_tracker_connect(
                [this](std::string_view url, rv_tracker_stats stats)
                {
                    tracker_connects.emplace_back(url);
                    tracker_connect_stats.emplace_back(stats);
                }));
            tags_.emplace_back(session.observe_tracker_warning(
                [this](rv_error const& error, rv_tracker_stats stats)
                {
                    tracker_warnings.emplace_back(error.message());
                    tracker_warning_stats.emplace_back(stats);
                }));
        }

        std::vector<std::string> peer_connects;
        std::vector<std::string> peer_closes;
        std::vector<std::string> tracker_connects;
        std::vector<rv_tracker_stats> tracker_connect_stats;
        std::vector<std::string> tracker_warnings;
        std::vector<rv_tracker_stats> tracker_warning_stats;

    private:
        std::vector<ObserverTag> tags_;
    };

    void SetUp() override
    {
        ::testing::Test::SetUp();
        mediator_ = std::make_unique<MockMediator>(clients_);
    }

    void TearDown() override
    {
        mediator_.reset();
        ::testing::Test::TearDown();
    }

    [[nodiscard]] static rv_session_settings make_settings()
    {
        auto settings = rv_session_settings{};
        settings.announce_urls = { std::string{ Url1 }, std::string{ Url2 } };
        settings.identifier = Identifier;
        settings.log_level = RV_LOG_WARN;
        return settings;
    }

    [[nodiscard]] std::unique_ptr<rv_session> make_session(rv_session_settings const& settings = make_settings())
    {
        return std::make_unique<rv_session>(settings, *mediator_);
    }

    [[nodiscard]] MockTrackerClient& client(std::string_view url) const
    {
        auto* const ret = clients_.get(url);
        EXPECT_NE(nullptr, ret) << url;
        return *ret;
    }

    [[nodiscard]] static auto make_channel(std::string_view peer_id, std::string_view name)
    {
        return std::make_shared<MockPeerChannel>(peer_id, name);
    }

    MockTrackerClients clients_;
    std::unique_ptr<MockMediator> mediator_;
};

TEST_F(SessionTest, constructionRegistersConfiguredTrackers)
{
    auto settings = make_settings();
    settings.announce_urls.emplace_back("not a tracker");
    settings.announce_urls.emplace_back(Url1);

    auto const session = make_session(settings);
    EXPECT_EQ((std::vector<std::string>{ std::string{ Url1 }, std::string{ Url2 } }), session->tracker_urls());
    EXPECT_EQ((rv_tracker_stats{ 0U, 2U }), session->tracker_stats());
    EXPECT_FALSE(session->is_started());

    // nothing is contacted until start()
    EXPECT_EQ(0U, clients_.n_created_);
}

TEST_F(SessionTest, identifierDerivesLookupKey)
{
    auto const session = make_session();
    EXPECT_EQ(Identifier, session->identifier());
    EXPECT_EQ(rv_sha1_digest(Identifier), session->info_hash_digest());
    EXPECT_EQ(rv_sha1_to_string(rv_sha1_digest(Identifier)), session->info_hash());
    EXPECT_EQ(40U, std::size(session->info_hash()));

    EXPECT_TRUE(session->start());
    EXPECT_EQ(session->info_hash(), client(Url1).mediator().info_hash());
    EXPECT_EQ(session->peer_id(), client(Url1).mediator().peer_id());

    session->set_identifier("another-app"sv);
    EXPECT_EQ("another-app"sv, session->identifier());
    EXPECT_EQ(rv_sha1_to_string(rv_sha1_digest("another-app"sv)), session->info_hash());
    EXPECT_EQ(session->info_hash(), client(Url1).mediator().info_hash());
}

TEST_F(SessionTest, peerIdIsRandomHex)
{
    auto const session1 = make_session();
    auto const session2 = make_session();

    EXPECT_EQ(40U, std::size(session1->peer_id()));
    EXPECT_EQ(std::string_view::npos, session1->peer_id().find_first_not_of("0123456789abcdef"sv));
    EXPECT_NE(session1->peer_id(), session2->peer_id());
}

TEST_F(SessionTest, startRequiresIdentifier)
{
    auto settings = make_settings();
    settings.identifier.clear();
    auto const session = make_session(settings);

    auto error = rv_error{};
    EXPECT_FALSE(session->start(&error));
    EXPECT_EQ(RV_ERROR_EINVAL, error.code()) << error;
    EXPECT_FALSE(session->is_started());
    EXPECT_EQ(0U, clients_.n_created_);

    session->set_identifier(Identifier);
    error = {};
    EXPECT_TRUE(session->start(&error)) << error;
    EXPECT_TRUE(session->is_started());
}

TEST_F(SessionTest, startAnnouncesOnEveryTracker)
{
    auto settings = make_settings();
    settings.numwant = 30;
    auto const session = make_session(settings);

    EXPECT_TRUE(session->start());
    EXPECT_EQ(2U, clients_.n_created_);

    for (auto const url : { Url1, Url2 })
    {
        auto const& announces = client(url).announces_;
        ASSERT_EQ(1U, std::size(announces)) << url;
        EXPECT_EQ(30, announces.front().numwant.value_or(-1));
        EXPECT_EQ(0U, announces.front().uploaded.value_or(1U));
        EXPECT_EQ(0U, announces.front().downloaded.value_or(1U));
    }
}

TEST_F(SessionTest, samePeerFromTwoTrackers)
{
    auto const session = make_session();
    auto events = EventLog{ *session };
    EXPECT_TRUE(session->start());

    auto const a = make_channel(PeerX, "a"sv);
    auto const b = make_channel(PeerX, "b"sv);
    client(Url1).offer(a);
    client(Url2).offer(b);
    EXPECT_FALSE(session->has_peer(PeerX));

    a->connect();
    b->connect();
    EXPECT_EQ(std::vector<std::string>{ std::string{ PeerX } }, events.peer_connects);
    EXPECT_TRUE(session->has_peer(PeerX));
    EXPECT_EQ(1U, session->peer_count());
    EXPECT_EQ((std::vector<std::string>{ "a", "b" }), session->peers().at(std::string{ PeerX }));

    a->close();
    EXPECT_TRUE(session->has_peer(PeerX));
    EXPECT_TRUE(std::empty(events.peer_closes));

    b->close();
    EXPECT_FALSE(session->has_peer(PeerX));
    EXPECT_EQ(std::vector<std::string>{ std::string{ PeerX } }, events.peer_closes);
    EXPECT_EQ(1U, std::size(events.peer_connects));
}

TEST_F(SessionTest, channelErrorKeepsOtherChannels)
{
    auto const session = make_session();
    auto events = EventLog{ *session };
    EXPECT_TRUE(session->start());

    auto const a = make_channel(PeerX, "a"sv);
    auto const b = make_channel(PeerX, "b"sv);
    client(Url1).offer(a);
    client(Url2).offer(b);
    a->connect();
    b->connect();

    a->fail(RV_ERROR_EIO, "ice failed"sv);
    EXPECT_TRUE(session->has_peer(PeerX));
    EXPECT_TRUE(std::empty(events.peer_closes));

    auto error = rv_error{};
    EXPECT_TRUE(session->send(PeerX, "still here"sv, &error)) << error;
    EXPECT_EQ(std::vector<std::string>{ "still here" }, b->sent_);
}

TEST_F(SessionTest, ignoresOwnOffers)
{
    auto const session = make_session();
    auto events = EventLog{ *session };
    EXPECT_TRUE(session->start());

    auto const self = make_channel(session->peer_id(), "a"sv);
    client(Url1).offer(self);
    EXPECT_TRUE(self->is_destroyed_);
    EXPECT_EQ(nullptr, self->observer());

    self->connect();
    EXPECT_FALSE(session->has_peer(session->peer_id()));
    EXPECT_TRUE(std::empty(events.peer_connects));
}

TEST_F(SessionTest, trackerConnectCarriesStats)
{
    auto const session = make_session();
    auto events = EventLog{ *session };
    EXPECT_TRUE(session->start());

    client(Url2).reply(4, 2);
    client(Url1).reply();

    EXPECT_EQ((std::vector<std::string>{ std::string{ Url2 }, std::string{ Url1 } }), events.tracker_connects);
    ASSERT_EQ(2U, std::size(events.tracker_connect_stats));
    EXPECT_EQ((rv_tracker_stats{ 1U, 2U }), events.tracker_connect_stats[0]);
    EXPECT_EQ((rv_tracker_stats{ 2U, 2U }), events.tracker_connect_stats[1]);
    EXPECT_EQ((rv_tracker_stats{ 2U, 2U }), session->tracker_stats());
}

TEST_F(SessionTest, trackerWarningIsNotFatal)
{
    auto const session = make_session();
    auto events = EventLog{ *session };
    EXPECT_TRUE(session->start());
    client(Url1).reply();

    // keep the expected warning out of the test output
    {
        auto log = LogCapture{};
        client(Url2).warn(RV_ERROR_EIO, "connection refused"sv);
    }

    EXPECT_EQ(std::vector<std::string>{ "connection refused" }, events.tracker_warnings);
    ASSERT_EQ(1U, std::size(events.tracker_warning_stats));
    EXPECT_EQ((rv_tracker_stats{ 1U, 2U }), events.tracker_warning_stats.front());
    EXPECT_TRUE(session->is_started());
    EXPECT_EQ(2U, std::size(session->tracker_urls()));
}

TEST_F(SessionTest, addAndRemoveTrackers)
{
    auto const session = make_session();

    auto error = rv_error{};
    EXPECT_FALSE(session->add_tracker(Url1, &error));
    EXPECT_EQ(RV_ERROR_EEXIST, error.code()) << error;
    EXPECT_EQ("Tracker already added"sv, error.message());

    error = {};
    EXPECT_FALSE(session->remove_tracker(Url3, &error));
    EXPECT_EQ(RV_ERROR_ENOENT, error.code()) << error;
    EXPECT_EQ("Tracker does not exist"sv, error.message());

    error = {};
    EXPECT_FALSE(session->add_tracker("mailto:someone@example.org"sv, &error));
    EXPECT_EQ(RV_ERROR_EINVAL, error.code()) << error;

    // once started, new trackers are contacted right away
    EXPECT_TRUE(session->start());
    EXPECT_TRUE(session->add_tracker(Url3));
    EXPECT_EQ(1U, std::size(client(Url3).announces_));
    EXPECT_EQ((rv_tracker_stats{ 0U, 3U }), session->tracker_stats());

    EXPECT_TRUE(session->remove_tracker(Url3));
    EXPECT_EQ((rv_tracker_stats{ 0U, 2U }), session->tracker_stats());
}

TEST_F(SessionTest, removeTrackerKeepsItsPeers)
{
    auto const session = make_session();
    auto events = EventLog{ *session };
    EXPECT_TRUE(session->start());

    auto const channel = make_channel(PeerX, "a"sv);
    client(Url1).offer(channel);
    channel->connect();
    ASSERT_TRUE(session->has_peer(PeerX));

    EXPECT_TRUE(session->remove_tracker(Url1));
    ASSERT_EQ(1U, std::size(clients_.teardowns_));
    EXPECT_EQ(rv_tracker_client::Teardown::KeepPeerChannels, clients_.teardowns_.front().second);

    EXPECT_TRUE(session->has_peer(PeerX));
    EXPECT_FALSE(channel->is_destroyed_);
    EXPECT_TRUE(std::empty(events.peer_closes));
    EXPECT_TRUE(session->send(PeerX, "hi"sv));
}

TEST_F(SessionTest, requestMorePeers)
{
    auto const session = make_session();
    EXPECT_TRUE(session->start());

    auto const x = make_channel(PeerX, "a"sv);
    auto const y = make_channel(PeerY, "b"sv);
    client(Url1).offer(x);
    client(Url2).offer(y);
    x->connect();

    auto opts = rv_announce_opts{};
    opts.numwant = 5;
    auto const peers = session->request_more_peers(opts);

    // y hasn't connected yet, so it isn't listed
    ASSERT_EQ(1U, std::size(peers));
    EXPECT_EQ(std::vector<std::string>{ "a" }, peers.at(std::string{ PeerX }));

    for (auto const url : { Url1, Url2 })
    {
        auto const& announces = client(url).announces_;
        ASSERT_EQ(2U, std::size(announces)) << url;
        EXPECT_EQ(5, announces.back().numwant.value_or(-1));
    }
}

TEST_F(SessionTest, sendToUnknownPeer)
{
    auto const session = make_session();
    EXPECT_TRUE(session->start());

    auto error = rv_error{};
    EXPECT_FALSE(session->send(PeerY, "hello?"sv, &error));
    EXPECT_EQ(RV_ERROR_ENOENT, error.code()) << error;
}

TEST_F(SessionTest, destroyClosesPeersThenTrackers)
{
    auto const session = make_session();
    auto events = EventLog{ *session };
    EXPECT_TRUE(session->start());

    auto const a = make_channel(PeerX, "a"sv);
    auto const b = make_channel(PeerX, "b"sv);
    auto const c = make_channel(PeerY, "a"sv);
    auto const pending = make_channel("5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5aff"sv, "a"sv);
    client(Url1).offer(a);
    client(Url2).offer(b);
    client(Url1).offer(c);
    client(Url2).offer(pending);
    a->connect();
    b->connect();
    c->connect();

    auto channels_closed_first = true;
    clients_.on_teardown_ = [&](MockTrackerClient& /*client*/)
    {
        for (auto const& channel : { a, b, c, pending })
        {
            channels_closed_first = channels_closed_first && channel->is_destroyed_;
        }
    };

    session->destroy();
    clients_.on_teardown_ = nullptr;

    EXPECT_TRUE(channels_closed_first);
    for (auto const& channel : { a, b, c, pending })
    {
        EXPECT_EQ(1U, channel->n_destroy_calls_) << channel->peer_id() << '/' << channel->channel_name();
    }

    EXPECT_EQ((std::vector<std::string>{ std::string{ PeerX }, std::string{ PeerY } }), events.peer_closes);
    EXPECT_EQ(0U, session->peer_count());
    EXPECT_FALSE(session->is_started());
    EXPECT_EQ((rv_tracker_stats{ 0U, 0U }), session->tracker_stats());
    EXPECT_EQ(0U, clients_.live_count());

    ASSERT_EQ(2U, std::size(clients_.teardowns_));
    for (auto const& [url, mode] : clients_.teardowns_)
    {
        EXPECT_EQ(rv_tracker_client::Teardown::ClosePeerChannels, mode) << url;
    }

    // destroying twice is a no-op
    session->destroy();
    EXPECT_EQ(2U, std::size(events.peer_closes));
    EXPECT_EQ(2U, std::size(clients_.teardowns_));
    for (auto const& channel : { a, b, c, pending })
    {
        EXPECT_EQ(1U, channel->n_destroy_calls_);
    }
}

TEST_F(SessionTest, destructorTearsDown)
{
    auto const channel = make_channel(PeerX, "a"sv);

    {
        auto const session = make_session();
        EXPECT_TRUE(session->start());
        client(Url1).offer(channel);
        channel->connect();
    }

    EXPECT_TRUE(channel->is_destroyed_);
    EXPECT_EQ(nullptr, channel->observer());
    EXPECT_EQ(0U, clients_.live_count());
}

TEST_F(SessionTest, statsConnectedNeverExceedsTotal)
{
    auto const session = make_session();

    auto const check = [&session]()
    {
        auto const stats = session->tracker_stats();
        EXPECT_LE(stats.connected, stats.total) << stats;
        EXPECT_EQ(std::size(session->tracker_urls()), stats.total);
    };

    check();
    EXPECT_TRUE(session->start());
    check();
    client(Url1).reply();
    client(Url2).reply();
    check();
    EXPECT_TRUE(session->add_tracker(Url3));
    check();
    client(Url3).reply();
    check();
    EXPECT_EQ((rv_tracker_stats{ 3U, 3U }), session->tracker_stats());
    EXPECT_TRUE(session->remove_tracker(Url1));
    check();
    client(Url2).is_connected_ = false;
    check();
    EXPECT_EQ((rv_tracker_stats{ 1U, 2U }), session->tracker_stats());
    EXPECT_FALSE(session->remove_tracker(Url1));
    check();
    session->destroy();
    check();
}

TEST_F(SessionTest, reannouncesPeriodically)
{
    auto settings = make_settings();
    settings.reannounce_interval = 30s;
    auto const session = make_session(settings);
    EXPECT_TRUE(session->start());
    EXPECT_EQ(1U, mediator_->timer_maker_.n_created_);

    auto const& announces = client(Url1).announces_;
    EXPECT_EQ(1U, std::size(announces));
    EXPECT_EQ(1U, mediator_->timer_maker_.run(30s));
    EXPECT_EQ(1U, mediator_->timer_maker_.run(30s));
    EXPECT_EQ(3U, std::size(announces));
}

TEST_F(SessionTest, trackerWarningHandlerCanRemoveThatTracker)
{
    auto const session = make_session();
    auto const channel = make_channel(PeerX, "a"sv);
    EXPECT_TRUE(session->start());
    client(Url1).offer(channel);
    channel->connect();

    auto const tag = session->observe_tracker_warning(
        [&session](rv_error const& /*error*/, rv_tracker_stats const& /*stats*/) { session->remove_tracker(Url1); });

    auto log = LogCapture{};
    auto& tracker = client(Url1);
    tracker.warn(RV_ERROR_EIO, "connection refused"sv);

    // the tracker is gone but its client finished handling the warning
    EXPECT_EQ(std::vector<std::string>{ std::string{ Url2 } }, session->tracker_urls());
    EXPECT_EQ(1U, tracker.n_warnings_);
    EXPECT_EQ(0U, clients_.n_freed_);

    // peers found through it stay connected
    EXPECT_TRUE(session->has_peer(PeerX));
    EXPECT_FALSE(channel->is_destroyed_);

    EXPECT_EQ(1U, mediator_->timer_maker_.run());
    EXPECT_EQ(1U, clients_.n_freed_);
}

TEST_F(SessionTest, offersMadeDuringTeardownAreDropped)
{
    auto const session = make_session();
    auto events = EventLog{ *session };
    EXPECT_TRUE(session->start());

    auto late_offers = std::vector<std::shared_ptr<MockPeerChannel>>{};
    clients_.on_teardown_ = [&late_offers](MockTrackerClient& tracker)
    {
        auto const channel = std::make_shared<MockPeerChannel>(PeerY, tracker.announce_url_);
        late_offers.emplace_back(channel);
        tracker.offer(channel);
    };

    session->destroy();
    clients_.on_teardown_ = nullptr;

    ASSERT_EQ(2U, std::size(late_offers));
    for (auto const& channel : late_offers)
    {
        EXPECT_TRUE(channel->is_destroyed_);
        EXPECT_EQ(nullptr, channel->observer());
        channel->connect();
    }

    EXPECT_EQ(0U, session->peer_count());
    EXPECT_TRUE(std::empty(events.peer_connects));
}

} // namespace librendezvous::test
