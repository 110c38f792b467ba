#include "huddle/services/presence/presence_engine.hpp"
#include "huddle/utils/timer_manager.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <map>
#include <thread>

using namespace std::chrono_literals;
using namespace huddle::core;
using huddle::core::events::PresenceChanged;
using huddle::services::PresenceEngine;
using huddle::testing::EventRecorder;
using huddle::testing::wait_until;

namespace {

std::vector<UserStatus> statuses_of(const std::vector<PresenceChanged>& events, const std::string& user) {
    std::vector<UserStatus> statuses;
    for (const auto& event : events) {
        if (event.user_id.value == user) {
            statuses.push_back(event.status);
        }
    }
    return statuses;
}

}

class PresenceEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_config.grace_period = 80ms;
        m_config.idle_timeout = 150ms;
        m_config.agent_inactivity_timeout = 100ms;

        m_bus = std::make_shared<EventBus>();
        m_timers = std::make_shared<huddle::utils::TimerManager>();
        m_recorder = std::make_unique<EventRecorder<PresenceChanged>>(m_bus);
        m_engine = std::make_shared<PresenceEngine>(m_bus, m_timers, m_config);
    }

    void TearDown() override {
        m_engine.reset();
        m_timers->shutdown();
        m_recorder.reset();
    }

    std::vector<UserStatus> statuses(const std::string& user) const {
        return statuses_of(m_recorder->events(), user);
    }

    bool wait_for_status(const std::string& user, UserStatus status,
                         std::chrono::milliseconds timeout = 2s) {
        return wait_until([&] { return m_engine->get_status(UserId{user}) == status; }, timeout);
    }

    PresenceConfig m_config;
    std::shared_ptr<EventBus> m_bus;
    std::shared_ptr<huddle::utils::TimerManager> m_timers;
    std::unique_ptr<EventRecorder<PresenceChanged>> m_recorder;
    std::shared_ptr<PresenceEngine> m_engine;
};

TEST_F(PresenceEngineTest, FirstConnectionAnnouncesOnline) {
    m_engine->connect(UserId{"alice"}, ConnectionId{"a1"}, "Alice");

    auto events = m_recorder->events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].user_id.value, "alice");
    EXPECT_EQ(events[0].display_name, "Alice");
    EXPECT_EQ(events[0].status, UserStatus::Online);
    EXPECT_FALSE(events[0].is_agent);
    EXPECT_EQ(m_engine->get_status(UserId{"alice"}), UserStatus::Online);
}

TEST_F(PresenceEngineTest, ExtraConnectionsAreSilent) {
    m_engine->connect(UserId{"alice"}, ConnectionId{"a1"}, "Alice");
    m_engine->connect(UserId{"alice"}, ConnectionId{"a2"}, "Alice");
    m_engine->connect(UserId{"alice"}, ConnectionId{"a2"}, "Alice");

    EXPECT_EQ(m_recorder->size(), 1u);
    EXPECT_EQ(m_engine->connection_count(UserId{"alice"}), 2u);
}

TEST_F(PresenceEngineTest, ClosingOneOfTwoTabsKeepsUserOnline) {
    m_engine->connect(UserId{"alice"}, ConnectionId{"a1"}, "Alice");
    m_engine->connect(UserId{"alice"}, ConnectionId{"a2"}, "Alice");

    EXPECT_FALSE(m_engine->disconnect(UserId{"alice"}, ConnectionId{"a2"}));

    std::this_thread::sleep_for(m_config.grace_period + 50ms);
    EXPECT_EQ(m_engine->get_status(UserId{"alice"}), UserStatus::Online);
    EXPECT_EQ(statuses("alice"), std::vector<UserStatus>{UserStatus::Online});
}

TEST_F(PresenceEngineTest, LastDisconnectGoesOfflineAfterGracePeriod) {
    m_engine->connect(UserId{"alice"}, ConnectionId{"a1"}, "Alice");

    const auto closed_at = std::chrono::steady_clock::now();
    EXPECT_TRUE(m_engine->disconnect(UserId{"alice"}, ConnectionId{"a1"}));
    EXPECT_EQ(m_engine->get_status(UserId{"alice"}), UserStatus::Online);

    ASSERT_TRUE(wait_for_status("alice", UserStatus::Offline));
    EXPECT_GE(std::chrono::steady_clock::now() - closed_at, m_config.grace_period);
    EXPECT_EQ(m_engine->tracked_count(), 0u);
    EXPECT_EQ(statuses("alice"), (std::vector<UserStatus>{UserStatus::Online, UserStatus::Offline}));
}

TEST_F(PresenceEngineTest, ReconnectWithinGracePeriodIsInvisible) {
    m_engine->connect(UserId{"alice"}, ConnectionId{"a1"}, "Alice");
    m_engine->disconnect(UserId{"alice"}, ConnectionId{"a1"});

    std::this_thread::sleep_for(20ms);
    m_engine->connect(UserId{"alice"}, ConnectionId{"a3"}, "Alice");

    std::this_thread::sleep_for(m_config.grace_period + 50ms);
    EXPECT_EQ(m_engine->get_status(UserId{"alice"}), UserStatus::Online);
    EXPECT_EQ(statuses("alice"), std::vector<UserStatus>{UserStatus::Online});
}

TEST_F(PresenceEngineTest, UnknownConnectionDoesNotStartGracePeriod) {
    m_engine->connect(UserId{"alice"}, ConnectionId{"a1"}, "Alice");

    EXPECT_FALSE(m_engine->disconnect(UserId{"alice"}, ConnectionId{"nope"}));
    std::this_thread::sleep_for(m_config.grace_period + 50ms);
    EXPECT_EQ(m_engine->connection_count(UserId{"alice"}), 1u);
    EXPECT_NE(m_engine->get_status(UserId{"alice"}), UserStatus::Offline);
}

TEST_F(PresenceEngineTest, DisconnectOfUntrackedUserReportsNoConnections) {
    EXPECT_TRUE(m_engine->disconnect(UserId{"ghost"}, ConnectionId{"g1"}));
    EXPECT_EQ(m_recorder->size(), 0u);
}

TEST_F(PresenceEngineTest, MissingHeartbeatsMakeUserIdle) {
    m_engine->connect(UserId{"bob"}, ConnectionId{"b1"}, "Bob");

    ASSERT_TRUE(wait_for_status("bob", UserStatus::Idle));
    EXPECT_EQ(statuses("bob"), (std::vector<UserStatus>{UserStatus::Online, UserStatus::Idle}));
}

TEST_F(PresenceEngineTest, HeartbeatRestoresOnlineFromIdle) {
    m_engine->connect(UserId{"bob"}, ConnectionId{"b1"}, "Bob");
    ASSERT_TRUE(wait_for_status("bob", UserStatus::Idle));

    m_engine->heartbeat(UserId{"bob"});

    EXPECT_EQ(m_engine->get_status(UserId{"bob"}), UserStatus::Online);
    EXPECT_EQ(statuses("bob"),
              (std::vector<UserStatus>{UserStatus::Online, UserStatus::Idle, UserStatus::Online}));
}

TEST_F(PresenceEngineTest, RegularHeartbeatsKeepUserOnline) {
    m_engine->connect(UserId{"bob"}, ConnectionId{"b1"}, "Bob");

    for (int i = 0; i < 8; ++i) {
        std::this_thread::sleep_for(40ms);
        m_engine->heartbeat(UserId{"bob"});
    }

    EXPECT_EQ(m_engine->get_status(UserId{"bob"}), UserStatus::Online);
    EXPECT_EQ(statuses("bob"), std::vector<UserStatus>{UserStatus::Online});
}

TEST_F(PresenceEngineTest, HeartbeatForUntrackedUserIsIgnored) {
    m_engine->heartbeat(UserId{"ghost"});
    EXPECT_EQ(m_engine->tracked_count(), 0u);
    EXPECT_EQ(m_recorder->size(), 0u);
}

TEST_F(PresenceEngineTest, DoNotDisturbSuppressesIdle) {
    m_engine->connect(UserId{"bob"}, ConnectionId{"b1"}, "Bob");
    ASSERT_TRUE(m_engine->request_status(UserId{"bob"}, UserStatus::DoNotDisturb).has_value());

    std::this_thread::sleep_for(m_config.idle_timeout + 100ms);
    m_engine->heartbeat(UserId{"bob"});

    EXPECT_EQ(m_engine->get_status(UserId{"bob"}), UserStatus::DoNotDisturb);
    EXPECT_EQ(statuses("bob"), (std::vector<UserStatus>{UserStatus::Online, UserStatus::DoNotDisturb}));
}

TEST_F(PresenceEngineTest, IdleRequestWhileDoNotDisturbIsIgnored) {
    m_engine->connect(UserId{"bob"}, ConnectionId{"b1"}, "Bob");
    ASSERT_TRUE(m_engine->request_status(UserId{"bob"}, UserStatus::DoNotDisturb).has_value());

    auto result = m_engine->request_status(UserId{"bob"}, UserStatus::Idle);

    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(m_engine->get_status(UserId{"bob"}), UserStatus::DoNotDisturb);
}

TEST_F(PresenceEngineTest, OnlineRequestLeavesDoNotDisturbAndRearmsIdle) {
    m_engine->connect(UserId{"bob"}, ConnectionId{"b1"}, "Bob");
    ASSERT_TRUE(m_engine->request_status(UserId{"bob"}, UserStatus::DoNotDisturb).has_value());
    ASSERT_TRUE(m_engine->request_status(UserId{"bob"}, UserStatus::Online).has_value());

    EXPECT_EQ(m_engine->get_status(UserId{"bob"}), UserStatus::Online);
    ASSERT_TRUE(wait_for_status("bob", UserStatus::Idle));
}

TEST_F(PresenceEngineTest, ExplicitIdleIsAnnounced) {
    m_engine->connect(UserId{"bob"}, ConnectionId{"b1"}, "Bob");
    ASSERT_TRUE(m_engine->request_status(UserId{"bob"}, UserStatus::Idle).has_value());
    ASSERT_TRUE(m_engine->request_status(UserId{"bob"}, UserStatus::Idle).has_value());

    EXPECT_EQ(statuses("bob"), (std::vector<UserStatus>{UserStatus::Online, UserStatus::Idle}));
}

TEST_F(PresenceEngineTest, OfflineCannotBeRequested) {
    m_engine->connect(UserId{"bob"}, ConnectionId{"b1"}, "Bob");

    auto result = m_engine->request_status(UserId{"bob"}, UserStatus::Offline);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), PresenceError::InvalidStatus);
    EXPECT_EQ(m_engine->get_status(UserId{"bob"}), UserStatus::Online);
}

TEST_F(PresenceEngineTest, StatusRequestFromUnknownUserFails) {
    auto result = m_engine->request_status(UserId{"ghost"}, UserStatus::Online);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), PresenceError::UnknownUser);
    EXPECT_EQ(m_engine->tracked_count(), 0u);
}

TEST_F(PresenceEngineTest, ForceOfflineRemovesImmediately) {
    m_engine->connect(UserId{"alice"}, ConnectionId{"a1"}, "Alice");
    m_engine->force_offline(UserId{"alice"});

    EXPECT_EQ(m_engine->get_status(UserId{"alice"}), UserStatus::Offline);
    EXPECT_EQ(m_engine->tracked_count(), 0u);

    // Cancelled timers stay silent
    std::this_thread::sleep_for(m_config.idle_timeout + 50ms);
    EXPECT_EQ(statuses("alice"), (std::vector<UserStatus>{UserStatus::Online, UserStatus::Offline}));

    m_engine->force_offline(UserId{"alice"});
    EXPECT_EQ(m_recorder->size(), 2u);
}

TEST_F(PresenceEngineTest, AgentActivityBringsAgentOnline) {
    m_engine->touch_agent_activity(UserId{"bot"}, "Build Bot");

    auto events = m_recorder->events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].status, UserStatus::Online);
    EXPECT_TRUE(events[0].is_agent);
    EXPECT_EQ(events[0].display_name, "Build Bot");
}

TEST_F(PresenceEngineTest, InactiveAgentGoesOffline) {
    m_engine->touch_agent_activity(UserId{"bot"}, "Build Bot");

    ASSERT_TRUE(wait_for_status("bot", UserStatus::Offline));
    EXPECT_EQ(statuses("bot"), (std::vector<UserStatus>{UserStatus::Online, UserStatus::Offline}));
}

TEST_F(PresenceEngineTest, AgentActivityExtendsLifetime) {
    m_engine->touch_agent_activity(UserId{"bot"}, "Build Bot");

    for (int i = 0; i < 5; ++i) {
        std::this_thread::sleep_for(50ms);
        m_engine->touch_agent_activity(UserId{"bot"}, "Build Bot");
    }

    EXPECT_EQ(m_engine->get_status(UserId{"bot"}), UserStatus::Online);
    EXPECT_EQ(statuses("bot"), std::vector<UserStatus>{UserStatus::Online});
}

TEST_F(PresenceEngineTest, ConnectedAgentOutlivesInactivityTimer) {
    m_engine->connect(UserId{"bot"}, ConnectionId{"ws"}, "Build Bot", true);
    m_engine->touch_agent_activity(UserId{"bot"}, "Build Bot");

    std::this_thread::sleep_for(m_config.agent_inactivity_timeout + 50ms);
    EXPECT_NE(m_engine->get_status(UserId{"bot"}), UserStatus::Offline);
    EXPECT_EQ(m_engine->tracked_count(), 1u);
}

TEST_F(PresenceEngineTest, AgentActivityRearmsIdleForConnectedAgent) {
    m_engine->connect(UserId{"bot"}, ConnectionId{"ws"}, "Build Bot", true);
    ASSERT_TRUE(wait_for_status("bot", UserStatus::Idle));

    m_engine->touch_agent_activity(UserId{"bot"}, "Build Bot");
    EXPECT_EQ(m_engine->get_status(UserId{"bot"}), UserStatus::Online);
    EXPECT_TRUE(m_timers->is_pending("bot", TimerKind::Idle));

    ASSERT_TRUE(wait_for_status("bot", UserStatus::Idle));
    EXPECT_EQ(statuses("bot"), (std::vector<UserStatus>{UserStatus::Online, UserStatus::Idle,
                                                        UserStatus::Online, UserStatus::Idle}));
}

TEST_F(PresenceEngineTest, EmptyDisplayNameBecomesUnknown) {
    m_engine->connect(UserId{"anon"}, ConnectionId{"x1"}, "");

    auto events = m_recorder->events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].display_name, "Unknown");
}

TEST_F(PresenceEngineTest, EmptyIdsAreIgnored) {
    m_engine->connect(UserId{""}, ConnectionId{"c1"}, "Nobody");
    m_engine->connect(UserId{"alice"}, ConnectionId{""}, "Alice");
    m_engine->touch_agent_activity(UserId{""}, "Bot");

    EXPECT_EQ(m_engine->tracked_count(), 0u);
    EXPECT_EQ(m_recorder->size(), 0u);
}

TEST_F(PresenceEngineTest, SnapshotIsSortedByDisplayName) {
    m_engine->connect(UserId{"u3"}, ConnectionId{"c3"}, "Carol");
    m_engine->connect(UserId{"u1"}, ConnectionId{"c1"}, "Alice");
    m_engine->touch_agent_activity(UserId{"u2"}, "Build Bot");
    ASSERT_TRUE(m_engine->request_status(UserId{"u3"}, UserStatus::DoNotDisturb).has_value());

    auto users = m_engine->snapshot();

    ASSERT_EQ(users.size(), 3u);
    EXPECT_EQ(users[0].display_name, "Alice");
    EXPECT_EQ(users[1].display_name, "Build Bot");
    EXPECT_TRUE(users[1].is_agent);
    EXPECT_EQ(users[2].display_name, "Carol");
    EXPECT_EQ(users[2].status, UserStatus::DoNotDisturb);
}

TEST_F(PresenceEngineTest, SetTimeoutsRejectsNonPositiveValues) {
    PresenceConfig bad = m_config;
    bad.idle_timeout = 0ms;

    m_engine->set_timeouts(bad);
    EXPECT_EQ(m_engine->timeouts(), m_config);

    PresenceConfig longer = m_config;
    longer.grace_period = 1s;
    m_engine->set_timeouts(longer);
    EXPECT_EQ(m_engine->timeouts(), longer);
}

TEST_F(PresenceEngineTest, NonPositiveConstructorConfigFallsBackToDefaults) {
    PresenceConfig bad;
    bad.grace_period = -5ms;

    auto engine = std::make_shared<PresenceEngine>(m_bus, m_timers, bad);
    EXPECT_EQ(engine->timeouts(), PresenceConfig{});
}

TEST_F(PresenceEngineTest, OversizedTimeoutsAreRejected) {
    PresenceConfig huge = m_config;
    huge.idle_timeout = std::chrono::hours{3'000'000};

    m_engine->set_timeouts(huge);
    EXPECT_EQ(m_engine->timeouts(), m_config);

    auto engine = std::make_shared<PresenceEngine>(m_bus, m_timers, huge);
    EXPECT_EQ(engine->timeouts(), PresenceConfig{});

    engine->connect(UserId{"carol"}, ConnectionId{"c1"}, "Carol");
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(engine->get_status(UserId{"carol"}), UserStatus::Online);
}

TEST_F(PresenceEngineTest, DestroyedEngineIgnoresPendingTimers) {
    m_engine->connect(UserId{"alice"}, ConnectionId{"a1"}, "Alice");
    m_engine->disconnect(UserId{"alice"}, ConnectionId{"a1"});
    m_engine.reset();

    std::this_thread::sleep_for(m_config.grace_period + 50ms);
    EXPECT_EQ(statuses("alice"), std::vector<UserStatus>{UserStatus::Online});
    EXPECT_EQ(m_timers->failed_callback_count(), 0u);
}

TEST_F(PresenceEngineTest, TwoTabsThenFullCloseScenario) {
    // Alice opens two tabs, closes both, and is gone after the grace period
    m_engine->connect(UserId{"alice"}, ConnectionId{"a1"}, "Alice");
    m_engine->connect(UserId{"alice"}, ConnectionId{"a2"}, "Alice");
    m_engine->connect(UserId{"bob"}, ConnectionId{"b1"}, "Bob");

    EXPECT_FALSE(m_engine->disconnect(UserId{"alice"}, ConnectionId{"a1"}));
    EXPECT_TRUE(m_engine->disconnect(UserId{"alice"}, ConnectionId{"a2"}));

    ASSERT_TRUE(wait_for_status("alice", UserStatus::Offline));
    EXPECT_EQ(statuses("alice"), (std::vector<UserStatus>{UserStatus::Online, UserStatus::Offline}));

    auto users = m_engine->snapshot();
    ASSERT_EQ(users.size(), 1u);
    EXPECT_EQ(users[0].user_id.value, "bob");
}

TEST_F(PresenceEngineTest, ConcurrentChurnNeverRepeatsAStatus) {
    constexpr int kUsers = 4;
    constexpr int kRounds = 50;

    std::vector<std::thread> workers;
    for (int u = 0; u < kUsers; ++u) {
        workers.emplace_back([this, u] {
            const UserId user{"user" + std::to_string(u)};
            for (int i = 0; i < kRounds; ++i) {
                const ConnectionId conn{"c" + std::to_string(u) + "-" + std::to_string(i % 3)};
                m_engine->connect(user, conn, "User");
                if (i % 4 == 0) {
                    m_engine->heartbeat(user);
                }
                m_engine->disconnect(user, conn);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    ASSERT_TRUE(wait_until([&] { return m_engine->tracked_count() == 0; }));
    // Let any in-flight delivery finish
    std::this_thread::sleep_for(20ms);

    for (int u = 0; u < kUsers; ++u) {
        const auto sequence = statuses("user" + std::to_string(u));
        ASSERT_FALSE(sequence.empty());
        EXPECT_EQ(sequence.front(), UserStatus::Online);
        EXPECT_EQ(sequence.back(), UserStatus::Offline);
        for (std::size_t i = 1; i < sequence.size(); ++i) {
            EXPECT_NE(sequence[i], sequence[i - 1]) << "repeated status for user" << u << " at " << i;
        }
    }
}

TEST_F(PresenceEngineTest, ConcurrentConnectsAndDisconnectsOnOneUserBalance) {
    constexpr int kThreads = 8;
    constexpr int kConnects = 20;
    constexpr int kDisconnects = 12;
    const UserId user{"shared"};

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([this, &user, t] {
            auto handle = [t](int i) { return ConnectionId{"t" + std::to_string(t) + "-" + std::to_string(i)}; };
            for (int i = 0; i < kConnects; ++i) {
                m_engine->connect(user, handle(i), "Shared");
                if (i % 5 == 0) {
                    m_engine->heartbeat(user);
                }
            }
            for (int i = 0; i < kDisconnects; ++i) {
                EXPECT_FALSE(m_engine->disconnect(user, handle(i)));
            }
            // Handles this thread never opened change nothing
            m_engine->disconnect(user, ConnectionId{"never-" + std::to_string(t)});
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(m_engine->connection_count(user), static_cast<std::size_t>(kThreads * (kConnects - kDisconnects)));
    EXPECT_EQ(statuses("shared").front(), UserStatus::Online);
    EXPECT_FALSE(m_timers->is_pending("shared", TimerKind::Grace));
}
