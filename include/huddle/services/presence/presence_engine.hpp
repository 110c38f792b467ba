#pragma once

#include "huddle/core/event_bus.hpp"
#include "huddle/core/events.hpp"
#include "huddle/core/models.hpp"
#include "huddle/utils/timer_manager.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace huddle::services {

/**
 * @brief Multi-connection presence registry with grace, idle and agent timers
 *
 * A user is tracked from the first connect (or agent activity touch) until
 * an Offline transition removes it; absence means Offline. Every committed
 * transition enqueues exactly one events::PresenceChanged while the registry
 * lock is held, so events for one user are delivered in transition order.
 *
 * Timer callbacks hold only a weak reference to the engine and re-validate
 * their generation and the user's state under the registry lock before
 * committing anything. Must be owned by a std::shared_ptr.
 */
class PresenceEngine : public std::enable_shared_from_this<PresenceEngine> {
public:
    PresenceEngine(std::shared_ptr<core::EventBus> event_bus,
                   std::shared_ptr<utils::TimerManager> timers,
                   core::PresenceConfig config = {});
    ~PresenceEngine();

    PresenceEngine(const PresenceEngine&) = delete;
    PresenceEngine& operator=(const PresenceEngine&) = delete;

    // Inbound transport hooks
    void connect(const core::UserId& user_id, const core::ConnectionId& connection_id,
                 const std::string& display_name, bool is_agent = false);

    // Returns true when the user holds no connections afterwards
    bool disconnect(const core::UserId& user_id, const core::ConnectionId& connection_id);

    void heartbeat(const core::UserId& user_id);

    std::expected<void, core::PresenceError> request_status(const core::UserId& user_id,
                                                            core::UserStatus desired);

    void force_offline(const core::UserId& user_id);

    void touch_agent_activity(const core::UserId& user_id, const std::string& display_name);

    // Queries
    core::UserStatus get_status(const core::UserId& user_id) const;
    std::vector<core::OnlineUser> snapshot() const;
    std::size_t tracked_count() const;
    std::size_t connection_count(const core::UserId& user_id) const;

    // Applies to timers started after the call
    void set_timeouts(const core::PresenceConfig& config);
    core::PresenceConfig timeouts() const;

    // Drops all state and pending timers without emitting events
    void clear();

private:
    using Clock = std::chrono::steady_clock;

    struct UserPresence {
        std::string display_name;
        bool is_agent = false;
        core::UserStatus status = core::UserStatus::Online;
        std::unordered_set<core::ConnectionId> connections;
        Clock::time_point last_heartbeat;

        // Drawn from m_generation_counter whenever the matching timer is
        // restarted or cancelled; never reused, even across re-creation
        std::uint64_t grace_generation = 0;
        std::uint64_t idle_generation = 0;
        std::uint64_t agent_generation = 0;
    };

    // All *_locked helpers expect m_mutex held exclusively
    void arm_timer_locked(const core::UserId& user_id, core::TimerKind kind,
                          std::chrono::milliseconds delay, std::uint64_t generation);
    void arm_idle_locked(const core::UserId& user_id, UserPresence& presence,
                         std::chrono::milliseconds delay);
    void cancel_idle_locked(const core::UserId& user_id, UserPresence& presence);
    void cancel_all_timers_locked(const core::UserId& user_id, UserPresence& presence);
    void publish_locked(const core::UserId& user_id, const UserPresence& presence,
                        core::UserStatus status);
    void set_status_locked(const core::UserId& user_id, UserPresence& presence,
                           core::UserStatus status);
    void remove_locked(const core::UserId& user_id, const std::string& reason);

    void on_timer(const core::UserId& user_id, core::TimerKind kind, std::uint64_t generation);
    void on_grace_expired(const core::UserId& user_id, std::uint64_t generation);
    void on_idle_expired(const core::UserId& user_id, std::uint64_t generation);
    void on_agent_expired(const core::UserId& user_id, std::uint64_t generation);

    static std::string normalize_display_name(const std::string& display_name);

    std::shared_ptr<core::EventBus> m_event_bus;
    std::shared_ptr<utils::TimerManager> m_timers;
    core::OrderedPublisher m_publisher;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<core::UserId, UserPresence> m_users;
    core::PresenceConfig m_config;
    std::uint64_t m_generation_counter = 0;
};

} // namespace huddle::services
