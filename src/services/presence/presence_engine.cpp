#include "huddle/services/presence/presence_engine.hpp"
#include "huddle/utils/format_utils.hpp"
#include "huddle/utils/logger.hpp"

#include <algorithm>
#include <mutex>

namespace huddle::services {

namespace {

bool in_range(std::chrono::milliseconds timeout) {
    return timeout.count() > 0 && timeout <= utils::MAX_DURATION;
}

bool has_valid_timeouts(const core::PresenceConfig& config) {
    return in_range(config.grace_period) &&
           in_range(config.idle_timeout) &&
           in_range(config.agent_inactivity_timeout);
}

std::string status_name(core::UserStatus status) {
    return std::string(core::to_string(status));
}

}

PresenceEngine::PresenceEngine(std::shared_ptr<core::EventBus> event_bus,
                               std::shared_ptr<utils::TimerManager> timers,
                               core::PresenceConfig config)
    : m_event_bus(std::move(event_bus))
    , m_timers(std::move(timers))
    , m_publisher(m_event_bus) {
    if (has_valid_timeouts(config)) {
        m_config = config;
    } else {
        HUDDLE_LOG_WARNING("PresenceEngine", "Timeout out of range in configuration, using defaults");
    }
}

PresenceEngine::~PresenceEngine() {
    clear();
}

void PresenceEngine::connect(const core::UserId& user_id, const core::ConnectionId& connection_id,
                             const std::string& display_name, bool is_agent) {
    if (user_id.empty() || connection_id.empty()) {
        HUDDLE_LOG_WARNING("PresenceEngine", "Ignoring connect with empty user or connection id");
        return;
    }

    {
        std::unique_lock lock(m_mutex);
        auto [it, inserted] = m_users.try_emplace(user_id);
        auto& presence = it->second;

        // Invalidate a grace expiry that may already be waiting on the lock
        presence.grace_generation = ++m_generation_counter;
        m_timers->cancel(user_id.value, core::TimerKind::Grace);

        presence.display_name = normalize_display_name(display_name);
        presence.is_agent = is_agent;
        presence.connections.insert(connection_id);
        presence.last_heartbeat = Clock::now();

        if (inserted) {
            publish_locked(user_id, presence, core::UserStatus::Online);
        } else {
            set_status_locked(user_id, presence, core::UserStatus::Online);
        }
        arm_idle_locked(user_id, presence, m_config.idle_timeout);

        HUDDLE_LOG_DEBUG("PresenceEngine", "Connection " + connection_id.value + " added for " + user_id.value +
                         " (" + std::to_string(presence.connections.size()) + " open)");
    }
    m_publisher.drain();
}

bool PresenceEngine::disconnect(const core::UserId& user_id, const core::ConnectionId& connection_id) {
    std::unique_lock lock(m_mutex);

    auto it = m_users.find(user_id);
    if (it == m_users.end()) {
        HUDDLE_LOG_DEBUG("PresenceEngine", "Disconnect for untracked user " + user_id.value);
        return true;
    }

    auto& presence = it->second;
    if (presence.connections.erase(connection_id) == 0) {
        // Unknown handle: leave any running grace period alone
        HUDDLE_LOG_DEBUG("PresenceEngine", "Connection " + connection_id.value + " not held by " + user_id.value);
        return presence.connections.empty();
    }

    if (!presence.connections.empty()) {
        return false;
    }

    presence.grace_generation = ++m_generation_counter;
    arm_timer_locked(user_id, core::TimerKind::Grace, m_config.grace_period, presence.grace_generation);
    HUDDLE_LOG_DEBUG("PresenceEngine", "Last connection closed for " + user_id.value + ", grace period started");
    return true;
}

void PresenceEngine::heartbeat(const core::UserId& user_id) {
    {
        std::unique_lock lock(m_mutex);
        auto it = m_users.find(user_id);
        if (it == m_users.end()) {
            return;
        }

        auto& presence = it->second;
        presence.last_heartbeat = Clock::now();

        if (presence.status == core::UserStatus::Idle) {
            set_status_locked(user_id, presence, core::UserStatus::Online);
        }
        if (!presence.connections.empty()) {
            arm_idle_locked(user_id, presence, m_config.idle_timeout);
        }
    }
    m_publisher.drain();
}

std::expected<void, core::PresenceError> PresenceEngine::request_status(const core::UserId& user_id,
                                                                        core::UserStatus desired) {
    if (desired != core::UserStatus::Online &&
        desired != core::UserStatus::Idle &&
        desired != core::UserStatus::DoNotDisturb) {
        HUDDLE_LOG_WARNING("PresenceEngine", "Rejected status request '" + status_name(desired) +
                           "' from " + user_id.value);
        return std::unexpected(core::PresenceError::InvalidStatus);
    }

    {
        std::unique_lock lock(m_mutex);
        auto it = m_users.find(user_id);
        if (it == m_users.end()) {
            HUDDLE_LOG_DEBUG("PresenceEngine", "Status request from untracked user " + user_id.value);
            return std::unexpected(core::PresenceError::UnknownUser);
        }

        auto& presence = it->second;
        switch (desired) {
            case core::UserStatus::Idle:
                if (presence.status == core::UserStatus::DoNotDisturb) {
                    HUDDLE_LOG_DEBUG("PresenceEngine", "Idle request ignored, " + user_id.value + " is DoNotDisturb");
                    break;
                }
                cancel_idle_locked(user_id, presence);
                set_status_locked(user_id, presence, core::UserStatus::Idle);
                break;

            case core::UserStatus::DoNotDisturb:
                cancel_idle_locked(user_id, presence);
                set_status_locked(user_id, presence, core::UserStatus::DoNotDisturb);
                break;

            default:
                presence.last_heartbeat = Clock::now();
                set_status_locked(user_id, presence, core::UserStatus::Online);
                if (!presence.connections.empty()) {
                    arm_idle_locked(user_id, presence, m_config.idle_timeout);
                }
                break;
        }
    }
    m_publisher.drain();
    return {};
}

void PresenceEngine::force_offline(const core::UserId& user_id) {
    {
        std::unique_lock lock(m_mutex);
        if (!m_users.contains(user_id)) {
            return;
        }
        remove_locked(user_id, "forced offline");
    }
    m_publisher.drain();
}

void PresenceEngine::touch_agent_activity(const core::UserId& user_id, const std::string& display_name) {
    if (user_id.empty()) {
        HUDDLE_LOG_WARNING("PresenceEngine", "Ignoring agent activity with empty user id");
        return;
    }

    {
        std::unique_lock lock(m_mutex);
        auto [it, inserted] = m_users.try_emplace(user_id);
        auto& presence = it->second;

        presence.display_name = normalize_display_name(display_name);
        presence.is_agent = true;
        presence.last_heartbeat = Clock::now();

        // API activity keeps an agent alive even after its last socket closed
        presence.grace_generation = ++m_generation_counter;
        m_timers->cancel(user_id.value, core::TimerKind::Grace);

        if (inserted) {
            publish_locked(user_id, presence, core::UserStatus::Online);
        } else {
            set_status_locked(user_id, presence, core::UserStatus::Online);
        }

        if (!presence.connections.empty()) {
            arm_idle_locked(user_id, presence, m_config.idle_timeout);
        }

        presence.agent_generation = ++m_generation_counter;
        arm_timer_locked(user_id, core::TimerKind::AgentInactivity,
                         m_config.agent_inactivity_timeout, presence.agent_generation);
    }
    m_publisher.drain();
}

core::UserStatus PresenceEngine::get_status(const core::UserId& user_id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_users.find(user_id);
    return it != m_users.end() ? it->second.status : core::UserStatus::Offline;
}

std::vector<core::OnlineUser> PresenceEngine::snapshot() const {
    std::vector<core::OnlineUser> users;
    {
        std::shared_lock lock(m_mutex);
        users.reserve(m_users.size());
        for (const auto& [user_id, presence] : m_users) {
            users.push_back(core::OnlineUser{user_id, presence.display_name, presence.status, presence.is_agent});
        }
    }

    std::sort(users.begin(), users.end(), [](const core::OnlineUser& a, const core::OnlineUser& b) {
        if (a.display_name != b.display_name) {
            return a.display_name < b.display_name;
        }
        return a.user_id < b.user_id;
    });
    return users;
}

std::size_t PresenceEngine::tracked_count() const {
    std::shared_lock lock(m_mutex);
    return m_users.size();
}

std::size_t PresenceEngine::connection_count(const core::UserId& user_id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_users.find(user_id);
    return it != m_users.end() ? it->second.connections.size() : 0;
}

void PresenceEngine::set_timeouts(const core::PresenceConfig& config) {
    if (!has_valid_timeouts(config)) {
        HUDDLE_LOG_WARNING("PresenceEngine", "Ignoring timeout update with out of range values");
        return;
    }

    std::unique_lock lock(m_mutex);
    m_config = config;
    HUDDLE_LOG_INFO("PresenceEngine", "Timeouts updated: grace " + std::to_string(config.grace_period.count()) +
                    "ms, idle " + std::to_string(config.idle_timeout.count()) +
                    "ms, agent " + std::to_string(config.agent_inactivity_timeout.count()) + "ms");
}

core::PresenceConfig PresenceEngine::timeouts() const {
    std::shared_lock lock(m_mutex);
    return m_config;
}

void PresenceEngine::clear() {
    std::unique_lock lock(m_mutex);
    for (auto& [user_id, presence] : m_users) {
        cancel_all_timers_locked(user_id, presence);
    }
    if (!m_users.empty()) {
        HUDDLE_LOG_DEBUG("PresenceEngine", "Dropped " + std::to_string(m_users.size()) + " tracked users");
    }
    m_users.clear();
}

void PresenceEngine::arm_timer_locked(const core::UserId& user_id, core::TimerKind kind,
                                      std::chrono::milliseconds delay, std::uint64_t generation) {
    std::weak_ptr<PresenceEngine> weak_self = weak_from_this();
    auto started = m_timers->start(user_id.value, kind, delay,
        [weak_self, user_id, kind, generation]() {
            if (auto self = weak_self.lock()) {
                self->on_timer(user_id, kind, generation);
            }
        });

    if (!started) {
        HUDDLE_LOG_WARNING("PresenceEngine", "Could not start " + std::string(core::to_string(kind)) +
                           " timer for " + user_id.value +
                           (started.error() == utils::TimerError::Stopped ? ": timers stopped" : ""));
    }
}

void PresenceEngine::arm_idle_locked(const core::UserId& user_id, UserPresence& presence,
                                     std::chrono::milliseconds delay) {
    if (presence.status == core::UserStatus::DoNotDisturb) {
        cancel_idle_locked(user_id, presence);
        return;
    }
    presence.idle_generation = ++m_generation_counter;
    arm_timer_locked(user_id, core::TimerKind::Idle, delay, presence.idle_generation);
}

void PresenceEngine::cancel_idle_locked(const core::UserId& user_id, UserPresence& presence) {
    presence.idle_generation = ++m_generation_counter;
    m_timers->cancel(user_id.value, core::TimerKind::Idle);
}

void PresenceEngine::cancel_all_timers_locked(const core::UserId& user_id, UserPresence& presence) {
    presence.grace_generation = ++m_generation_counter;
    presence.idle_generation = ++m_generation_counter;
    presence.agent_generation = ++m_generation_counter;
    m_timers->cancel(user_id.value, core::TimerKind::Grace);
    m_timers->cancel(user_id.value, core::TimerKind::Idle);
    m_timers->cancel(user_id.value, core::TimerKind::AgentInactivity);
}

void PresenceEngine::publish_locked(const core::UserId& user_id, const UserPresence& presence,
                                    core::UserStatus status) {
    HUDDLE_LOG_INFO("PresenceEngine", presence.display_name + " (" + user_id.value + ") is now " + status_name(status));
    m_publisher.push(core::events::PresenceChanged{user_id, presence.display_name, status, presence.is_agent});
}

void PresenceEngine::set_status_locked(const core::UserId& user_id, UserPresence& presence,
                                       core::UserStatus status) {
    if (presence.status == status) {
        return;
    }
    presence.status = status;
    publish_locked(user_id, presence, status);
}

void PresenceEngine::remove_locked(const core::UserId& user_id, const std::string& reason) {
    auto it = m_users.find(user_id);
    if (it == m_users.end()) {
        return;
    }

    HUDDLE_LOG_DEBUG("PresenceEngine", "Removing " + user_id.value + ": " + reason);
    cancel_all_timers_locked(user_id, it->second);
    publish_locked(user_id, it->second, core::UserStatus::Offline);
    m_users.erase(it);
}

void PresenceEngine::on_timer(const core::UserId& user_id, core::TimerKind kind, std::uint64_t generation) {
    switch (kind) {
        case core::TimerKind::Grace:
            on_grace_expired(user_id, generation);
            break;
        case core::TimerKind::Idle:
            on_idle_expired(user_id, generation);
            break;
        case core::TimerKind::AgentInactivity:
            on_agent_expired(user_id, generation);
            break;
    }
    m_publisher.drain();
}

void PresenceEngine::on_grace_expired(const core::UserId& user_id, std::uint64_t generation) {
    std::unique_lock lock(m_mutex);
    auto it = m_users.find(user_id);
    if (it == m_users.end() || it->second.grace_generation != generation) {
        return;
    }

    // The emptiness check and the removal share one critical section
    if (!it->second.connections.empty()) {
        HUDDLE_LOG_DEBUG("PresenceEngine", "Grace expiry for " + user_id.value + " lost to a reconnect");
        return;
    }
    remove_locked(user_id, "grace period elapsed");
}

void PresenceEngine::on_idle_expired(const core::UserId& user_id, std::uint64_t generation) {
    std::unique_lock lock(m_mutex);
    auto it = m_users.find(user_id);
    if (it == m_users.end() || it->second.idle_generation != generation) {
        return;
    }

    auto& presence = it->second;
    if (presence.status != core::UserStatus::Online || presence.connections.empty()) {
        return;
    }

    const auto elapsed = Clock::now() - presence.last_heartbeat;
    if (elapsed < m_config.idle_timeout) {
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(m_config.idle_timeout - elapsed);
        HUDDLE_LOG_DEBUG("PresenceEngine", "Heartbeat from " + user_id.value + " since idle timer was armed, " +
                         "rescheduling in " + std::to_string(remaining.count()) + "ms");
        arm_idle_locked(user_id, presence, remaining);
        return;
    }

    set_status_locked(user_id, presence, core::UserStatus::Idle);
}

void PresenceEngine::on_agent_expired(const core::UserId& user_id, std::uint64_t generation) {
    std::unique_lock lock(m_mutex);
    auto it = m_users.find(user_id);
    if (it == m_users.end() || it->second.agent_generation != generation) {
        return;
    }

    // Socket-connected agents fall under the grace/idle rules instead
    if (!it->second.connections.empty()) {
        return;
    }
    remove_locked(user_id, "agent inactive");
}

std::string PresenceEngine::normalize_display_name(const std::string& display_name) {
    return display_name.empty() ? std::string(core::UNKNOWN_DISPLAY_NAME) : display_name;
}

} // namespace huddle::services
