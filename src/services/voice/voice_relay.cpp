#include "huddle/services/voice/voice_relay.hpp"
#include "huddle/utils/logger.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>

namespace huddle::services {

VoiceRelay::VoiceRelay(std::shared_ptr<core::EventBus> event_bus, core::VoiceConfig config)
    : m_event_bus(std::move(event_bus))
    , m_publisher(m_event_bus)
    , m_config(std::move(config)) {}

std::vector<core::VoiceParticipantInfo> VoiceRelay::join_room(const core::RoomId& room_id,
                                                              const core::UserId& user_id,
                                                              const core::ConnectionId& connection_id,
                                                              const std::string& display_name) {
    if (room_id.empty() || user_id.empty() || connection_id.empty()) {
        HUDDLE_LOG_WARNING("VoiceRelay", "Ignoring join with empty room, user or connection id");
        return {};
    }

    std::vector<core::VoiceParticipantInfo> roster;
    {
        std::unique_lock lock(m_mutex);
        auto& room = m_rooms[room_id];

        Participant participant{
            connection_id,
            user_id,
            display_name.empty() ? std::string(core::UNKNOWN_DISPLAY_NAME) : display_name
        };

        auto existing = std::find_if(room.participants.begin(), room.participants.end(),
            [&connection_id](const Participant& p) { return p.connection_id == connection_id; });

        if (existing != room.participants.end()) {
            *existing = participant;
        } else {
            room.participants.push_back(participant);
        }

        roster = roster_of(room);
        m_publisher.push(core::events::VoiceParticipantJoined{room_id, participant.info(), connection_id});

        HUDDLE_LOG_INFO("VoiceRelay", participant.display_name + " (" + user_id.value + ") joined room " +
                        room_id.value + " (" + std::to_string(room.participants.size()) + " present)");
    }
    m_publisher.drain();
    return roster;
}

std::expected<core::UserId, core::VoiceError> VoiceRelay::leave_room(const core::RoomId& room_id,
                                                                     const core::ConnectionId& connection_id) {
    std::optional<core::UserId> removed;
    {
        std::unique_lock lock(m_mutex);
        auto room_it = m_rooms.find(room_id);
        if (room_it == m_rooms.end()) {
            HUDDLE_LOG_DEBUG("VoiceRelay", "Leave for unknown room " + room_id.value);
            return std::unexpected(core::VoiceError::RoomNotFound);
        }
        removed = remove_participant_locked(room_it, connection_id);
    }

    if (!removed) {
        HUDDLE_LOG_DEBUG("VoiceRelay", "Connection " + connection_id.value + " not in room " + room_id.value);
        return std::unexpected(core::VoiceError::ParticipantNotFound);
    }

    m_publisher.drain();
    return *removed;
}

bool VoiceRelay::relay_signal(core::SignalKind kind, const core::UserId& from_user_id,
                              const core::UserId& to_user_id, const std::string& payload) {
    {
        std::shared_lock lock(m_mutex);

        const Participant* target = nullptr;
        for (const auto& [room_id, room] : m_rooms) {
            auto it = std::find_if(room.participants.begin(), room.participants.end(),
                [&to_user_id](const Participant& p) { return p.user_id == to_user_id; });
            if (it != room.participants.end()) {
                target = &*it;
                break;
            }
        }

        if (target == nullptr) {
            HUDDLE_LOG_WARNING("VoiceRelay", "Dropping " + std::string(core::to_string(kind)) + " from " +
                               from_user_id.value + ": " + to_user_id.value + " is not in any voice room");
            return false;
        }

        // The publisher has its own lock, so a shared registry lock is enough here
        m_publisher.push(core::events::SignalForwarded{kind, from_user_id, to_user_id,
                                                       target->connection_id, payload});
        HUDDLE_LOG_DEBUG("VoiceRelay", "Forwarding " + std::string(core::to_string(kind)) + " " +
                         from_user_id.value + " -> " + to_user_id.value);
    }
    m_publisher.drain();
    return true;
}

std::expected<void, core::VoiceError> VoiceRelay::set_muted(const core::RoomId& room_id,
                                                            const core::ConnectionId& connection_id, bool muted) {
    {
        std::unique_lock lock(m_mutex);
        if (!m_rooms.contains(room_id)) {
            HUDDLE_LOG_DEBUG("VoiceRelay", "Mute for unknown room " + room_id.value);
            return std::unexpected(core::VoiceError::RoomNotFound);
        }

        Participant* participant = find_participant_locked(room_id, connection_id);
        if (participant == nullptr) {
            HUDDLE_LOG_DEBUG("VoiceRelay", "Mute for connection " + connection_id.value + " not in " + room_id.value);
            return std::unexpected(core::VoiceError::ParticipantNotFound);
        }

        if (participant->is_muted == muted) {
            return {};
        }
        participant->is_muted = muted;
        m_publisher.push(core::events::VoiceMuteChanged{room_id, participant->user_id, connection_id, muted});
    }
    m_publisher.drain();
    return {};
}

std::expected<void, core::VoiceError> VoiceRelay::set_deafened(const core::RoomId& room_id,
                                                               const core::ConnectionId& connection_id,
                                                               bool deafened) {
    {
        std::unique_lock lock(m_mutex);
        if (!m_rooms.contains(room_id)) {
            HUDDLE_LOG_DEBUG("VoiceRelay", "Deafen for unknown room " + room_id.value);
            return std::unexpected(core::VoiceError::RoomNotFound);
        }

        Participant* participant = find_participant_locked(room_id, connection_id);
        if (participant == nullptr) {
            HUDDLE_LOG_DEBUG("VoiceRelay", "Deafen for connection " + connection_id.value + " not in " + room_id.value);
            return std::unexpected(core::VoiceError::ParticipantNotFound);
        }

        if (participant->is_deafened == deafened) {
            return {};
        }
        participant->is_deafened = deafened;
        m_publisher.push(core::events::VoiceDeafenChanged{room_id, participant->user_id, connection_id, deafened});
    }
    m_publisher.drain();
    return {};
}

std::vector<core::RoomId> VoiceRelay::on_disconnect(const core::ConnectionId& connection_id) {
    std::vector<core::RoomId> affected;
    {
        std::unique_lock lock(m_mutex);
        for (auto room_it = m_rooms.begin(); room_it != m_rooms.end();) {
            auto next = std::next(room_it);
            const core::RoomId room_id = room_it->first;
            if (remove_participant_locked(room_it, connection_id)) {
                affected.push_back(room_id);
            }
            room_it = next;
        }
    }

    if (!affected.empty()) {
        m_publisher.drain();
    }
    return affected;
}

std::vector<core::VoiceParticipantInfo> VoiceRelay::get_room_roster(const core::RoomId& room_id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_rooms.find(room_id);
    return it != m_rooms.end() ? roster_of(it->second) : std::vector<core::VoiceParticipantInfo>{};
}

std::vector<core::IceServer> VoiceRelay::get_ice_servers() const {
    std::shared_lock lock(m_mutex);
    std::vector<core::IceServer> servers;

    if (!m_config.stun_urls.empty()) {
        servers.push_back(core::IceServer{m_config.stun_urls, std::nullopt, std::nullopt});
    }
    if (!m_config.turn_url.empty()) {
        servers.push_back(core::IceServer{{m_config.turn_url}, m_config.turn_username, m_config.turn_credential});
    }
    return servers;
}

void VoiceRelay::set_ice_servers(const core::VoiceConfig& config) {
    std::unique_lock lock(m_mutex);
    m_config = config;
    HUDDLE_LOG_DEBUG("VoiceRelay", "ICE configuration updated (" + std::to_string(config.stun_urls.size()) +
                     " STUN urls, TURN " + (config.turn_url.empty() ? "disabled" : "enabled") + ")");
}

std::vector<core::RoomId> VoiceRelay::room_ids() const {
    std::shared_lock lock(m_mutex);
    std::vector<core::RoomId> ids;
    ids.reserve(m_rooms.size());
    for (const auto& [room_id, room] : m_rooms) {
        ids.push_back(room_id);
    }
    return ids;
}

std::size_t VoiceRelay::room_count() const {
    std::shared_lock lock(m_mutex);
    return m_rooms.size();
}

std::optional<core::UserId> VoiceRelay::remove_participant_locked(std::map<core::RoomId, Room>::iterator room_it,
                                                                  const core::ConnectionId& connection_id) {
    auto& participants = room_it->second.participants;
    auto it = std::find_if(participants.begin(), participants.end(),
        [&connection_id](const Participant& p) { return p.connection_id == connection_id; });
    if (it == participants.end()) {
        return std::nullopt;
    }

    core::UserId user_id = it->user_id;
    const std::string display_name = it->display_name;
    participants.erase(it);

    const core::RoomId room_id = room_it->first;
    const bool room_closed = participants.empty();
    if (room_closed) {
        m_rooms.erase(room_it);
    }

    m_publisher.push(core::events::VoiceParticipantLeft{room_id, user_id, connection_id, room_closed});
    HUDDLE_LOG_INFO("VoiceRelay", display_name + " (" + user_id.value + ") left room " + room_id.value +
                    (room_closed ? ", room closed" : ""));
    return user_id;
}

VoiceRelay::Participant* VoiceRelay::find_participant_locked(const core::RoomId& room_id,
                                                             const core::ConnectionId& connection_id) {
    auto room_it = m_rooms.find(room_id);
    if (room_it == m_rooms.end()) {
        return nullptr;
    }

    auto& participants = room_it->second.participants;
    auto it = std::find_if(participants.begin(), participants.end(),
        [&connection_id](const Participant& p) { return p.connection_id == connection_id; });
    return it != participants.end() ? &*it : nullptr;
}

std::vector<core::VoiceParticipantInfo> VoiceRelay::roster_of(const Room& room) {
    std::vector<core::VoiceParticipantInfo> roster;
    roster.reserve(room.participants.size());
    for (const auto& participant : room.participants) {
        roster.push_back(participant.info());
    }
    return roster;
}

} // namespace huddle::services
