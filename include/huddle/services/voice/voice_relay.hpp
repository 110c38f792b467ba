#pragma once

#include "huddle/core/event_bus.hpp"
#include "huddle/core/events.hpp"
#include "huddle/core/models.hpp"

#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace huddle::services {

/**
 * @brief Voice room rosters and WebRTC signal forwarding
 *
 * Rooms exist only while they have participants. Participants are keyed by
 * connection, so one user joining from two connections appears twice.
 * Signals are routed by scanning live rooms for the target user; the rooms
 * are the only record of who is reachable.
 */
class VoiceRelay {
public:
    explicit VoiceRelay(std::shared_ptr<core::EventBus> event_bus, core::VoiceConfig config = {});
    ~VoiceRelay() = default;

    VoiceRelay(const VoiceRelay&) = delete;
    VoiceRelay& operator=(const VoiceRelay&) = delete;

    // Returns the roster after the join, the caller included
    std::vector<core::VoiceParticipantInfo> join_room(const core::RoomId& room_id,
                                                      const core::UserId& user_id,
                                                      const core::ConnectionId& connection_id,
                                                      const std::string& display_name);

    std::expected<core::UserId, core::VoiceError> leave_room(const core::RoomId& room_id,
                                                             const core::ConnectionId& connection_id);

    // False when no participant matches to_user_id; the signal is dropped
    bool relay_signal(core::SignalKind kind, const core::UserId& from_user_id,
                      const core::UserId& to_user_id, const std::string& payload);

    std::expected<void, core::VoiceError> set_muted(const core::RoomId& room_id,
                                                    const core::ConnectionId& connection_id, bool muted);
    std::expected<void, core::VoiceError> set_deafened(const core::RoomId& room_id,
                                                       const core::ConnectionId& connection_id, bool deafened);

    // Returns the rooms the connection was removed from
    std::vector<core::RoomId> on_disconnect(const core::ConnectionId& connection_id);

    std::vector<core::VoiceParticipantInfo> get_room_roster(const core::RoomId& room_id) const;
    std::vector<core::IceServer> get_ice_servers() const;
    void set_ice_servers(const core::VoiceConfig& config);

    std::vector<core::RoomId> room_ids() const;
    std::size_t room_count() const;

private:
    struct Participant {
        core::ConnectionId connection_id;
        core::UserId user_id;
        std::string display_name;
        bool is_muted = false;
        bool is_deafened = false;

        core::VoiceParticipantInfo info() const {
            return {user_id, display_name, is_muted, is_deafened};
        }
    };

    struct Room {
        std::vector<Participant> participants;  // join order
    };

    // Expects m_mutex held exclusively; erases the room when it empties
    std::optional<core::UserId> remove_participant_locked(std::map<core::RoomId, Room>::iterator room_it,
                                                          const core::ConnectionId& connection_id);

    Participant* find_participant_locked(const core::RoomId& room_id, const core::ConnectionId& connection_id);

    static std::vector<core::VoiceParticipantInfo> roster_of(const Room& room);

    std::shared_ptr<core::EventBus> m_event_bus;
    core::OrderedPublisher m_publisher;

    mutable std::shared_mutex m_mutex;
    std::map<core::RoomId, Room> m_rooms;
    core::VoiceConfig m_config;
};

} // namespace huddle::services
