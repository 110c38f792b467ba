#pragma once

#include "huddle/core/models.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace huddle::core::events {

struct Event {
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
    Event() = default;
    virtual ~Event() = default;
};

using core::ApplicationState;
using core::ApplicationError;
using core::ConfigError;
using core::ApplicationConfig;
using core::UserId;
using core::ConnectionId;
using core::RoomId;
using core::UserStatus;
using core::SignalKind;
using core::VoiceParticipantInfo;

struct ConfigurationUpdated : Event {
    ApplicationConfig previous_config;
    ApplicationConfig new_config;

    ConfigurationUpdated(ApplicationConfig prev, ApplicationConfig curr)
        : previous_config(std::move(prev)), new_config(std::move(curr)) {}
};

struct ConfigurationError : Event {
    ConfigError error;
    std::string message;

    ConfigurationError(ConfigError err, std::string msg)
        : error(err), message(std::move(msg)) {}
};

// ============================================================================
// Presence
// ============================================================================

// Emitted once per real transition; status is Offline when the user left the registry
struct PresenceChanged : Event {
    UserId user_id;
    std::string display_name;
    UserStatus status;
    bool is_agent;

    PresenceChanged(UserId id, std::string name, UserStatus s, bool agent = false)
        : user_id(std::move(id)), display_name(std::move(name)), status(s), is_agent(agent) {}
};

// ============================================================================
// Voice
// ============================================================================

// connection_id is the joining connection; the roster it receives already includes itself
struct VoiceParticipantJoined : Event {
    RoomId room_id;
    VoiceParticipantInfo participant;
    ConnectionId connection_id;

    VoiceParticipantJoined(RoomId room, VoiceParticipantInfo info, ConnectionId conn)
        : room_id(std::move(room)), participant(std::move(info)), connection_id(std::move(conn)) {}
};

struct VoiceParticipantLeft : Event {
    RoomId room_id;
    UserId user_id;
    ConnectionId connection_id;
    bool room_closed;

    VoiceParticipantLeft(RoomId room, UserId user, ConnectionId conn, bool closed)
        : room_id(std::move(room)), user_id(std::move(user)), connection_id(std::move(conn)), room_closed(closed) {}
};

struct VoiceMuteChanged : Event {
    RoomId room_id;
    UserId user_id;
    ConnectionId connection_id;
    bool muted;

    VoiceMuteChanged(RoomId room, UserId user, ConnectionId conn, bool muted)
        : room_id(std::move(room)), user_id(std::move(user)), connection_id(std::move(conn)), muted(muted) {}
};

struct VoiceDeafenChanged : Event {
    RoomId room_id;
    UserId user_id;
    ConnectionId connection_id;
    bool deafened;

    VoiceDeafenChanged(RoomId room, UserId user, ConnectionId conn, bool deafened)
        : room_id(std::move(room)), user_id(std::move(user)), connection_id(std::move(conn)), deafened(deafened) {}
};

// Opaque SDP/ICE payload addressed to exactly one connection
struct SignalForwarded : Event {
    SignalKind kind;
    UserId from_user_id;
    UserId to_user_id;
    ConnectionId target_connection;
    std::string payload;

    SignalForwarded(SignalKind k, UserId from, UserId to, ConnectionId conn, std::string data)
        : kind(k), from_user_id(std::move(from)), to_user_id(std::move(to)),
          target_connection(std::move(conn)), payload(std::move(data)) {}
};

// ============================================================================
// Application lifecycle
// ============================================================================

struct ApplicationStateChanged : Event {
    ApplicationState previous_state;
    ApplicationState current_state;

    ApplicationStateChanged(ApplicationState prev, ApplicationState curr)
        : previous_state(prev), current_state(curr) {}
};

struct ApplicationStarting : Event {
    std::string version;

    explicit ApplicationStarting(std::string ver)
        : version(std::move(ver)) {}
};

struct ApplicationReady : Event {
    std::chrono::milliseconds startup_time;

    explicit ApplicationReady(std::chrono::milliseconds time)
        : startup_time(time) {}
};

struct ApplicationShuttingDown : Event {
    std::string reason;

    explicit ApplicationShuttingDown(std::string r = "User requested")
        : reason(std::move(r)) {}
};

struct ServiceError : Event {
    std::string service_name;
    std::string error_message;
    bool recoverable;

    ServiceError(std::string name, std::string msg, bool recover = true)
        : service_name(std::move(name)), error_message(std::move(msg)), recoverable(recover) {}
};

}
