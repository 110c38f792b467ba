#pragma once

#include "huddle/utils/logger.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace huddle {
namespace core {

// ============================================================================
// Application-wide types
// ============================================================================

enum class ApplicationState {
    NotInitialized,
    Initializing,
    Running,
    Stopping,
    Stopped,
    Error
};

enum class ApplicationError {
    InitializationFailed,
    ServiceUnavailable,
    ConfigurationError,
    AlreadyRunning,
    ShutdownFailed
};

enum class ConfigError {
    FileNotFound,
    InvalidFormat,
    ValidationError,
    PermissionDenied
};

// ============================================================================
// Domain-specific types
// ============================================================================

// Offline is never stored: a user absent from the presence registry is Offline.
enum class UserStatus {
    Online,
    Idle,
    DoNotDisturb,
    Offline
};

enum class PresenceError {
    InvalidStatus,
    UnknownUser
};

enum class VoiceError {
    RoomNotFound,
    ParticipantNotFound
};

enum class SignalKind {
    Offer,
    Answer,
    IceCandidate
};

enum class TimerKind : std::uint8_t {
    Grace,
    Idle,
    AgentInactivity
};

// Strong types for IDs
struct UserId {
    std::string value;

    UserId() = default;
    explicit UserId(std::string id) : value(std::move(id)) {}

    bool empty() const { return value.empty(); }
    const std::string& get() const { return value; }

    bool operator==(const UserId& other) const { return value == other.value; }
    bool operator<(const UserId& other) const { return value < other.value; }
};

// Opaque id of one live transport session, distinct from user identity.
struct ConnectionId {
    std::string value;

    ConnectionId() = default;
    explicit ConnectionId(std::string id) : value(std::move(id)) {}

    bool empty() const { return value.empty(); }
    const std::string& get() const { return value; }

    bool operator==(const ConnectionId& other) const { return value == other.value; }
    bool operator<(const ConnectionId& other) const { return value < other.value; }
};

struct RoomId {
    std::string value;

    RoomId() = default;
    explicit RoomId(std::string id) : value(std::move(id)) {}

    bool empty() const { return value.empty(); }
    const std::string& get() const { return value; }

    bool operator==(const RoomId& other) const { return value == other.value; }
    bool operator<(const RoomId& other) const { return value < other.value; }
};

inline constexpr std::string_view UNKNOWN_DISPLAY_NAME = "Unknown";

// Point-in-time entry used to build "who is online" payloads
struct OnlineUser {
    UserId user_id;
    std::string display_name;
    UserStatus status = UserStatus::Offline;
    bool is_agent = false;

    bool operator==(const OnlineUser& other) const = default;
};

// Participant as seen by other participants; never carries a connection id
struct VoiceParticipantInfo {
    UserId user_id;
    std::string display_name;
    bool is_muted = false;
    bool is_deafened = false;

    bool operator==(const VoiceParticipantInfo& other) const = default;
};

// STUN/TURN descriptor handed to WebRTC peers
struct IceServer {
    std::vector<std::string> urls;
    std::optional<std::string> username;
    std::optional<std::string> credential;

    bool operator==(const IceServer& other) const = default;
};

// ============================================================================
// Configuration structures
// ============================================================================

struct PresenceConfig {
    std::chrono::milliseconds grace_period{std::chrono::seconds{30}};
    std::chrono::milliseconds idle_timeout{std::chrono::minutes{5}};
    std::chrono::milliseconds agent_inactivity_timeout{std::chrono::minutes{5}};

    bool operator==(const PresenceConfig& other) const = default;
};

struct VoiceConfig {
    std::vector<std::string> stun_urls{"stun:stun.l.google.com:19302"};
    std::string turn_url;
    std::string turn_username;
    std::string turn_credential;

    bool operator==(const VoiceConfig& other) const = default;
};

struct TimerConfig {
    std::size_t worker_threads = 2;

    bool operator==(const TimerConfig& other) const = default;
};

struct ApplicationConfig {
    PresenceConfig presence;
    VoiceConfig voice;
    TimerConfig timers;

    huddle::utils::LogLevel log_level = huddle::utils::LogLevel::Info;
    std::string log_file;

    // Version information
    std::string version_string() const;
};

// ============================================================================
// String conversions
// ============================================================================

std::string_view to_string(UserStatus status);
std::optional<UserStatus> user_status_from_string(std::string_view str);

std::string_view to_string(SignalKind kind);
std::optional<SignalKind> signal_kind_from_string(std::string_view str);

std::string_view to_string(TimerKind kind);

} // namespace core
} // namespace huddle

// Hash specializations for using strong types as map keys
namespace std {
    template<>
    struct hash<huddle::core::UserId> {
        std::size_t operator()(const huddle::core::UserId& id) const noexcept {
            return std::hash<std::string>{}(id.value);
        }
    };

    template<>
    struct hash<huddle::core::ConnectionId> {
        std::size_t operator()(const huddle::core::ConnectionId& id) const noexcept {
            return std::hash<std::string>{}(id.value);
        }
    };

    template<>
    struct hash<huddle::core::RoomId> {
        std::size_t operator()(const huddle::core::RoomId& id) const noexcept {
            return std::hash<std::string>{}(id.value);
        }
    };
}
