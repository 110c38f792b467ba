#include "huddle/core/models.hpp"
#include "version.h"

namespace huddle {
namespace core {

std::string ApplicationConfig::version_string() const {
    return HUDDLE_VERSION_STRING;
}

std::string_view to_string(UserStatus status) {
    switch (status) {
        case UserStatus::Online: return "Online";
        case UserStatus::Idle: return "Idle";
        case UserStatus::DoNotDisturb: return "DoNotDisturb";
        case UserStatus::Offline: return "Offline";
    }
    return "Offline";
}

std::optional<UserStatus> user_status_from_string(std::string_view str) {
    if (str == "Online" || str == "online") return UserStatus::Online;
    if (str == "Idle" || str == "idle") return UserStatus::Idle;
    if (str == "DoNotDisturb" || str == "dnd") return UserStatus::DoNotDisturb;
    if (str == "Offline" || str == "offline") return UserStatus::Offline;
    return std::nullopt;
}

std::string_view to_string(SignalKind kind) {
    switch (kind) {
        case SignalKind::Offer: return "Offer";
        case SignalKind::Answer: return "Answer";
        case SignalKind::IceCandidate: return "IceCandidate";
    }
    return "Offer";
}

std::optional<SignalKind> signal_kind_from_string(std::string_view str) {
    if (str == "Offer" || str == "offer") return SignalKind::Offer;
    if (str == "Answer" || str == "answer") return SignalKind::Answer;
    if (str == "IceCandidate" || str == "ice_candidate" || str == "ice") return SignalKind::IceCandidate;
    return std::nullopt;
}

std::string_view to_string(TimerKind kind) {
    switch (kind) {
        case TimerKind::Grace: return "grace";
        case TimerKind::Idle: return "idle";
        case TimerKind::AgentInactivity: return "agent-inactivity";
    }
    return "unknown";
}

} // namespace core
} // namespace huddle
