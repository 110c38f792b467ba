#pragma once

#include "huddle/core/events.hpp"
#include "huddle/core/models.hpp"

#include <nlohmann/json.hpp>
#include <vector>

namespace huddle::core {

// Outbound payloads for the transport layer. Voice payloads never carry
// connection ids; routing fields stay on the event objects.

nlohmann::json to_json(const OnlineUser& user);
nlohmann::json to_json(const std::vector<OnlineUser>& users);

nlohmann::json to_json(const VoiceParticipantInfo& participant);
nlohmann::json to_json(const std::vector<VoiceParticipantInfo>& roster);

nlohmann::json to_json(const IceServer& server);
nlohmann::json to_json(const std::vector<IceServer>& servers);

nlohmann::json to_json(const events::PresenceChanged& event);
nlohmann::json to_json(const events::VoiceParticipantJoined& event);
nlohmann::json to_json(const events::VoiceParticipantLeft& event);
nlohmann::json to_json(const events::VoiceMuteChanged& event);
nlohmann::json to_json(const events::VoiceDeafenChanged& event);
nlohmann::json to_json(const events::SignalForwarded& event);

}
