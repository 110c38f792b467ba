#include "huddle/core/json_payloads.hpp"

#include <string>

namespace huddle::core {

using json = nlohmann::json;

namespace {

template<typename T>
json array_of(const std::vector<T>& items) {
    json array = json::array();
    for (const auto& item : items) {
        array.push_back(to_json(item));
    }
    return array;
}

}

json to_json(const OnlineUser& user) {
    json entry;
    entry["user_id"] = user.user_id.value;
    entry["display_name"] = user.display_name;
    entry["status"] = std::string(to_string(user.status));
    entry["is_agent"] = user.is_agent;
    return entry;
}

json to_json(const std::vector<OnlineUser>& users) {
    return array_of(users);
}

json to_json(const VoiceParticipantInfo& participant) {
    json entry;
    entry["user_id"] = participant.user_id.value;
    entry["display_name"] = participant.display_name;
    entry["is_muted"] = participant.is_muted;
    entry["is_deafened"] = participant.is_deafened;
    return entry;
}

json to_json(const std::vector<VoiceParticipantInfo>& roster) {
    return array_of(roster);
}

json to_json(const IceServer& server) {
    json entry;
    entry["urls"] = server.urls;
    if (server.username) entry["username"] = *server.username;
    if (server.credential) entry["credential"] = *server.credential;
    return entry;
}

json to_json(const std::vector<IceServer>& servers) {
    return array_of(servers);
}

json to_json(const events::PresenceChanged& event) {
    json message;
    message["type"] = "presence";
    message["user_id"] = event.user_id.value;
    message["display_name"] = event.display_name;
    message["status"] = std::string(to_string(event.status));
    message["is_agent"] = event.is_agent;
    return message;
}

json to_json(const events::VoiceParticipantJoined& event) {
    json message;
    message["type"] = "voice_joined";
    message["room"] = event.room_id.value;
    message["participant"] = to_json(event.participant);
    return message;
}

json to_json(const events::VoiceParticipantLeft& event) {
    json message;
    message["type"] = "voice_left";
    message["room"] = event.room_id.value;
    message["user_id"] = event.user_id.value;
    message["room_closed"] = event.room_closed;
    return message;
}

json to_json(const events::VoiceMuteChanged& event) {
    json message;
    message["type"] = "voice_mute";
    message["room"] = event.room_id.value;
    message["user_id"] = event.user_id.value;
    message["muted"] = event.muted;
    return message;
}

json to_json(const events::VoiceDeafenChanged& event) {
    json message;
    message["type"] = "voice_deafen";
    message["room"] = event.room_id.value;
    message["user_id"] = event.user_id.value;
    message["deafened"] = event.deafened;
    return message;
}

// Payload is forwarded verbatim as a string
json to_json(const events::SignalForwarded& event) {
    json message;
    message["type"] = "signal";
    message["kind"] = std::string(to_string(event.kind));
    message["from"] = event.from_user_id.value;
    message["to"] = event.to_user_id.value;
    message["payload"] = event.payload;
    return message;
}

}
