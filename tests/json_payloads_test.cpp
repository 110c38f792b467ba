#include "huddle/core/json_payloads.hpp"
#include "huddle/utils/json_helper.hpp"

#include <gtest/gtest.h>

using namespace huddle::core;
using huddle::utils::JsonHelper;

TEST(JsonPayloadsTest, OnlineUserFields) {
    auto entry = to_json(OnlineUser{UserId{"u1"}, "Alice", UserStatus::DoNotDisturb, false});

    EXPECT_EQ(entry["user_id"], "u1");
    EXPECT_EQ(entry["display_name"], "Alice");
    EXPECT_EQ(entry["status"], std::string(to_string(UserStatus::DoNotDisturb)));
    EXPECT_EQ(entry["is_agent"], false);
}

TEST(JsonPayloadsTest, RosterNeverCarriesConnectionIds) {
    events::VoiceParticipantJoined joined{
        RoomId{"lounge"}, VoiceParticipantInfo{UserId{"u1"}, "Alice", true, false}, ConnectionId{"secret-conn"}};

    auto message = to_json(joined);

    EXPECT_EQ(message["type"], "voice_joined");
    EXPECT_EQ(message["room"], "lounge");
    EXPECT_EQ(message["participant"]["is_muted"], true);
    EXPECT_EQ(message.dump().find("secret-conn"), std::string::npos);
}

TEST(JsonPayloadsTest, IceServerOmitsAbsentCredentials) {
    auto stun = to_json(IceServer{{"stun:a", "stun:b"}, std::nullopt, std::nullopt});
    EXPECT_EQ(stun["urls"].size(), 2u);
    EXPECT_FALSE(stun.contains("username"));
    EXPECT_FALSE(stun.contains("credential"));

    auto turn = to_json(IceServer{{"turn:t"}, std::string("user"), std::string("pass")});
    EXPECT_EQ(turn["username"], "user");
    EXPECT_EQ(turn["credential"], "pass");
}

TEST(JsonPayloadsTest, EmptyListsSerializeAsArrays) {
    EXPECT_TRUE(to_json(std::vector<OnlineUser>{}).is_array());
    EXPECT_TRUE(to_json(std::vector<VoiceParticipantInfo>{}).is_array());
    EXPECT_TRUE(to_json(std::vector<IceServer>{}).is_array());
}

TEST(JsonPayloadsTest, SignalPayloadIsPassedThroughVerbatim) {
    const std::string sdp = "v=0\r\no=- 4611 2 IN IP4 127.0.0.1\r\n";
    events::SignalForwarded signal{SignalKind::Offer, UserId{"u1"}, UserId{"u2"}, ConnectionId{"c2"}, sdp};

    auto message = to_json(signal);

    EXPECT_EQ(message["type"], "signal");
    EXPECT_EQ(message["from"], "u1");
    EXPECT_EQ(message["to"], "u2");
    EXPECT_EQ(message["payload"], sdp);
}

TEST(JsonPayloadsTest, PresenceAndVoiceStateEvents) {
    auto presence = to_json(events::PresenceChanged{UserId{"u1"}, "Alice", UserStatus::Offline, true});
    EXPECT_EQ(presence["type"], "presence");
    EXPECT_EQ(presence["is_agent"], true);

    auto left = to_json(events::VoiceParticipantLeft{RoomId{"r"}, UserId{"u1"}, ConnectionId{"c1"}, true});
    EXPECT_EQ(left["type"], "voice_left");
    EXPECT_EQ(left["room_closed"], true);

    auto mute = to_json(events::VoiceMuteChanged{RoomId{"r"}, UserId{"u1"}, ConnectionId{"c1"}, true});
    EXPECT_EQ(mute["muted"], true);

    auto deafen = to_json(events::VoiceDeafenChanged{RoomId{"r"}, UserId{"u1"}, ConnectionId{"c1"}, false});
    EXPECT_EQ(deafen["deafened"], false);
}

TEST(JsonHelperTest, ParseObjectRejectsNonObjects) {
    EXPECT_TRUE(JsonHelper::parse_object(R"({"op":"snapshot"})").has_value());
    EXPECT_FALSE(JsonHelper::parse_object("[1,2]").has_value());
    EXPECT_FALSE(JsonHelper::parse_object("{not json").has_value());
    EXPECT_FALSE(JsonHelper::parse_object("").has_value());
}

TEST(JsonHelperTest, RequiredAndOptionalFields) {
    auto json = nlohmann::json::parse(R"({"user":"u1","count":3,"flag":"yes"})");

    EXPECT_EQ(JsonHelper::get_required<std::string>(json, "user").value(), "u1");
    EXPECT_FALSE(JsonHelper::get_required<std::string>(json, "missing").has_value());
    EXPECT_FALSE(JsonHelper::get_required<std::string>(json, "count").has_value());

    EXPECT_EQ(JsonHelper::get_optional<int>(json, "count", 0), 3);
    EXPECT_EQ(JsonHelper::get_optional<bool>(json, "flag", false), false);
    EXPECT_EQ(JsonHelper::get_optional<std::string>(json, "name", "fallback"), "fallback");
}
