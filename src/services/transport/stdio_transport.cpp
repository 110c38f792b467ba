#include "huddle/services/transport/stdio_transport.hpp"
#include "huddle/core/events.hpp"
#include "huddle/core/json_payloads.hpp"
#include "huddle/services/presence/presence_engine.hpp"
#include "huddle/services/voice/voice_relay.hpp"
#include "huddle/utils/json_helper.hpp"
#include "huddle/utils/logger.hpp"

#include <array>
#include <istream>
#include <optional>
#include <ostream>
#include <utility>

namespace huddle::services {

using json = nlohmann::json;
using utils::JsonHelper;

namespace {

std::string_view presence_error_name(core::PresenceError error) {
    switch (error) {
        case core::PresenceError::InvalidStatus: return "invalid_status";
        case core::PresenceError::UnknownUser: return "unknown_user";
    }
    return "presence_error";
}

std::string_view voice_error_name(core::VoiceError error) {
    switch (error) {
        case core::VoiceError::RoomNotFound: return "room_not_found";
        case core::VoiceError::ParticipantNotFound: return "participant_not_found";
    }
    return "voice_error";
}

json ok() {
    return json{{"ok", true}};
}

}

StdioTransport::StdioTransport(std::shared_ptr<core::EventBus> event_bus,
                               std::shared_ptr<PresenceEngine> presence,
                               std::shared_ptr<VoiceRelay> voice,
                               std::ostream& out)
    : m_event_bus(std::move(event_bus))
    , m_presence(std::move(presence))
    , m_voice(std::move(voice))
    , m_out(out) {}

StdioTransport::~StdioTransport() {
    stop();
}

template<typename EventType>
void StdioTransport::forward_event() {
    m_subscriptions.push_back(m_event_bus->subscribe<EventType>(
        [this](const EventType& event) { write(core::to_json(event)); }));
}

void StdioTransport::start() {
    if (!m_subscriptions.empty()) return;

    forward_event<core::events::PresenceChanged>();
    forward_event<core::events::VoiceParticipantJoined>();
    forward_event<core::events::VoiceParticipantLeft>();
    forward_event<core::events::VoiceMuteChanged>();
    forward_event<core::events::VoiceDeafenChanged>();

    // Signals are addressed to one connection; expose the route
    m_subscriptions.push_back(m_event_bus->subscribe<core::events::SignalForwarded>(
        [this](const core::events::SignalForwarded& event) {
            auto message = core::to_json(event);
            message["connection"] = event.target_connection.value;
            write(message);
        }));

    HUDDLE_LOG_DEBUG("StdioTransport", "Subscribed to outbound events");
}

void StdioTransport::stop() {
    for (auto id : m_subscriptions) {
        m_event_bus->unsubscribe(id);
    }
    m_subscriptions.clear();
}

void StdioTransport::handle_line(std::string_view line) {
    auto request = JsonHelper::parse_object(line);
    if (!request) {
        HUDDLE_LOG_WARNING("StdioTransport", "Rejected input: " + request.error());
        write_error(request.error());
        return;
    }

    auto op = JsonHelper::get_required<std::string>(*request, "op");
    if (!op) {
        write_error(op.error(), *request);
        return;
    }

    auto reply = dispatch(*op, *request);
    if (!reply) {
        HUDDLE_LOG_DEBUG("StdioTransport", "Request '" + *op + "' failed: " + reply.error());
        write_error(reply.error(), *request);
        return;
    }

    json message = std::move(*reply);
    message["type"] = "reply";
    message["op"] = *op;
    if (request->contains("id")) {
        message["id"] = (*request)["id"];
    }
    write(message);
}

std::size_t StdioTransport::run(std::istream& in, const std::atomic<bool>& stop_requested) {
    std::size_t handled = 0;
    std::string line;

    while (!stop_requested.load() && std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        handle_line(line);
        ++handled;
    }

    HUDDLE_LOG_DEBUG("StdioTransport", "Input closed after " + std::to_string(handled) + " requests");
    return handled;
}

StdioTransport::Reply StdioTransport::dispatch(const std::string& op, const json& request) {
    static constexpr std::array<std::pair<std::string_view, Handler>, 15> handlers{{
        {"connect", &StdioTransport::handle_connect},
        {"disconnect", &StdioTransport::handle_disconnect},
        {"heartbeat", &StdioTransport::handle_heartbeat},
        {"status", &StdioTransport::handle_status},
        {"agent_activity", &StdioTransport::handle_agent_activity},
        {"join", &StdioTransport::handle_join},
        {"leave", &StdioTransport::handle_leave},
        {"signal", &StdioTransport::handle_signal},
        {"mute", &StdioTransport::handle_mute},
        {"deafen", &StdioTransport::handle_deafen},
        {"drop", &StdioTransport::handle_drop},
        {"snapshot", &StdioTransport::handle_snapshot},
        {"roster", &StdioTransport::handle_roster},
        {"ice_servers", &StdioTransport::handle_ice_servers},
        {"get_status", &StdioTransport::handle_get_status},
    }};

    for (const auto& [name, handler] : handlers) {
        if (name == op) {
            return (this->*handler)(request);
        }
    }
    return std::unexpected("Unknown op: " + op);
}

StdioTransport::Reply StdioTransport::handle_connect(const json& request) {
    auto user = JsonHelper::get_required<std::string>(request, "user");
    if (!user) return std::unexpected(user.error());
    auto conn = JsonHelper::get_required<std::string>(request, "conn");
    if (!conn) return std::unexpected(conn.error());

    const auto name = JsonHelper::get_optional<std::string>(request, "name", "");
    const auto agent = JsonHelper::get_optional<bool>(request, "agent", false);

    core::UserId user_id{*user};
    core::ConnectionId connection_id{*conn};
    std::optional<core::UserId> previous_owner;
    {
        std::lock_guard lock(m_connections_mutex);
        auto [it, inserted] = m_connection_owners.try_emplace(connection_id, user_id);
        if (!inserted && it->second != user_id) {
            previous_owner = std::exchange(it->second, user_id);
        }
    }

    // A handle belongs to one user; release it from the old owner first
    if (previous_owner) {
        HUDDLE_LOG_WARNING("StdioTransport", "Connection " + connection_id.value + " moved from " +
                           previous_owner->value + " to " + user_id.value);
        m_presence->disconnect(*previous_owner, connection_id);
    }
    m_presence->connect(user_id, connection_id, name, agent);

    // Initial state for the new connection
    auto reply = ok();
    reply["online"] = core::to_json(m_presence->snapshot());
    return reply;
}

StdioTransport::Reply StdioTransport::handle_disconnect(const json& request) {
    auto user = JsonHelper::get_required<std::string>(request, "user");
    if (!user) return std::unexpected(user.error());
    auto conn = JsonHelper::get_required<std::string>(request, "conn");
    if (!conn) return std::unexpected(conn.error());

    core::ConnectionId connection_id{*conn};
    {
        std::lock_guard lock(m_connections_mutex);
        m_connection_owners.erase(connection_id);
    }

    auto reply = ok();
    reply["last_connection"] = m_presence->disconnect(core::UserId{*user}, connection_id);
    return reply;
}

StdioTransport::Reply StdioTransport::handle_heartbeat(const json& request) {
    auto user = JsonHelper::get_required<std::string>(request, "user");
    if (!user) return std::unexpected(user.error());

    m_presence->heartbeat(core::UserId{*user});
    return ok();
}

StdioTransport::Reply StdioTransport::handle_status(const json& request) {
    auto user = JsonHelper::get_required<std::string>(request, "user");
    if (!user) return std::unexpected(user.error());
    auto status_text = JsonHelper::get_required<std::string>(request, "status");
    if (!status_text) return std::unexpected(status_text.error());

    auto status = core::user_status_from_string(*status_text);
    if (!status) {
        return std::unexpected("Unknown status: " + *status_text);
    }

    auto result = m_presence->request_status(core::UserId{*user}, *status);
    if (!result) {
        return std::unexpected(std::string(presence_error_name(result.error())));
    }
    return ok();
}

StdioTransport::Reply StdioTransport::handle_agent_activity(const json& request) {
    auto user = JsonHelper::get_required<std::string>(request, "user");
    if (!user) return std::unexpected(user.error());

    m_presence->touch_agent_activity(core::UserId{*user},
                                     JsonHelper::get_optional<std::string>(request, "name", ""));
    return ok();
}

StdioTransport::Reply StdioTransport::handle_join(const json& request) {
    auto room = JsonHelper::get_required<std::string>(request, "room");
    if (!room) return std::unexpected(room.error());
    auto user = JsonHelper::get_required<std::string>(request, "user");
    if (!user) return std::unexpected(user.error());
    auto conn = JsonHelper::get_required<std::string>(request, "conn");
    if (!conn) return std::unexpected(conn.error());

    auto roster = m_voice->join_room(core::RoomId{*room}, core::UserId{*user}, core::ConnectionId{*conn},
                                     JsonHelper::get_optional<std::string>(request, "name", ""));

    auto reply = ok();
    reply["room"] = *room;
    reply["roster"] = core::to_json(roster);
    return reply;
}

StdioTransport::Reply StdioTransport::handle_leave(const json& request) {
    auto room = JsonHelper::get_required<std::string>(request, "room");
    if (!room) return std::unexpected(room.error());
    auto conn = JsonHelper::get_required<std::string>(request, "conn");
    if (!conn) return std::unexpected(conn.error());

    auto left = m_voice->leave_room(core::RoomId{*room}, core::ConnectionId{*conn});
    if (!left) {
        return std::unexpected(std::string(voice_error_name(left.error())));
    }

    auto reply = ok();
    reply["user_id"] = left->value;
    return reply;
}

StdioTransport::Reply StdioTransport::handle_signal(const json& request) {
    auto kind_text = JsonHelper::get_required<std::string>(request, "kind");
    if (!kind_text) return std::unexpected(kind_text.error());
    auto from = JsonHelper::get_required<std::string>(request, "from");
    if (!from) return std::unexpected(from.error());
    auto to = JsonHelper::get_required<std::string>(request, "to");
    if (!to) return std::unexpected(to.error());
    if (!request.contains("payload")) {
        return std::unexpected("Missing required field: payload");
    }

    auto kind = core::signal_kind_from_string(*kind_text);
    if (!kind) {
        return std::unexpected("Unknown signal kind: " + *kind_text);
    }

    // SDP and ICE payloads pass through untouched; objects are re-serialized
    const auto& payload = request["payload"];
    const std::string data = payload.is_string() ? payload.get<std::string>() : payload.dump();

    // Delivery failures are not reported to the sender
    if (!m_voice->relay_signal(*kind, core::UserId{*from}, core::UserId{*to}, data)) {
        HUDDLE_LOG_DEBUG("StdioTransport", "Signal from " + *from + " had no recipient");
    }
    return ok();
}

StdioTransport::Reply StdioTransport::handle_mute(const json& request) {
    auto room = JsonHelper::get_required<std::string>(request, "room");
    if (!room) return std::unexpected(room.error());
    auto conn = JsonHelper::get_required<std::string>(request, "conn");
    if (!conn) return std::unexpected(conn.error());
    auto muted = JsonHelper::get_required<bool>(request, "muted");
    if (!muted) return std::unexpected(muted.error());

    auto result = m_voice->set_muted(core::RoomId{*room}, core::ConnectionId{*conn}, *muted);
    if (!result) {
        return std::unexpected(std::string(voice_error_name(result.error())));
    }
    return ok();
}

StdioTransport::Reply StdioTransport::handle_deafen(const json& request) {
    auto room = JsonHelper::get_required<std::string>(request, "room");
    if (!room) return std::unexpected(room.error());
    auto conn = JsonHelper::get_required<std::string>(request, "conn");
    if (!conn) return std::unexpected(conn.error());
    auto deafened = JsonHelper::get_required<bool>(request, "deafened");
    if (!deafened) return std::unexpected(deafened.error());

    auto result = m_voice->set_deafened(core::RoomId{*room}, core::ConnectionId{*conn}, *deafened);
    if (!result) {
        return std::unexpected(std::string(voice_error_name(result.error())));
    }
    return ok();
}

StdioTransport::Reply StdioTransport::handle_drop(const json& request) {
    auto conn = JsonHelper::get_required<std::string>(request, "conn");
    if (!conn) return std::unexpected(conn.error());

    core::ConnectionId connection_id{*conn};
    std::optional<core::UserId> owner;
    {
        std::lock_guard lock(m_connections_mutex);
        auto it = m_connection_owners.find(connection_id);
        if (it != m_connection_owners.end()) {
            owner = it->second;
            m_connection_owners.erase(it);
        }
    }

    json rooms = json::array();
    for (const auto& room_id : m_voice->on_disconnect(connection_id)) {
        rooms.push_back(room_id.value);
    }

    auto reply = ok();
    reply["rooms_left"] = rooms;
    if (owner) {
        reply["last_connection"] = m_presence->disconnect(*owner, connection_id);
    } else {
        HUDDLE_LOG_DEBUG("StdioTransport", "Dropped connection " + *conn + " had no presence owner");
    }
    return reply;
}

StdioTransport::Reply StdioTransport::handle_snapshot(const json& /* request */) {
    auto reply = ok();
    reply["online"] = core::to_json(m_presence->snapshot());
    return reply;
}

StdioTransport::Reply StdioTransport::handle_roster(const json& request) {
    auto room = JsonHelper::get_required<std::string>(request, "room");
    if (!room) return std::unexpected(room.error());

    auto reply = ok();
    reply["room"] = *room;
    reply["roster"] = core::to_json(m_voice->get_room_roster(core::RoomId{*room}));
    return reply;
}

StdioTransport::Reply StdioTransport::handle_ice_servers(const json& /* request */) {
    auto reply = ok();
    reply["ice_servers"] = core::to_json(m_voice->get_ice_servers());
    return reply;
}

StdioTransport::Reply StdioTransport::handle_get_status(const json& request) {
    auto user = JsonHelper::get_required<std::string>(request, "user");
    if (!user) return std::unexpected(user.error());

    auto reply = ok();
    reply["user_id"] = *user;
    reply["status"] = std::string(core::to_string(m_presence->get_status(core::UserId{*user})));
    return reply;
}

void StdioTransport::write(const json& message) {
    // Invalid UTF-8 from clients is replaced rather than thrown
    const auto text = message.dump(-1, ' ', false, json::error_handler_t::replace);

    std::lock_guard lock(m_output_mutex);
    m_out << text << '\n';
    m_out.flush();
}

void StdioTransport::write_error(const std::string& message, const json& request) {
    json error;
    error["type"] = "error";
    error["message"] = message;
    if (request.is_object()) {
        if (request.contains("op")) error["op"] = request["op"];
        if (request.contains("id")) error["id"] = request["id"];
    }
    write(error);
}

} // namespace huddle::services
