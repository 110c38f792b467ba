#pragma once

#include "huddle/core/event_bus.hpp"
#include "huddle/core/models.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <expected>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace huddle::services {

class PresenceEngine;
class VoiceRelay;

/**
 * @brief Line-delimited JSON adapter over the presence engine and voice relay
 *
 * Each input line is one request object with an "op" field and an optional
 * "id" echoed in the reply. Replies and subscribed events are written to the
 * output stream as one JSON object per line. A malformed request produces an
 * {"type":"error"} line and processing continues.
 *
 * Stands in for a socket transport during development: it tracks which user
 * owns each connection so that "drop" can run the same cleanup a closed
 * socket would.
 */
class StdioTransport {
public:
    StdioTransport(std::shared_ptr<core::EventBus> event_bus,
                   std::shared_ptr<PresenceEngine> presence,
                   std::shared_ptr<VoiceRelay> voice,
                   std::ostream& out);
    ~StdioTransport();

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    // Subscribes to outbound events
    void start();
    void stop();

    void handle_line(std::string_view line);

    // Reads until EOF or stop_requested; returns the number of requests handled
    std::size_t run(std::istream& in, const std::atomic<bool>& stop_requested);

private:
    using Reply = std::expected<nlohmann::json, std::string>;
    using Handler = Reply (StdioTransport::*)(const nlohmann::json&);

    Reply dispatch(const std::string& op, const nlohmann::json& request);

    Reply handle_connect(const nlohmann::json& request);
    Reply handle_disconnect(const nlohmann::json& request);
    Reply handle_heartbeat(const nlohmann::json& request);
    Reply handle_status(const nlohmann::json& request);
    Reply handle_agent_activity(const nlohmann::json& request);
    Reply handle_join(const nlohmann::json& request);
    Reply handle_leave(const nlohmann::json& request);
    Reply handle_signal(const nlohmann::json& request);
    Reply handle_mute(const nlohmann::json& request);
    Reply handle_deafen(const nlohmann::json& request);
    Reply handle_drop(const nlohmann::json& request);
    Reply handle_snapshot(const nlohmann::json& request);
    Reply handle_roster(const nlohmann::json& request);
    Reply handle_ice_servers(const nlohmann::json& request);
    Reply handle_get_status(const nlohmann::json& request);

    template<typename EventType>
    void forward_event();

    void write(const nlohmann::json& message);
    void write_error(const std::string& message, const nlohmann::json& request = nullptr);

    std::shared_ptr<core::EventBus> m_event_bus;
    std::shared_ptr<PresenceEngine> m_presence;
    std::shared_ptr<VoiceRelay> m_voice;

    std::ostream& m_out;
    std::mutex m_output_mutex;

    std::mutex m_connections_mutex;
    std::unordered_map<core::ConnectionId, core::UserId> m_connection_owners;

    std::vector<core::EventBus::HandlerId> m_subscriptions;
};

} // namespace huddle::services
