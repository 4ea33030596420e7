#include "vigil/dashboard/Protocol.hpp"

namespace vigil::dashboard {

using json = nlohmann::json;

ClientMessage parse_client_message(const std::string& text) {
    ClientMessage msg;

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        msg.type = MessageType::Invalid;
        msg.error = e.what();
        return msg;
    }

    if (!j.is_object()) {
        msg.type = MessageType::Invalid;
        msg.error = "expected a JSON object";
        return msg;
    }

    auto it = j.find("type");
    if (it == j.end() || !it->is_string()) {
        msg.type = MessageType::Unknown;
        return msg;
    }

    msg.type_name = it->get<std::string>();
    if (msg.type_name == "ping") {
        msg.type = MessageType::Ping;
        auto ts = j.find("timestamp");
        if (ts != j.end()) msg.timestamp = *ts;
    } else if (msg.type_name == "request_metrics") {
        msg.type = MessageType::RequestMetrics;
    } else {
        msg.type = MessageType::Unknown;
    }
    return msg;
}

std::string make_pong(const json& timestamp) {
    json j;
    j["type"] = "pong";
    j["timestamp"] = timestamp;
    return j.dump();
}

const char* to_string(MessageType t) noexcept {
    switch (t) {
        case MessageType::Ping:           return "ping";
        case MessageType::RequestMetrics: return "request_metrics";
        case MessageType::Unknown:        return "unknown";
        case MessageType::Invalid:        return "invalid";
    }
    return "invalid";
}

} // namespace vigil::dashboard
