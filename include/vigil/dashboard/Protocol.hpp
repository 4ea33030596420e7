#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace vigil::dashboard {

enum class MessageType {
    Ping,
    RequestMetrics,
    Unknown,   // well-formed object, unrecognized or missing "type"
    Invalid    // not JSON, or not a JSON object
};

struct ClientMessage {
    MessageType    type = MessageType::Invalid;
    std::string    type_name;    // raw "type" value when it is a string
    nlohmann::json timestamp;    // ping payload, echoed back; null if absent
    std::string    error;        // parse error for Invalid
};

ClientMessage parse_client_message(const std::string& text);

// {"type":"pong","timestamp":<echoed>}
std::string make_pong(const nlohmann::json& timestamp);

const char* to_string(MessageType t) noexcept;

} // namespace vigil::dashboard
