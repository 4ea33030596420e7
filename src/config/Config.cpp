#include "vigil/config/Config.hpp"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

namespace vigil::config {

using json = nlohmann::json;

namespace {

const json* section(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end()) return nullptr;
    if (!it->is_object())
        throw ConfigError(std::string("\"") + name + "\" must be an object");
    return &*it;
}

uint64_t read_uint(const json& obj, const char* key, uint64_t current, uint64_t max) {
    auto it = obj.find(key);
    if (it == obj.end()) return current;
    if (!it->is_number_integer())
        throw ConfigError(std::string("\"") + key + "\" must be an integer");
    if (it->is_number_unsigned()) {
        uint64_t v = it->get<uint64_t>();
        if (v > max)
            throw ConfigError(std::string("\"") + key + "\" out of range: " + std::to_string(v));
        return v;
    }
    int64_t v = it->get<int64_t>();
    if (v < 0 || static_cast<uint64_t>(v) > max)
        throw ConfigError(std::string("\"") + key + "\" out of range: " + std::to_string(v));
    return static_cast<uint64_t>(v);
}

double read_seconds(const json& obj, const char* key, double current) {
    auto it = obj.find(key);
    if (it == obj.end()) return current;
    if (!it->is_number())
        throw ConfigError(std::string("\"") + key + "\" must be a number of seconds");
    return it->get<double>();
}

bool read_bool(const json& obj, const char* key, bool current) {
    auto it = obj.find(key);
    if (it == obj.end()) return current;
    if (!it->is_boolean())
        throw ConfigError(std::string("\"") + key + "\" must be true or false");
    return it->get<bool>();
}

std::string read_string(const json& obj, const char* key, const std::string& current) {
    auto it = obj.find(key);
    if (it == obj.end()) return current;
    if (!it->is_string())
        throw ConfigError(std::string("\"") + key + "\" must be a string");
    return it->get<std::string>();
}

uint64_t env_uint(const char* name, const char* value, uint64_t max) {
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(value, &end, 10);
    if (errno != 0 || end == value || *end != '\0' || value[0] == '-' || v > max)
        throw ConfigError(std::string(name) + ": invalid value '" + value + "'");
    return static_cast<uint64_t>(v);
}

double env_seconds(const char* name, const char* value) {
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(value, &end);
    if (errno != 0 || end == value || *end != '\0')
        throw ConfigError(std::string(name) + ": invalid value '" + value + "'");
    return v;
}

constexpr uint64_t kSizeMax = std::numeric_limits<size_t>::max();

} // namespace

void apply_json(Config& cfg, const json& j) {
    if (!j.is_object())
        throw ConfigError("config root must be a JSON object");

    if (const json* t = section(j, "trace")) {
        cfg.trace.capacity = read_uint(*t, "capacity", cfg.trace.capacity, kSizeMax);
        cfg.trace.auto_create_on_unknown_checkpoint =
            read_bool(*t, "auto_create_on_unknown_checkpoint", cfg.trace.auto_create_on_unknown_checkpoint);
        cfg.trace.record_start_checkpoint =
            read_bool(*t, "record_start_checkpoint", cfg.trace.record_start_checkpoint);
    }

    if (const json* s = section(j, "sampler")) {
        cfg.sampler.sample_interval = read_seconds(*s, "sample_interval", cfg.sampler.sample_interval);
        cfg.sampler.history_size = read_uint(*s, "history_size", cfg.sampler.history_size, kSizeMax);
        cfg.sampler.queue_capacity = read_uint(*s, "queue_capacity", cfg.sampler.queue_capacity, kSizeMax);
        cfg.sampler.action_window = read_seconds(*s, "action_window", cfg.sampler.action_window);
    }

    if (const json* d = section(j, "dashboard")) {
        cfg.dashboard.host = read_string(*d, "host", cfg.dashboard.host);
        cfg.dashboard.port = static_cast<uint16_t>(read_uint(*d, "port", cfg.dashboard.port, 65535));
        cfg.dashboard.broadcast_interval =
            read_seconds(*d, "broadcast_interval", cfg.dashboard.broadcast_interval);
        cfg.dashboard.dashboard_html_path = read_string(*d, "html_path", cfg.dashboard.dashboard_html_path);
    }

    cfg.lost_event_timeout = read_seconds(j, "lost_event_timeout", cfg.lost_event_timeout);
}

void apply_env(Config& cfg) {
    if (const char* v = std::getenv("VIGIL_DASHBOARD_HOST")) {
        cfg.dashboard.host = v;
        std::cout << "[CONFIG] VIGIL_DASHBOARD_HOST=" << v << std::endl;
    }
    if (const char* v = std::getenv("VIGIL_DASHBOARD_PORT")) {
        cfg.dashboard.port = static_cast<uint16_t>(env_uint("VIGIL_DASHBOARD_PORT", v, 65535));
        std::cout << "[CONFIG] VIGIL_DASHBOARD_PORT=" << v << std::endl;
    }
    if (const char* v = std::getenv("VIGIL_SAMPLE_INTERVAL")) {
        cfg.sampler.sample_interval = env_seconds("VIGIL_SAMPLE_INTERVAL", v);
        std::cout << "[CONFIG] VIGIL_SAMPLE_INTERVAL=" << v << std::endl;
    }
    if (const char* v = std::getenv("VIGIL_TRACE_CAPACITY")) {
        cfg.trace.capacity = env_uint("VIGIL_TRACE_CAPACITY", v, kSizeMax);
        std::cout << "[CONFIG] VIGIL_TRACE_CAPACITY=" << v << std::endl;
    }
}

void validate_config(const Config& cfg) {
    if (cfg.trace.capacity == 0)
        throw ConfigError("trace.capacity must be > 0");
    if (cfg.sampler.history_size == 0)
        throw ConfigError("sampler.history_size must be > 0");
    if (cfg.sampler.queue_capacity == 0)
        throw ConfigError("sampler.queue_capacity must be > 0");
    if (!infra::is_valid_interval(cfg.sampler.sample_interval))
        throw ConfigError("sampler.sample_interval must be in (0, 86400] seconds");
    if (!infra::is_valid_interval(cfg.sampler.action_window))
        throw ConfigError("sampler.action_window must be in (0, 86400] seconds");
    if (!infra::is_valid_interval(cfg.dashboard.broadcast_interval))
        throw ConfigError("dashboard.broadcast_interval must be in (0, 86400] seconds");
    if (cfg.dashboard.host.empty())
        throw ConfigError("dashboard.host must not be empty");
    if (!(cfg.lost_event_timeout > 0.0) || !std::isfinite(cfg.lost_event_timeout))
        throw ConfigError("lost_event_timeout must be > 0");
}

Config load_config(const std::string& path) {
    Config cfg;

    if (!path.empty()) {
        std::ifstream f(path);
        if (!f)
            throw ConfigError("cannot open config file " + path);

        json j;
        try {
            f >> j;
        } catch (const json::parse_error& e) {
            throw ConfigError(path + ": " + e.what());
        }
        apply_json(cfg, j);
        std::cout << "[CONFIG] loaded " << path << std::endl;
    }

    apply_env(cfg);
    validate_config(cfg);
    return cfg;
}

json to_json(const Config& cfg) {
    return {
        {"trace", {
            {"capacity", cfg.trace.capacity},
            {"auto_create_on_unknown_checkpoint", cfg.trace.auto_create_on_unknown_checkpoint},
            {"record_start_checkpoint", cfg.trace.record_start_checkpoint}
        }},
        {"sampler", {
            {"sample_interval", cfg.sampler.sample_interval},
            {"history_size", cfg.sampler.history_size},
            {"queue_capacity", cfg.sampler.queue_capacity},
            {"action_window", cfg.sampler.action_window}
        }},
        {"dashboard", {
            {"host", cfg.dashboard.host},
            {"port", cfg.dashboard.port},
            {"broadcast_interval", cfg.dashboard.broadcast_interval},
            {"html_path", cfg.dashboard.dashboard_html_path}
        }},
        {"lost_event_timeout", cfg.lost_event_timeout}
    };
}

} // namespace vigil::config
