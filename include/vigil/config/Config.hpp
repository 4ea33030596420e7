#pragma once

#include "vigil/dashboard/DashboardServer.hpp"
#include "vigil/metrics/MetricsSampler.hpp"
#include "vigil/trace/TraceStore.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace vigil::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ─────────────────────────────────────────────────────────────────────────────
// Effective configuration. Defaults apply for anything the file and the
// environment leave unset.
// ─────────────────────────────────────────────────────────────────────────────
struct Config {
    trace::TraceStoreConfig    trace;
    metrics::SamplerConfig     sampler;
    dashboard::DashboardConfig dashboard;
    double                     lost_event_timeout = 5.0;   // seconds
};

// File layout (every key optional, durations in seconds):
//
//   {
//     "trace":     {"capacity", "auto_create_on_unknown_checkpoint",
//                   "record_start_checkpoint"},
//     "sampler":   {"sample_interval", "history_size", "queue_capacity",
//                   "action_window"},
//     "dashboard": {"host", "port", "broadcast_interval", "html_path"},
//     "lost_event_timeout": 5.0
//   }
//
// Unknown keys are ignored.
void apply_json(Config& cfg, const nlohmann::json& j);

// VIGIL_DASHBOARD_HOST, VIGIL_DASHBOARD_PORT, VIGIL_SAMPLE_INTERVAL,
// VIGIL_TRACE_CAPACITY
void apply_env(Config& cfg);

void validate_config(const Config& cfg);

// Empty path: defaults + environment. Otherwise file, then environment.
// Always validated. Throws ConfigError.
Config load_config(const std::string& path = "");

nlohmann::json to_json(const Config& cfg);

} // namespace vigil::config
