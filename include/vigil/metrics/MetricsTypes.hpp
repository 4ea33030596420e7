#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace vigil::metrics {

struct SystemMetrics {
    double   timestamp      = 0.0;
    double   cpu_percent    = 0.0;
    uint64_t memory_bytes   = 0;     // resident set
    double   memory_percent = 0.0;
    uint32_t thread_count   = 0;
    uint32_t process_count  = 1;     // self + descendants

    uint64_t memory_mb() const { return memory_bytes / (1024 * 1024); }
};

struct ActionMetrics {
    double   timestamp          = 0.0;
    uint64_t total_actions      = 0;
    double   actions_per_minute = 0.0;
    double   avg_duration       = 0.0;
    std::optional<std::string> current_action;
    int64_t  queue_depth        = 0;
    double   success_rate       = 100.0;   // percent
    uint64_t error_count        = 0;
};

struct EventMetrics {
    double   timestamp           = 0.0;
    uint64_t events_queued       = 0;
    uint64_t events_processed    = 0;
    uint64_t events_failed       = 0;
    double   avg_processing_time = 0.0;
    int64_t  queue_depth         = 0;
};

struct MetricsSnapshot {
    SystemMetrics system;
    ActionMetrics actions;
    EventMetrics  events;
};

struct ActionRecord {
    double      timestamp = 0.0;
    std::string name;
    double      duration  = 0.0;
    bool        success   = true;
};

// Dashboard wire schema. Field names and nesting are fixed.
nlohmann::json to_json(const MetricsSnapshot& s);

} // namespace vigil::metrics
