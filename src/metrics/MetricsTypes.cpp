#include "vigil/metrics/MetricsTypes.hpp"

namespace vigil::metrics {

using json = nlohmann::json;

json to_json(const MetricsSnapshot& s) {
    json j;

    j["system"] = {
        {"timestamp",      s.system.timestamp},
        {"cpu_percent",    s.system.cpu_percent},
        {"memory_mb",      s.system.memory_mb()},
        {"memory_percent", s.system.memory_percent},
        {"thread_count",   s.system.thread_count},
        {"process_count",  s.system.process_count}
    };

    json actions = {
        {"timestamp",          s.actions.timestamp},
        {"total_actions",      s.actions.total_actions},
        {"actions_per_minute", s.actions.actions_per_minute},
        {"avg_duration",       s.actions.avg_duration},
        {"queue_depth",        s.actions.queue_depth},
        {"success_rate",       s.actions.success_rate},
        {"error_count",        s.actions.error_count}
    };
    if (s.actions.current_action)
        actions["current_action"] = *s.actions.current_action;
    else
        actions["current_action"] = nullptr;
    j["actions"] = std::move(actions);

    j["events"] = {
        {"timestamp",           s.events.timestamp},
        {"events_queued",       s.events.events_queued},
        {"events_processed",    s.events.events_processed},
        {"events_failed",       s.events.events_failed},
        {"avg_processing_time", s.events.avg_processing_time},
        {"queue_depth",         s.events.queue_depth}
    };

    return j;
}

} // namespace vigil::metrics
