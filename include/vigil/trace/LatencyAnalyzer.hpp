#pragma once

#include "vigil/trace/EventTrace.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace vigil::trace {

inline constexpr const char* kNoBottleneck = "N/A";

struct StageStats {
    double mean  = 0.0;
    double p50   = 0.0;
    double p95   = 0.0;
    double p99   = 0.0;
    double min   = 0.0;
    double max   = 0.0;
    size_t count = 0;
};

using StageStatsMap = std::map<std::string, StageStats>;

// Aggregate view over a trace snapshot. Never stored, always recomputed.
struct EventFlow {
    size_t      total_events     = 0;
    size_t      completed_events = 0;
    size_t      lost_events      = 0;
    double      avg_latency      = 0.0;
    double      p95_latency      = 0.0;
    double      p99_latency      = 0.0;
    std::string bottleneck_stage = kNoBottleneck;
    std::map<std::string, double> stage_latencies;   // stage -> mean
};

struct Anomaly {
    std::string event_id;
    EventTrace  trace;
    std::string stage;
    double      latency = 0.0;
    double      factor  = 0.0;   // latency / stage mean
};

struct StageComparison {
    double a_latency = 0.0;
    double b_latency = 0.0;
    double diff      = 0.0;      // b - a
    double diff_pct  = 0.0;      // 0 when a_latency == 0
};

// Nearest-rank percentile over an ascending sample set:
// sorted[floor(n * p)] with the index clamped to [0, n-1].
// Returns 0 for an empty set.
double nearest_rank(const std::vector<double>& sorted, double p);

StageStatsMap analyze_latencies(const std::vector<EventTrace>& traces);

// Stage with the highest mean latency, or kNoBottleneck.
std::string find_bottleneck(const std::vector<EventTrace>& traces);

// A trace is flagged once, at its first stage slower than threshold x the
// population mean for that stage.
std::vector<Anomaly> detect_anomalies(const std::vector<EventTrace>& traces,
                                      double threshold = 2.0);

// window start (seconds) -> events per second. Windows tile
// [min created_at, max created_at]. Throws std::invalid_argument if
// window <= 0.
std::map<double, double> calculate_throughput(const std::vector<EventTrace>& traces,
                                              double window = 1.0);

std::map<std::string, StageComparison> compare_traces(const EventTrace& a,
                                                      const EventTrace& b);

std::string generate_latency_report(const std::vector<EventTrace>& traces,
                                    double threshold = 2.0);

EventFlow analyze_flow(const std::vector<EventTrace>& traces);

} // namespace vigil::trace
