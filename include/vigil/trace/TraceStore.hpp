#pragma once

#include "vigil/infra/Clock.hpp"
#include "vigil/trace/EventTrace.hpp"
#include "vigil/trace/LatencyAnalyzer.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace vigil::trace {

class TraceNotFound : public std::runtime_error {
public:
    explicit TraceNotFound(const std::string& event_id)
        : std::runtime_error("trace not found: " + event_id), event_id_(event_id) {}

    const std::string& event_id() const noexcept { return event_id_; }

private:
    std::string event_id_;
};

struct TraceStoreConfig {
    size_t capacity = 10000;

    // checkpoint() on an unknown id opens an "unknown" trace instead of
    // throwing TraceNotFound.
    bool auto_create_on_unknown_checkpoint = true;

    // start_trace() records a "trace_start" checkpoint carrying the caller's
    // metadata.
    bool record_start_checkpoint = true;

    infra::ClockFn clock = infra::default_clock();
};

struct TraceStoreStats {
    size_t total_traces        = 0;
    size_t completed_traces    = 0;
    size_t max_traces          = 0;
    size_t approx_memory_bytes = 0;
};

// Thread-safe registry of live traces. One mutex guards the map; every read
// returns copies.
class TraceStore {
public:
    explicit TraceStore(TraceStoreConfig cfg = {});

    TraceStore(const TraceStore&) = delete;
    TraceStore& operator=(const TraceStore&) = delete;

    // Evicts the oldest trace first when at capacity. Restarting a live id
    // replaces that trace.
    EventTrace start_trace(const std::string& event_id,
                           const std::string& event_type,
                           Metadata metadata = {});

    void checkpoint(const std::string& event_id,
                    const std::string& name,
                    Metadata metadata = {});

    // Throws TraceNotFound.
    EventTrace complete_trace(const std::string& event_id);

    std::optional<EventTrace> get_trace(const std::string& event_id) const;
    std::vector<EventTrace> get_all_traces() const;

    // Incomplete traces older than timeout seconds.
    std::vector<EventTrace> find_lost_events(double timeout = 5.0) const;

    EventFlow analyze_flow() const;
    TraceStoreStats stats() const;

    size_t size() const;
    void clear();

    const TraceStoreConfig& config() const noexcept { return cfg_; }

private:
    struct Entry {
        EventTrace trace;
        uint64_t   seq = 0;   // insertion order, breaks created_at ties
    };

    EventTrace& start_locked(const std::string& event_id,
                             const std::string& event_type,
                             Metadata metadata);
    void evict_oldest_locked();

    TraceStoreConfig                       cfg_;
    mutable std::mutex                     mtx_;
    std::unordered_map<std::string, Entry> traces_;
    uint64_t                               next_seq_ = 0;
    uint64_t                               evictions_ = 0;
};

} // namespace vigil::trace
