#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace vigil::trace {

using Metadata = std::map<std::string, std::string>;

// Kernel thread id of the caller. Diagnostic only.
uint64_t current_owner() noexcept;

struct Checkpoint {
    std::string name;
    double      timestamp = 0.0;   // wall seconds
    Metadata    metadata;
    uint64_t    owner = 0;
};

using StageLatency = std::pair<std::string, double>;

// "<from> -> <to>"
std::string stage_name(const std::string& from, const std::string& to);

struct EventTrace {
    std::string             event_id;
    std::string             event_type;
    double                  created_at = 0.0;
    std::vector<Checkpoint> checkpoints;
    bool                    completed = false;
    double                  total_latency = 0.0;

    // Appends in call order. total_latency tracks last - first once two
    // checkpoints exist.
    void add_checkpoint(const std::string& name,
                        double timestamp,
                        Metadata metadata = {},
                        uint64_t owner = current_owner());

    // Gap between the last occurrences of two checkpoints.
    // Throws std::invalid_argument if either is missing or out of order.
    double latency_between(const std::string& from, const std::string& to) const;

    // Consecutive-pair latencies in first-seen order. A stage that repeats
    // within one trace keeps its position and its latest value.
    std::vector<StageLatency> stage_latencies() const;
};

} // namespace vigil::trace
