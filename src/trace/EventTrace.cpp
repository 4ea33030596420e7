#include "vigil/trace/EventTrace.hpp"

#include <sys/syscall.h>
#include <unistd.h>

#include <stdexcept>

namespace vigil::trace {

uint64_t current_owner() noexcept {
    thread_local const uint64_t tid = static_cast<uint64_t>(::syscall(SYS_gettid));
    return tid;
}

std::string stage_name(const std::string& from, const std::string& to) {
    return from + " -> " + to;
}

void EventTrace::add_checkpoint(const std::string& name,
                                double timestamp,
                                Metadata metadata,
                                uint64_t owner) {
    Checkpoint cp;
    cp.name = name;
    cp.timestamp = timestamp;
    cp.metadata = std::move(metadata);
    cp.owner = owner;
    checkpoints.push_back(std::move(cp));

    if (checkpoints.size() > 1) {
        double lat = timestamp - checkpoints.front().timestamp;
        total_latency = lat > 0.0 ? lat : 0.0;
    }
}

double EventTrace::latency_between(const std::string& from, const std::string& to) const {
    long from_idx = -1;
    long to_idx = -1;
    for (size_t i = 0; i < checkpoints.size(); ++i) {
        if (checkpoints[i].name == from) from_idx = static_cast<long>(i);
        if (checkpoints[i].name == to)   to_idx = static_cast<long>(i);
    }

    if (from_idx < 0)
        throw std::invalid_argument("checkpoint not found: " + from);
    if (to_idx < 0)
        throw std::invalid_argument("checkpoint not found: " + to);
    if (to_idx <= from_idx)
        throw std::invalid_argument("checkpoint '" + to + "' does not follow '" + from + "'");

    return checkpoints[to_idx].timestamp - checkpoints[from_idx].timestamp;
}

std::vector<StageLatency> EventTrace::stage_latencies() const {
    std::vector<StageLatency> out;
    if (checkpoints.size() < 2) return out;
    out.reserve(checkpoints.size() - 1);

    for (size_t i = 0; i + 1 < checkpoints.size(); ++i) {
        std::string stage = stage_name(checkpoints[i].name, checkpoints[i + 1].name);
        double lat = checkpoints[i + 1].timestamp - checkpoints[i].timestamp;

        bool seen = false;
        for (auto& s : out) {
            if (s.first == stage) {
                s.second = lat;
                seen = true;
                break;
            }
        }
        if (!seen) out.emplace_back(std::move(stage), lat);
    }
    return out;
}

} // namespace vigil::trace
