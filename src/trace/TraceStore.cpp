#include "vigil/trace/TraceStore.hpp"

#include <algorithm>
#include <iostream>

namespace vigil::trace {

namespace {

size_t approx_bytes(const EventTrace& t) {
    size_t n = sizeof(EventTrace) + t.event_id.capacity() + t.event_type.capacity();
    for (const auto& cp : t.checkpoints) {
        n += sizeof(Checkpoint) + cp.name.capacity();
        for (const auto& kv : cp.metadata)
            n += kv.first.capacity() + kv.second.capacity() + 64;   // node overhead
    }
    return n;
}

} // namespace

TraceStore::TraceStore(TraceStoreConfig cfg)
    : cfg_(std::move(cfg)) {
    if (cfg_.capacity == 0)
        throw std::invalid_argument("TraceStore capacity must be > 0");
    if (!cfg_.clock)
        cfg_.clock = infra::default_clock();
}

EventTrace TraceStore::start_trace(const std::string& event_id,
                                   const std::string& event_type,
                                   Metadata metadata) {
    std::lock_guard<std::mutex> lk(mtx_);
    return start_locked(event_id, event_type, std::move(metadata));
}

EventTrace& TraceStore::start_locked(const std::string& event_id,
                                     const std::string& event_type,
                                     Metadata metadata) {
    if (traces_.find(event_id) == traces_.end() && traces_.size() >= cfg_.capacity)
        evict_oldest_locked();

    const double t = cfg_.clock();

    Entry e;
    e.seq = next_seq_++;
    e.trace.event_id = event_id;
    e.trace.event_type = event_type;
    e.trace.created_at = t;
    if (cfg_.record_start_checkpoint)
        e.trace.add_checkpoint("trace_start", t, std::move(metadata));

    Entry& slot = traces_[event_id];
    slot = std::move(e);
    return slot.trace;
}

void TraceStore::evict_oldest_locked() {
    auto oldest = traces_.end();
    for (auto it = traces_.begin(); it != traces_.end(); ++it) {
        if (oldest == traces_.end()
            || it->second.trace.created_at < oldest->second.trace.created_at
            || (it->second.trace.created_at == oldest->second.trace.created_at
                && it->second.seq < oldest->second.seq)) {
            oldest = it;
        }
    }
    if (oldest == traces_.end()) return;

    // First eviction and every 1000th after it, so a saturated store does
    // not flood the log.
    if (evictions_ % 1000 == 0) {
        std::cout << "[TRACE_STORE] evicted " << oldest->first
                  << " (capacity " << cfg_.capacity << ", "
                  << (evictions_ + 1) << " evictions)" << std::endl;
    }
    ++evictions_;
    traces_.erase(oldest);
}

void TraceStore::checkpoint(const std::string& event_id,
                            const std::string& name,
                            Metadata metadata) {
    std::lock_guard<std::mutex> lk(mtx_);

    auto it = traces_.find(event_id);
    EventTrace* trace = nullptr;
    if (it == traces_.end()) {
        if (!cfg_.auto_create_on_unknown_checkpoint)
            throw TraceNotFound(event_id);
        std::cout << "[TRACE_STORE] checkpoint '" << name
                  << "' for unknown id " << event_id << ", opening trace" << std::endl;
        trace = &start_locked(event_id, "unknown", {});
    } else {
        trace = &it->second.trace;
    }

    trace->add_checkpoint(name, cfg_.clock(), std::move(metadata));
}

EventTrace TraceStore::complete_trace(const std::string& event_id) {
    std::lock_guard<std::mutex> lk(mtx_);

    auto it = traces_.find(event_id);
    if (it == traces_.end())
        throw TraceNotFound(event_id);

    EventTrace& t = it->second.trace;
    if (t.completed) return t;

    t.completed = true;
    if (!t.checkpoints.empty()) {
        const double lat = cfg_.clock() - t.checkpoints.front().timestamp;
        t.total_latency = lat > 0.0 ? lat : 0.0;
    }
    return t;
}

std::optional<EventTrace> TraceStore::get_trace(const std::string& event_id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = traces_.find(event_id);
    if (it == traces_.end()) return std::nullopt;
    return it->second.trace;
}

std::vector<EventTrace> TraceStore::get_all_traces() const {
    std::vector<const Entry*> entries;
    std::vector<EventTrace> out;

    std::lock_guard<std::mutex> lk(mtx_);
    entries.reserve(traces_.size());
    for (const auto& kv : traces_) entries.push_back(&kv.second);
    std::sort(entries.begin(), entries.end(),
        [](const Entry* a, const Entry* b) { return a->seq < b->seq; });

    out.reserve(entries.size());
    for (const Entry* e : entries) out.push_back(e->trace);
    return out;
}

std::vector<EventTrace> TraceStore::find_lost_events(double timeout) const {
    std::vector<EventTrace> out;
    for (auto& t : get_all_traces()) {
        if (t.completed) continue;
        if (cfg_.clock() - t.created_at > timeout) out.push_back(std::move(t));
    }
    return out;
}

EventFlow TraceStore::analyze_flow() const {
    return trace::analyze_flow(get_all_traces());
}

TraceStoreStats TraceStore::stats() const {
    TraceStoreStats s;
    s.max_traces = cfg_.capacity;

    std::lock_guard<std::mutex> lk(mtx_);
    s.total_traces = traces_.size();
    for (const auto& kv : traces_) {
        if (kv.second.trace.completed) ++s.completed_traces;
        s.approx_memory_bytes += approx_bytes(kv.second.trace);
    }
    return s;
}

size_t TraceStore::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return traces_.size();
}

void TraceStore::clear() {
    std::lock_guard<std::mutex> lk(mtx_);
    traces_.clear();
}

} // namespace vigil::trace
