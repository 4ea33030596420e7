#include "vigil/trace/LatencyAnalyzer.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace vigil::trace {

namespace {

// Samples per stage, keyed by stage name.
std::map<std::string, std::vector<double>> collect_stage_samples(const std::vector<EventTrace>& traces) {
    std::map<std::string, std::vector<double>> samples;
    for (const auto& t : traces) {
        for (const auto& s : t.stage_latencies())
            samples[s.first].push_back(s.second);
    }
    return samples;
}

double mean_of(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

const std::string kRule(60, '=');

} // namespace

double nearest_rank(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0.0;
    const size_t n = sorted.size();
    double raw = std::floor(static_cast<double>(n) * p);
    size_t idx = raw <= 0.0 ? 0 : static_cast<size_t>(raw);
    if (idx > n - 1) idx = n - 1;
    return sorted[idx];
}

StageStatsMap analyze_latencies(const std::vector<EventTrace>& traces) {
    StageStatsMap out;
    for (auto& kv : collect_stage_samples(traces)) {
        std::vector<double>& v = kv.second;
        if (v.empty()) continue;

        StageStats st;
        st.count = v.size();
        st.mean = mean_of(v);
        std::sort(v.begin(), v.end());
        st.p50 = nearest_rank(v, 0.50);
        st.p95 = nearest_rank(v, 0.95);
        st.p99 = nearest_rank(v, 0.99);
        st.min = v.front();
        st.max = v.back();
        out.emplace(kv.first, st);
    }
    return out;
}

std::string find_bottleneck(const std::vector<EventTrace>& traces) {
    StageStatsMap stats = analyze_latencies(traces);
    if (stats.empty()) return kNoBottleneck;

    auto it = std::max_element(stats.begin(), stats.end(),
        [](const auto& a, const auto& b) { return a.second.mean < b.second.mean; });
    return it->first;
}

std::vector<Anomaly> detect_anomalies(const std::vector<EventTrace>& traces, double threshold) {
    std::vector<Anomaly> out;
    StageStatsMap stats = analyze_latencies(traces);
    if (stats.empty()) return out;

    for (const auto& t : traces) {
        for (const auto& s : t.stage_latencies()) {
            auto it = stats.find(s.first);
            if (it == stats.end()) continue;

            const double avg = it->second.mean;
            if (s.second > avg * threshold) {
                Anomaly a;
                a.event_id = t.event_id;
                a.trace = t;
                a.stage = s.first;
                a.latency = s.second;
                a.factor = avg > 0.0 ? s.second / avg : 0.0;
                out.push_back(std::move(a));
                break;
            }
        }
    }
    return out;
}

std::map<double, double> calculate_throughput(const std::vector<EventTrace>& traces, double window) {
    if (!(window > 0.0))
        throw std::invalid_argument("throughput window must be > 0");

    std::map<double, double> out;
    if (traces.empty()) return out;

    auto [lo, hi] = std::minmax_element(traces.begin(), traces.end(),
        [](const EventTrace& a, const EventTrace& b) { return a.created_at < b.created_at; });
    const double min_t = lo->created_at;
    const double max_t = hi->created_at;

    // Integer window index avoids accumulating float error in the start times.
    for (size_t i = 0;; ++i) {
        const double start = min_t + static_cast<double>(i) * window;
        if (start > max_t) break;
        const double end = start + window;

        size_t count = 0;
        for (const auto& t : traces) {
            if (t.created_at >= start && t.created_at < end) ++count;
        }
        out[start] = static_cast<double>(count) / window;
    }
    return out;
}

std::map<std::string, StageComparison> compare_traces(const EventTrace& a, const EventTrace& b) {
    std::map<std::string, StageComparison> out;
    const auto la = a.stage_latencies();
    const auto lb = b.stage_latencies();

    for (const auto& sa : la) {
        for (const auto& sb : lb) {
            if (sa.first != sb.first) continue;
            StageComparison c;
            c.a_latency = sa.second;
            c.b_latency = sb.second;
            c.diff = sb.second - sa.second;
            c.diff_pct = sa.second > 0.0 ? c.diff / sa.second * 100.0 : 0.0;
            out.emplace(sa.first, c);
            break;
        }
    }
    return out;
}

std::string generate_latency_report(const std::vector<EventTrace>& traces, double threshold) {
    if (traces.empty()) return "No traces to analyze.";

    const StageStatsMap stats = analyze_latencies(traces);
    const std::string bottleneck = find_bottleneck(traces);
    const std::vector<Anomaly> anomalies = detect_anomalies(traces, threshold);
    const size_t completed = static_cast<size_t>(std::count_if(traces.begin(), traces.end(),
        [](const EventTrace& t) { return t.completed; }));

    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    os << kRule << "\n"
       << "LATENCY ANALYSIS REPORT\n"
       << kRule << "\n\n"
       << "Total Events: " << traces.size() << "\n"
       << "Completed Events: " << completed << "\n"
       << "Bottleneck Stage: " << bottleneck << "\n"
       << "Anomalies Detected: " << anomalies.size() << "\n\n"
       << kRule << "\n"
       << "STAGE LATENCIES\n"
       << kRule << "\n";

    std::vector<std::pair<std::string, StageStats>> sorted(stats.begin(), stats.end());
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const auto& a, const auto& b) { return a.second.mean > b.second.mean; });

    for (const auto& kv : sorted) {
        const StageStats& s = kv.second;
        os << "\n" << kv.first << "\n"
           << std::string(60, '-') << "\n"
           << "  Count:  " << s.count << "\n"
           << "  Mean:   " << s.mean * 1000.0 << "ms\n"
           << "  P50:    " << s.p50 * 1000.0 << "ms\n"
           << "  P95:    " << s.p95 * 1000.0 << "ms\n"
           << "  P99:    " << s.p99 * 1000.0 << "ms\n"
           << "  Min:    " << s.min * 1000.0 << "ms\n"
           << "  Max:    " << s.max * 1000.0 << "ms\n";
    }

    if (!anomalies.empty()) {
        os << "\n" << kRule << "\n"
           << "ANOMALIES\n"
           << kRule << "\n\n";

        const size_t shown = std::min<size_t>(anomalies.size(), 10);
        for (size_t i = 0; i < shown; ++i) {
            const Anomaly& a = anomalies[i];
            os << "  " << a.event_id << ": " << a.stage << "\n"
               << "    Latency: " << a.latency * 1000.0 << "ms ("
               << std::setprecision(1) << a.factor << "x average)\n"
               << std::setprecision(2);
        }
        if (anomalies.size() > 10)
            os << "  ... and " << (anomalies.size() - 10) << " more\n";
    }

    os << "\n" << kRule;
    return os.str();
}

EventFlow analyze_flow(const std::vector<EventTrace>& traces) {
    EventFlow flow;
    if (traces.empty()) return flow;

    flow.total_events = traces.size();
    flow.completed_events = static_cast<size_t>(std::count_if(traces.begin(), traces.end(),
        [](const EventTrace& t) { return t.completed; }));
    flow.lost_events = flow.total_events - flow.completed_events;

    std::vector<double> totals;
    totals.reserve(traces.size());
    for (const auto& t : traces) {
        if (t.total_latency > 0.0) totals.push_back(t.total_latency);
    }
    if (!totals.empty()) {
        flow.avg_latency = mean_of(totals);
        std::sort(totals.begin(), totals.end());
        flow.p95_latency = nearest_rank(totals, 0.95);
        flow.p99_latency = nearest_rank(totals, 0.99);
    }

    double worst = -1.0;
    for (const auto& kv : collect_stage_samples(traces)) {
        const double m = mean_of(kv.second);
        flow.stage_latencies[kv.first] = m;
        if (m > worst) {
            worst = m;
            flow.bottleneck_stage = kv.first;
        }
    }
    return flow;
}

} // namespace vigil::trace
