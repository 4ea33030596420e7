#include "vigil/config/Config.hpp"
#include "vigil/infra/Clock.hpp"
#include "vigil/timeline/TimelineExporter.hpp"
#include "vigil/trace/LatencyAnalyzer.hpp"
#include "vigil/trace/TraceStore.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace vigil;

namespace {

void usage(const char* argv0) {
    std::cerr
        << "usage:\n"
        << "  " << argv0 << " demo [--events N] [--seed S] [--snapshot f] [--timeline f] [--html f]\n"
        << "  " << argv0 << " report <snapshot.json> [--threshold x]\n"
        << "  " << argv0 << " lost <snapshot.json> [--timeout s] [--config f]\n"
        << "  " << argv0 << " export <snapshot.json> [--timeline f] [--html f]\n";
}

struct Args {
    std::string command;
    std::string input;
    size_t      events = 100;
    unsigned    seed = 42;
    double      threshold = 2.0;
    double      timeout = -1.0;
    std::string config_path;
    std::string snapshot_out;
    std::string timeline_out;
    std::string html_out;
};

double parse_double(const char* flag, const char* v) {
    char* end = nullptr;
    double d = std::strtod(v, &end);
    if (end == v || *end != '\0')
        throw std::invalid_argument(std::string(flag) + ": not a number: " + v);
    return d;
}

unsigned long parse_count(const char* flag, const char* v) {
    char* end = nullptr;
    unsigned long n = std::strtoul(v, &end, 10);
    if (end == v || *end != '\0' || v[0] == '-')
        throw std::invalid_argument(std::string(flag) + ": not a count: " + v);
    return n;
}

bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 2) return false;
    a.command = argv[1];

    int i = 2;
    if (a.command != "demo") {
        if (argc < 3 || argv[2][0] == '-') return false;
        a.input = argv[2];
        i = 3;
    }

    for (; i < argc; ++i) {
        const char* f = argv[i];
        const bool has_value = i + 1 < argc;
        if (!has_value) return false;
        const char* v = argv[++i];

        if      (std::strcmp(f, "--events") == 0)    a.events = parse_count(f, v);
        else if (std::strcmp(f, "--seed") == 0)      a.seed = static_cast<unsigned>(parse_count(f, v));
        else if (std::strcmp(f, "--threshold") == 0) a.threshold = parse_double(f, v);
        else if (std::strcmp(f, "--timeout") == 0)   a.timeout = parse_double(f, v);
        else if (std::strcmp(f, "--config") == 0)    a.config_path = v;
        else if (std::strcmp(f, "--snapshot") == 0)  a.snapshot_out = v;
        else if (std::strcmp(f, "--timeline") == 0)  a.timeline_out = v;
        else if (std::strcmp(f, "--html") == 0)      a.html_out = v;
        else return false;
    }
    return true;
}

void print_flow(const trace::EventFlow& flow) {
    std::cout << std::fixed << std::setprecision(2)
              << "Total events:     " << flow.total_events << "\n"
              << "Completed events: " << flow.completed_events << "\n"
              << "Lost events:      " << flow.lost_events << "\n"
              << "Avg latency:      " << flow.avg_latency * 1000.0 << "ms\n"
              << "P95 latency:      " << flow.p95_latency * 1000.0 << "ms\n"
              << "P99 latency:      " << flow.p99_latency * 1000.0 << "ms\n"
              << "Bottleneck:       " << flow.bottleneck_stage << "\n";

    std::vector<std::pair<std::string, double>> stages(flow.stage_latencies.begin(),
                                                       flow.stage_latencies.end());
    std::stable_sort(stages.begin(), stages.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });

    std::cout << "\nTop stages:\n";
    for (size_t i = 0; i < stages.size() && i < 5; ++i) {
        std::cout << "  " << (i + 1) << ". " << std::left << std::setw(40) << stages[i].first
                  << std::right << std::setw(10) << stages[i].second * 1000.0 << "ms\n";
    }
}

void write_outputs(const std::vector<trace::EventTrace>& traces, const Args& a) {
    if (!a.snapshot_out.empty()) timeline::write_trace_snapshot(traces, a.snapshot_out);
    if (!a.timeline_out.empty()) timeline::write_chrome_trace(traces, a.timeline_out);
    if (!a.html_out.empty())     timeline::write_timeline_html(traces, a.html_out);
}

// Simulated frontend -> executor path with synthetic, reproducible timing.
int cmd_demo(const Args& a) {
    struct Stage { const char* name; double lo; double hi; };
    static const Stage kPath[] = {
        {"frontend_emit",     0.0000, 0.0000},
        {"tauri_receive",     0.0010, 0.0040},
        {"python_receive",    0.0020, 0.0090},
        {"executor_start",    0.0005, 0.0020},
        {"executor_complete", 0.0100, 0.0500},
    };
    static const char* kTypes[] = {"click", "keypress", "scroll"};

    infra::ManualClock clock(infra::wall_seconds());
    trace::TraceStoreConfig tcfg;
    tcfg.clock = clock.fn();
    tcfg.capacity = std::max<size_t>(a.events, 1);
    trace::TraceStore store(tcfg);

    std::mt19937 rng(a.seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    const double base = clock.now();

    for (size_t i = 0; i < a.events; ++i) {
        const std::string id = "evt_" + std::to_string(i + 1);
        clock.set(base + static_cast<double>(i) * 0.020);

        store.start_trace(id, kTypes[i % 3], {{"seq", std::to_string(i + 1)}});
        for (const Stage& s : kPath) {
            clock.advance(s.lo + (s.hi - s.lo) * unit(rng));
            store.checkpoint(id, s.name);
        }
        if (unit(rng) < 0.9) store.complete_trace(id);
    }

    std::cout << "[VIGIL] simulated " << a.events << " events\n\n";
    print_flow(store.analyze_flow());

    write_outputs(store.get_all_traces(), a);
    return 0;
}

int cmd_report(const Args& a) {
    auto traces = timeline::read_trace_snapshot(a.input);
    std::cout << trace::generate_latency_report(traces, a.threshold) << std::endl;
    return 0;
}

int cmd_lost(const Args& a) {
    double timeout = a.timeout;
    if (timeout < 0.0) timeout = config::load_config(a.config_path).lost_event_timeout;

    auto traces = timeline::read_trace_snapshot(a.input);

    // A snapshot is judged at its own capture time: the latest instant it
    // records.
    double captured = 0.0;
    for (const auto& t : traces) {
        captured = std::max(captured, t.created_at);
        for (const auto& cp : t.checkpoints) captured = std::max(captured, cp.timestamp);
    }

    size_t n = 0;
    std::cout << std::fixed << std::setprecision(3);
    for (const auto& t : traces) {
        if (t.completed) continue;
        const double age = captured - t.created_at;
        if (age <= timeout) continue;
        ++n;
        std::cout << "  " << t.event_id << " (" << t.event_type << ") age " << age << "s, last checkpoint "
                  << (t.checkpoints.empty() ? std::string("-") : t.checkpoints.back().name) << "\n";
    }
    std::cout << "[VIGIL] " << n << " lost events (timeout " << timeout << "s)" << std::endl;
    return n == 0 ? 0 : 3;
}

int cmd_export(const Args& a) {
    if (a.timeline_out.empty() && a.html_out.empty()) {
        std::cerr << "[VIGIL] export needs --timeline and/or --html" << std::endl;
        return 2;
    }
    write_outputs(timeline::read_trace_snapshot(a.input), a);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    try {
        if (!parse_args(argc, argv, a)) {
            usage(argv[0]);
            return 2;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "[VIGIL] " << e.what() << std::endl;
        return 2;
    }

    try {
        if (a.command == "demo")   return cmd_demo(a);
        if (a.command == "report") return cmd_report(a);
        if (a.command == "lost")   return cmd_lost(a);
        if (a.command == "export") return cmd_export(a);
    } catch (const config::ConfigError& e) {
        std::cerr << "[VIGIL] config error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[VIGIL] " << e.what() << std::endl;
        return 1;
    }

    usage(argv[0]);
    return 2;
}
