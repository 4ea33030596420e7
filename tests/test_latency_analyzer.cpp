// Latency analyzer: statistics, bottleneck, anomalies, throughput, report.
#include "TestSupport.hpp"

#include "vigil/infra/Clock.hpp"
#include "vigil/trace/LatencyAnalyzer.hpp"
#include "vigil/trace/TraceStore.hpp"

#include <string>
#include <vector>

using namespace vigil;
using namespace vigil::test;
using trace::EventTrace;

namespace {

// Two-checkpoint trace "a" -> "b" with the given gap.
EventTrace two_point(const std::string& id, double start, double gap) {
    EventTrace t;
    t.event_id = id;
    t.event_type = "click";
    t.created_at = start;
    t.add_checkpoint("a", start, {}, 1);
    t.add_checkpoint("b", start + gap, {}, 1);
    return t;
}

void test_percentiles_one_to_ten() {
    std::vector<EventTrace> traces;
    for (int i = 1; i <= 10; ++i)
        traces.push_back(two_point("e" + std::to_string(i), 100.0, i / 1000.0));

    auto stats = trace::analyze_latencies(traces);
    expect(stats.size() == 1, "one stage");
    const auto& s = stats.at("a -> b");
    expect(s.count == 10, "ten samples");
    expect_near(s.p50, 0.006, 1e-9, "p50 is the 6th value");
    expect_near(s.min, 0.001, 1e-9, "min");
    expect_near(s.max, 0.010, 1e-9, "max");
    expect_near(s.p95, 0.010, 1e-9, "p95 clamps to last");
    expect_near(s.p99, 0.010, 1e-9, "p99 clamps to last");
    expect_near(s.mean, 0.0055, 1e-9, "mean");
}

void test_single_sample_percentiles() {
    std::vector<EventTrace> traces{two_point("only", 0.0, 0.25)};
    const auto& s = trace::analyze_latencies(traces).at("a -> b");
    expect(s.p50 == 0.25 && s.p95 == 0.25 && s.p99 == 0.25, "single sample everywhere");
    expect(s.min == 0.25 && s.max == 0.25, "min/max");
}

void test_nearest_rank_edges() {
    expect(trace::nearest_rank({}, 0.5) == 0.0, "empty set");
    std::vector<double> v{1, 2, 3, 4};
    expect(trace::nearest_rank(v, 0.0) == 1, "p0 is first");
    expect(trace::nearest_rank(v, 1.0) == 4, "p100 clamps");
    expect(trace::nearest_rank(v, 0.5) == 3, "floor(4*0.5)=2");
}

void test_end_to_end_flow() {
    infra::ManualClock clock(0.0);
    trace::TraceStoreConfig cfg;
    cfg.clock = clock.fn();
    trace::TraceStore store(cfg);

    store.start_trace("evt_1", "click");
    store.checkpoint("evt_1", "frontend_emit");
    clock.set(0.003);
    store.checkpoint("evt_1", "tauri_receive");
    clock.set(0.010);
    store.checkpoint("evt_1", "python_receive");
    store.complete_trace("evt_1");

    trace::EventFlow flow = trace::analyze_flow(store.get_all_traces());
    expect(flow.total_events == 1, "total");
    expect(flow.completed_events == 1, "completed");
    expect(flow.lost_events == 0, "lost");
    expect_near(flow.avg_latency, 0.010, 1e-9, "avg latency");
    expect(flow.bottleneck_stage == "tauri_receive -> python_receive", "bottleneck is the 7ms gap");
    expect_near(flow.stage_latencies.at("frontend_emit -> tauri_receive"), 0.003, 1e-9, "stage mean");

    auto via_store = store.analyze_flow();
    expect(via_store.bottleneck_stage == flow.bottleneck_stage, "store convenience agrees");
}

void test_flow_counts_lost_and_skips_zero_latency() {
    std::vector<EventTrace> traces;
    auto done = two_point("done", 0.0, 0.2);
    done.completed = true;
    traces.push_back(done);
    traces.push_back(two_point("open", 0.0, 0.4));
    EventTrace empty;
    empty.event_id = "empty";
    traces.push_back(empty);

    auto flow = trace::analyze_flow(traces);
    expect(flow.total_events == 3, "total");
    expect(flow.completed_events == 1, "completed");
    expect(flow.lost_events == 2, "lost = total - completed");
    expect_near(flow.avg_latency, 0.3, 1e-9, "zero-latency trace excluded from average");
    expect_near(flow.p95_latency, 0.4, 1e-9, "p95");
}

void test_empty_inputs() {
    std::vector<EventTrace> none;
    expect(trace::find_bottleneck(none) == "N/A", "no bottleneck");
    expect(trace::analyze_flow(none).bottleneck_stage == "N/A", "flow sentinel");
    expect(trace::detect_anomalies(none).empty(), "no anomalies");
    expect(trace::calculate_throughput(none).empty(), "no throughput windows");
    expect(trace::generate_latency_report(none) == "No traces to analyze.", "empty report");
}

void test_anomalies_flag_once_per_trace() {
    std::vector<EventTrace> traces;
    for (int i = 0; i < 4; ++i) traces.push_back(two_point("fast" + std::to_string(i), 0.0, 0.001));

    EventTrace slow;
    slow.event_id = "slow";
    slow.add_checkpoint("a", 0.0, {}, 1);
    slow.add_checkpoint("b", 0.010, {}, 1);
    slow.add_checkpoint("c", 0.020, {}, 1);
    traces.push_back(slow);

    auto found = trace::detect_anomalies(traces, 2.0);
    expect(found.size() == 1, "one anomalous trace");
    expect(found[0].event_id == "slow", "slow flagged");
    expect(found[0].stage == "a -> b", "first offending stage only");
    expect_near(found[0].factor, 0.010 / 0.0028, 1e-6, "factor vs stage mean");

    expect(trace::detect_anomalies(traces, 10.0).empty(), "higher threshold clears it");
}

void test_throughput_windows() {
    std::vector<EventTrace> traces{
        two_point("a", 0.0, 0.1),
        two_point("b", 0.5, 0.1),
        two_point("c", 1.2, 0.1),
        two_point("d", 2.9, 0.1),
    };

    auto tp = trace::calculate_throughput(traces, 1.0);
    expect(tp.size() == 3, "three windows");
    expect(tp.at(0.0) == 2.0, "first window");
    expect(tp.at(1.0) == 1.0, "second window");
    expect(tp.at(2.0) == 1.0, "third window");

    auto half = trace::calculate_throughput(traces, 2.0);
    expect(half.at(0.0) == 1.5, "normalized by window size");

    expect_throws<std::invalid_argument>([&]() { trace::calculate_throughput(traces, 0.0); },
                                         "zero window rejected");
}

void test_compare_traces() {
    auto a = two_point("a", 0.0, 0.002);
    auto b = two_point("b", 0.0, 0.003);
    b.add_checkpoint("c", 0.010, {}, 1);

    auto cmp = trace::compare_traces(a, b);
    expect(cmp.size() == 1, "only shared stages");
    const auto& c = cmp.at("a -> b");
    expect_near(c.diff, 0.001, 1e-12, "diff = b - a");
    expect_near(c.diff_pct, 50.0, 1e-9, "diff_pct");

    auto z = two_point("z", 0.0, 0.0);
    expect(trace::compare_traces(z, b).at("a -> b").diff_pct == 0.0, "zero baseline gives 0%");
}

void test_report_layout() {
    std::vector<EventTrace> traces;
    for (int i = 0; i < 100; ++i) traces.push_back(two_point("f" + std::to_string(i), 0.0, 0.001));
    for (int i = 0; i < 12; ++i) traces.push_back(two_point("s" + std::to_string(i), 0.0, 0.010));
    traces[0].completed = true;

    std::string r = trace::generate_latency_report(traces);
    expect(r.find("LATENCY ANALYSIS REPORT") != std::string::npos, "title");
    expect(r.find("Total Events: 112") != std::string::npos, "total line");
    expect(r.find("Completed Events: 1") != std::string::npos, "completed line");
    expect(r.find("Bottleneck Stage: a -> b") != std::string::npos, "bottleneck line");
    expect(r.find("Anomalies Detected: 12") != std::string::npos, "anomaly count");
    expect(r.find("Max:    10.00ms") != std::string::npos, "ms with two decimals");
    expect(r.find("... and 2 more") != std::string::npos, "anomaly list capped at 10");
    expect(r.find("x average)") != std::string::npos, "factor shown");
}

void test_report_orders_stages_by_mean() {
    EventTrace t;
    t.event_id = "e";
    t.add_checkpoint("x", 0.0, {}, 1);
    t.add_checkpoint("y", 0.001, {}, 1);
    t.add_checkpoint("z", 0.011, {}, 1);

    std::string r = trace::generate_latency_report({t});
    auto slow = r.find("\ny -> z\n");
    auto fast = r.find("\nx -> y\n");
    expect(slow != std::string::npos && fast != std::string::npos, "both stages listed");
    expect(slow < fast, "slowest stage first");
}

} // namespace

int main() {
    run_test("percentiles one to ten", test_percentiles_one_to_ten);
    run_test("single sample percentiles", test_single_sample_percentiles);
    run_test("nearest rank edges", test_nearest_rank_edges);
    run_test("end to end flow", test_end_to_end_flow);
    run_test("flow counts lost and skips zero latency", test_flow_counts_lost_and_skips_zero_latency);
    run_test("empty inputs", test_empty_inputs);
    run_test("anomalies flag once per trace", test_anomalies_flag_once_per_trace);
    run_test("throughput windows", test_throughput_windows);
    run_test("compare traces", test_compare_traces);
    run_test("report layout", test_report_layout);
    run_test("report orders stages by mean", test_report_orders_stages_by_mean);
    return finish("latency_analyzer");
}
