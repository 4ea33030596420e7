// Timeline exporter: Chrome trace events, snapshots, HTML.
#include "TestSupport.hpp"

#include "vigil/timeline/TimelineExporter.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace vigil;
using namespace vigil::test;
using json = nlohmann::json;
using trace::EventTrace;

namespace {

std::string temp_path(const std::string& name) {
    return "/tmp/vigil_test_" + std::to_string(::getpid()) + "_" + name;
}

std::string slurp(const std::string& path) {
    std::ifstream f(path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::vector<EventTrace> sample_traces() {
    EventTrace a;
    a.event_id = "evt_1";
    a.event_type = "click";
    a.created_at = 10.0;
    a.add_checkpoint("frontend_emit", 10.0, {{"x", "1"}}, 101);
    a.add_checkpoint("tauri_receive", 10.003, {}, 102);
    a.add_checkpoint("python_receive", 10.010, {}, 103);
    a.completed = true;

    EventTrace b;
    b.event_id = "evt_2";
    b.event_type = "keypress";
    b.created_at = 11.0;
    b.add_checkpoint("frontend_emit", 11.0, {}, 101);
    b.add_checkpoint("tauri_receive", 11.5, {}, 102);

    EventTrace c;   // no checkpoints
    c.event_id = "evt_3";
    c.event_type = "scroll";
    c.created_at = 12.0;

    return {a, b, c};
}

size_t count_ph(const json& events, const std::string& ph, const std::string& cat = "") {
    size_t n = 0;
    for (const auto& e : events) {
        if (e["ph"] != ph) continue;
        if (!cat.empty() && e["cat"] != cat) continue;
        ++n;
    }
    return n;
}

void test_chrome_event_counts() {
    auto traces = sample_traces();
    json doc = timeline::to_chrome_trace(traces);
    const json& ev = doc["traceEvents"];

    // 5 checkpoints, 3 consecutive pairs, 3 traces.
    expect(count_ph(ev, "i", "metadata") == 3, "one metadata event per trace");
    expect(count_ph(ev, "X") == 3, "one duration event per consecutive pair");
    expect(count_ph(ev, "i") - 3 == 5, "one instant event per checkpoint");
    expect(ev.size() == 3 + 3 + 5, "total event count");
}

void test_chrome_event_fields() {
    auto traces = sample_traces();
    json doc = timeline::to_chrome_trace(traces);

    expect(doc["displayTimeUnit"] == "ms", "display unit");
    expect(doc["otherData"]["trace_count"] == 3, "trace count");
    expect(doc["otherData"]["version"] == timeline::kFormatVersion, "version");

    const json& meta = doc["traceEvents"][0];
    expect(meta["name"] == "click:evt_1", "metadata name");
    expect(meta["s"] == "g" && meta["tid"] == 0 && meta["pid"] == 0, "global instant");
    expect(meta["ts"] == 10000000, "microseconds");
    expect(meta["args"]["completed"] == true, "completed arg");

    const json& dur = doc["traceEvents"][1];
    expect(dur["ph"] == "X" && dur["name"] == "frontend_emit", "first stage");
    expect(dur["cat"] == "click", "category is event type");
    expect(dur["dur"] == 3000 || dur["dur"] == 2999, "gap in microseconds");
    expect(dur["tid"] == 101, "owner thread");
    expect(dur["args"]["x"] == "1", "checkpoint metadata");

    const json& inst = doc["traceEvents"][2];
    expect(inst["name"] == "checkpoint:frontend_emit" && inst["s"] == "t", "checkpoint instant");
}

void test_write_and_reread_chrome() {
    auto traces = sample_traces();
    const std::string path = temp_path("trace.json");
    timeline::write_chrome_trace(traces, path);

    json back = json::parse(slurp(path));
    expect(back["traceEvents"].size() == 11, "event count survives the file");
    std::remove(path.c_str());
}

void test_snapshot_round_trip() {
    auto traces = sample_traces();
    const std::string path = temp_path("snapshot.json");
    timeline::write_trace_snapshot(traces, path);
    auto back = timeline::read_trace_snapshot(path);
    std::remove(path.c_str());

    expect(back.size() == 3, "three traces");
    expect(back[0].event_id == "evt_1" && back[0].completed, "identity and completion");
    expect(back[0].checkpoints.size() == 3, "checkpoints");
    expect(back[0].checkpoints[0].metadata.at("x") == "1", "metadata");
    expect(back[0].checkpoints[1].owner == 102, "owner");
    expect_near(back[1].total_latency, 0.5, 1e-9, "latency");
    expect(back[2].checkpoints.empty(), "empty trace");
}

void test_snapshot_rejects_garbage() {
    expect_throws<std::runtime_error>([]() { timeline::traces_from_json(json(42)); }, "scalar");
    expect_throws<std::runtime_error>([]() { timeline::traces_from_json(json::object()); }, "no traces key");
    expect_throws<std::runtime_error>([]() {
        timeline::traces_from_json(json::parse(R"([{"event_type":"x"}])"));
    }, "missing event_id");
    expect_throws<std::runtime_error>([]() {
        timeline::read_trace_snapshot("/nonexistent/dir/snap.json");
    }, "missing file");

    auto bare = timeline::traces_from_json(json::parse(
        R"([{"event_id":"a","created_at":1.0,"checkpoints":[{"name":"n","timestamp":1.0}]}])"));
    expect(bare.size() == 1 && bare[0].event_type == "unknown", "bare array with defaults");
}

void test_html_embeds_data() {
    auto traces = sample_traces();
    traces[0].checkpoints[0].metadata["note"] = "</script><script>alert(1)</script>";

    std::string html = timeline::render_timeline_html(traces);
    expect(html.find("TRACES_DATA") == std::string::npos, "placeholder replaced");
    expect(html.find("\"evt_1\"") != std::string::npos, "trace ids embedded");
    expect(html.find("thread_id") != std::string::npos, "checkpoint owner embedded");
    expect(html.find("</script><script>alert") == std::string::npos, "script close escaped");
    expect(html.find("<\\/script>") != std::string::npos, "escaped form present");
    expect(html.find("src=\"http") == std::string::npos, "no external scripts");
}

void test_write_failure_throws() {
    auto traces = sample_traces();
    expect_throws<std::runtime_error>([&]() {
        timeline::write_timeline_html(traces, "/nonexistent/dir/out.html");
    }, "unwritable html path");
    expect_throws<std::runtime_error>([&]() {
        timeline::write_chrome_trace(traces, "/nonexistent/dir/out.json");
    }, "unwritable trace path");
}

} // namespace

int main() {
    run_test("chrome event counts", test_chrome_event_counts);
    run_test("chrome event fields", test_chrome_event_fields);
    run_test("write and reread chrome", test_write_and_reread_chrome);
    run_test("snapshot round trip", test_snapshot_round_trip);
    run_test("snapshot rejects garbage", test_snapshot_rejects_garbage);
    run_test("html embeds data", test_html_embeds_data);
    run_test("write failure throws", test_write_failure_throws);
    return finish("timeline_exporter");
}
