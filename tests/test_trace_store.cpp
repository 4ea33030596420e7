// Trace store: registration, eviction, checkpoint policy, completion.
#include "TestSupport.hpp"

#include "vigil/infra/Clock.hpp"
#include "vigil/trace/TraceStore.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace vigil;
using namespace vigil::test;

namespace {

trace::TraceStoreConfig manual_config(infra::ManualClock& clock, size_t capacity = 10000) {
    trace::TraceStoreConfig cfg;
    cfg.capacity = capacity;
    cfg.clock = clock.fn();
    return cfg;
}

void test_distinct_ids_retrievable() {
    infra::ManualClock clock(100.0);
    trace::TraceStore store(manual_config(clock, 64));

    for (int i = 0; i < 50; ++i) {
        clock.advance(0.001);
        store.start_trace("evt_" + std::to_string(i), "click");
    }
    expect(store.size() == 50, "50 traces stored");
    for (int i = 0; i < 50; ++i) {
        auto t = store.get_trace("evt_" + std::to_string(i));
        expect(t.has_value(), "evt_" + std::to_string(i) + " retrievable");
        expect(t->event_type == "click", "event type kept");
    }
    expect(!store.get_trace("evt_50").has_value(), "unknown id absent");
}

void test_eviction_removes_oldest() {
    infra::ManualClock clock(10.0);
    trace::TraceStore store(manual_config(clock, 3));

    clock.set(10.0); store.start_trace("b", "t");
    clock.set(5.0);  store.start_trace("a", "t");   // oldest created_at, not first inserted
    clock.set(20.0); store.start_trace("c", "t");
    clock.set(30.0); store.start_trace("d", "t");

    expect(store.size() == 3, "capacity is a hard cap");
    expect(!store.get_trace("a").has_value(), "smallest created_at evicted");
    expect(store.get_trace("b").has_value(), "b kept");
    expect(store.get_trace("c").has_value(), "c kept");
    expect(store.get_trace("d").has_value(), "d kept");
}

void test_evicted_id_can_be_reused() {
    infra::ManualClock clock(1.0);
    trace::TraceStore store(manual_config(clock, 1));

    store.start_trace("x", "first");
    clock.advance(1.0);
    store.start_trace("y", "second");
    expect(!store.get_trace("x").has_value(), "x evicted");

    clock.advance(1.0);
    store.start_trace("x", "third");
    auto t = store.get_trace("x");
    expect(t.has_value() && t->event_type == "third", "evicted id reused");
    expect(store.size() == 1, "still at capacity 1");
}

void test_start_checkpoint_and_created_at() {
    infra::ManualClock clock(42.0);
    trace::TraceStore store(manual_config(clock));

    auto t = store.start_trace("e", "click", {{"button", "left"}});
    expect(t.created_at == 42.0, "created_at from clock");
    expect(t.checkpoints.size() == 1, "trace_start recorded");
    expect(t.checkpoints[0].name == "trace_start", "start checkpoint name");
    expect(t.checkpoints[0].metadata.at("button") == "left", "start metadata carried");
    expect(t.total_latency == 0.0, "no latency with one checkpoint");

    trace::TraceStoreConfig cfg = manual_config(clock);
    cfg.record_start_checkpoint = false;
    trace::TraceStore bare(cfg);
    auto b = bare.start_trace("e", "click");
    expect(b.checkpoints.empty(), "no start checkpoint when disabled");
}

void test_latency_equals_last_minus_first() {
    infra::ManualClock clock(0.0);
    trace::TraceStoreConfig cfg = manual_config(clock);
    cfg.record_start_checkpoint = false;
    trace::TraceStore store(cfg);

    store.start_trace("evt_1", "click");
    store.checkpoint("evt_1", "frontend_emit");
    clock.set(0.003);
    store.checkpoint("evt_1", "tauri_receive");
    auto mid = store.get_trace("evt_1");
    expect_near(mid->total_latency, 0.003, 1e-12, "running latency tracks last checkpoint");

    clock.set(0.010);
    store.checkpoint("evt_1", "python_receive");
    auto done = store.complete_trace("evt_1");

    expect(done.completed, "completed");
    expect_near(done.total_latency, 0.010, 1e-12, "total = last - first");
    expect(done.checkpoints.size() == 3, "three checkpoints");
}

void test_complete_uses_completion_time() {
    infra::ManualClock clock(1.0);
    trace::TraceStore store(manual_config(clock));

    store.start_trace("e", "t");
    clock.set(1.5);
    store.checkpoint("e", "a");
    clock.set(2.0);
    auto t = store.complete_trace("e");
    expect_near(t.total_latency, 1.0, 1e-12, "finalized at completion call");

    clock.set(9.0);
    auto again = store.complete_trace("e");
    expect_near(again.total_latency, 1.0, 1e-12, "second completion keeps the first");
}

void test_complete_unknown_throws() {
    trace::TraceStore store;
    expect_throws<trace::TraceNotFound>([&]() { store.complete_trace("nope"); },
                                        "complete on unknown id");
    try {
        store.complete_trace("nope");
    } catch (const trace::TraceNotFound& e) {
        expect(e.event_id() == "nope", "exception carries id");
    }
}

void test_checkpoint_auto_create() {
    infra::ManualClock clock(3.0);
    trace::TraceStore store(manual_config(clock));

    store.checkpoint("ghost", "tauri_receive", {{"k", "v"}});
    auto t = store.get_trace("ghost");
    expect(t.has_value(), "auto-created");
    expect(t->event_type == "unknown", "auto-created type");
    expect(t->checkpoints.back().name == "tauri_receive", "checkpoint appended");
    expect(t->checkpoints.back().metadata.at("k") == "v", "metadata kept");
}

void test_checkpoint_strict_mode() {
    infra::ManualClock clock(3.0);
    trace::TraceStoreConfig cfg = manual_config(clock);
    cfg.auto_create_on_unknown_checkpoint = false;
    trace::TraceStore store(cfg);

    expect_throws<trace::TraceNotFound>([&]() { store.checkpoint("ghost", "x"); },
                                        "strict checkpoint on unknown id");
    expect(store.size() == 0, "nothing created");
}

void test_find_lost_events() {
    infra::ManualClock clock(0.0);
    trace::TraceStore store(manual_config(clock));

    store.start_trace("old_open", "t");
    store.start_trace("old_done", "t");
    store.complete_trace("old_done");
    clock.set(4.0);
    store.start_trace("young_open", "t");

    clock.set(6.0);
    auto lost = store.find_lost_events(5.0);
    expect(lost.size() == 1, "one lost event");
    expect(lost[0].event_id == "old_open", "old incomplete trace is lost");
    expect(store.size() == 3, "lost detection does not delete");
}

void test_snapshot_is_a_copy() {
    infra::ManualClock clock(0.0);
    trace::TraceStore store(manual_config(clock));
    store.start_trace("e", "t");

    auto snap = store.get_all_traces();
    store.checkpoint("e", "later");
    expect(snap[0].checkpoints.size() == 1, "snapshot unaffected by later writes");
    expect(store.get_trace("e")->checkpoints.size() == 2, "store updated");
}

void test_stats_and_clear() {
    infra::ManualClock clock(0.0);
    trace::TraceStore store(manual_config(clock, 7));
    store.start_trace("a", "t");
    store.start_trace("b", "t");
    store.complete_trace("a");

    auto s = store.stats();
    expect(s.total_traces == 2, "total");
    expect(s.completed_traces == 1, "completed");
    expect(s.max_traces == 7, "max");
    expect(s.approx_memory_bytes > 0, "memory estimate");

    store.clear();
    expect(store.size() == 0, "cleared");
    expect(store.get_all_traces().empty(), "no traces after clear");
}

void test_event_trace_helpers() {
    trace::EventTrace t;
    t.add_checkpoint("a", 1.0, {}, 1);
    t.add_checkpoint("b", 1.5, {}, 1);
    t.add_checkpoint("c", 2.5, {}, 1);

    expect_near(t.latency_between("a", "c"), 1.5, 1e-12, "a -> c");
    expect_throws<std::invalid_argument>([&]() { t.latency_between("c", "a"); }, "reversed order");
    expect_throws<std::invalid_argument>([&]() { t.latency_between("a", "zz"); }, "missing checkpoint");

    auto stages = t.stage_latencies();
    expect(stages.size() == 2, "two stages");
    expect(stages[0].first == "a -> b", "first stage name");
    expect_near(stages[1].second, 1.0, 1e-12, "second stage latency");
}

void test_concurrent_writers() {
    trace::TraceStore store;
    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w) {
        workers.emplace_back([&store, w]() {
            for (int i = 0; i < 250; ++i) {
                const std::string id = "w" + std::to_string(w) + "_" + std::to_string(i);
                store.start_trace(id, "load");
                store.checkpoint(id, "stage");
                store.complete_trace(id);
            }
        });
    }
    std::atomic<bool> done{false};
    std::atomic<bool> torn{false};
    std::thread reader([&]() {
        while (!done.load()) {
            for (const auto& t : store.get_all_traces())
                if (t.checkpoints.empty() || t.checkpoints.size() > 2) torn = true;
        }
    });
    for (auto& t : workers) t.join();
    done = true;
    reader.join();

    expect(!torn.load(), "snapshots never show a partial trace");

    auto s = store.stats();
    expect(s.total_traces == 1000, "all traces present");
    expect(s.completed_traces == 1000, "all completed");
}

} // namespace

int main() {
    run_test("distinct ids retrievable", test_distinct_ids_retrievable);
    run_test("eviction removes oldest", test_eviction_removes_oldest);
    run_test("evicted id can be reused", test_evicted_id_can_be_reused);
    run_test("start checkpoint and created_at", test_start_checkpoint_and_created_at);
    run_test("latency equals last minus first", test_latency_equals_last_minus_first);
    run_test("complete uses completion time", test_complete_uses_completion_time);
    run_test("complete unknown throws", test_complete_unknown_throws);
    run_test("checkpoint auto-create", test_checkpoint_auto_create);
    run_test("checkpoint strict mode", test_checkpoint_strict_mode);
    run_test("find lost events", test_find_lost_events);
    run_test("snapshot is a copy", test_snapshot_is_a_copy);
    run_test("stats and clear", test_stats_and_clear);
    run_test("event trace helpers", test_event_trace_helpers);
    run_test("concurrent writers", test_concurrent_writers);
    return finish("trace_store");
}
